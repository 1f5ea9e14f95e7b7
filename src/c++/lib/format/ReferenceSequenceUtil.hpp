//
// Convergraph - Amino Acid Substitution Co-occurrence Graph
// Copyright (c) 2026 The Convergraph Authors
//
// This program is free software: you can redistribute it and/or modify
// it under the terms of the GNU General Public License as published by
// the Free Software Foundation, either version 3 of the License, or
// at your option) any later version.
//
// This program is distributed in the hope that it will be useful,
// but WITHOUT ANY WARRANTY; without even the implied warranty of
// MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
// GNU General Public License for more details.
//
// You should have received a copy of the GNU General Public License
// along with this program.  If not, see <http://www.gnu.org/licenses/>.
//
//

/// \file
///

#pragma once

#include <string>

/// \brief parse the reference sequence from the contents of a reference file
///
/// The contents hold one sequence, as plain text or as a single FASTA record. FASTA deflines are skipped,
/// surrounding whitespace is removed from each line and the remaining lines are concatenated.
///
/// \param[in] sourceLabel name of the reference source used in error messages
void parseReferenceSequence(const std::string& contents, const std::string& sourceLabel, std::string& refSeq);

/// read the reference sequence from filename
void readReferenceSequence(const std::string& filename, std::string& refSeq);
