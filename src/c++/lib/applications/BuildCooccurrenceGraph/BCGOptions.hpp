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

#include "common/Program.hpp"
#include "options/CooccurrenceGraphOptions.hpp"

#include <string>

struct BCGOptions {
  ConservationOptions      conservationOpt;
  CooccurrenceGraphOptions graphOpt;

  std::string referenceFilename;
  std::string inputFilename;
  std::string outputFilename;

  /// true if the first line of the record input is a header
  bool isHeader = false;
};

void parseBCGOptions(const convergraph::Program& prog, int argc, char* argv[], BCGOptions& opt);
