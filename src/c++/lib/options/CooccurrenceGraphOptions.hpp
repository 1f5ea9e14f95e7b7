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

/// parameters used to classify alignment positions as conserved or variable
///
struct ConservationOptions {
  /// A position is variable when the frequency of its majority residue is below this value
  double conservationThreshold = 0.97;
};

/// parameters used to prune the substitution co-occurrence graph
///
struct CooccurrenceGraphOptions {
  /// Edges supported by fewer sequences than this are removed
  unsigned minCooccurrenceSupport = 4;

  /// Edges supported by a lower fraction of all input sequences than this are removed
  double minCooccurrenceFrequency = 0.10;
};
