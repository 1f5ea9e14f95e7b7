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
/// \brief write the co-occurrence graph in graphviz dot format
///

#pragma once

#include "mutgraph/CooccurrenceGraph.hpp"

#include <iosfwd>
#include <string>

/// \brief write an undirected co-occurrence graph in dot format
///
/// Each node is labeled with its substitution, eg. "D614G". Each edge carries its co-occurrence count both
/// as the edge label and as the weight attribute, which graph analysis tools such as Gephi import as the
/// edge weight. Nodes are numbered in ascending substitution order and edges are written in ascending node
/// order, so the output does not depend on the order in which the graph was built or pruned.
///
struct DotGraphWriter {
  explicit DotGraphWriter(std::ostream& os) : _os(os) {}

  void write(const CooccurrenceGraph& graph);

  /// escape a label for use as a quoted dot id
  static std::string quoteLabel(const std::string& label);

private:
  std::ostream& _os;
};
