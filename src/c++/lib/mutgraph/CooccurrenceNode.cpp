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

#include "mutgraph/CooccurrenceNode.hpp"

#include "common/Exceptions.hpp"

#include <iostream>
#include <sstream>

std::ostream& operator<<(std::ostream& os, const CooccurrenceEdge& edge)
{
  os << "EdgeCount: " << edge.getCount() << "\n";
  return os;
}

void CooccurrenceNode::getEdgeException(const NodeIndexType toIndex, const char* label) const
{
  using namespace convergraph::common;

  std::ostringstream oss;
  oss << "CooccurrenceNode::" << label << "() no edge exists\n";
  oss << "\tfrom_node: " << *this;
  oss << "\tto_node_index: " << toIndex << "\n";
  BOOST_THROW_EXCEPTION(GeneralException(oss.str()));
}

std::ostream& operator<<(std::ostream& os, const CooccurrenceNode& node)
{
  os << "CooccurrenceNode: " << node.getSubstitution() << " n_edges: " << node.size() << "\n";
  for (const CooccurrenceEdgesType::value_type& edgeIter : node) {
    os << "\tEdgeTo: " << edgeIter.first << " count: " << edgeIter.second.getCount() << "\n";
  }
  return os;
}
