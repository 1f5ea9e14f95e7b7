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

#include "format/DotGraphWriter.hpp"

#include <algorithm>
#include <iostream>
#include <utility>
#include <vector>

std::string DotGraphWriter::quoteLabel(const std::string& label)
{
  std::string quoted("\"");
  for (const char c : label) {
    if ((c == '"') || (c == '\\')) quoted += '\\';
    quoted += c;
  }
  quoted += '"';
  return quoted;
}

void DotGraphWriter::write(const CooccurrenceGraph& graph)
{
  static const char indent[] = "    ";

  // output order of graph node indices:
  const unsigned             nodeSize(graph.size());
  std::vector<NodeIndexType> nodeOrder(nodeSize);
  for (NodeIndexType nodeIndex(0); nodeIndex < nodeSize; ++nodeIndex) {
    nodeOrder[nodeIndex] = nodeIndex;
  }
  std::sort(nodeOrder.begin(), nodeOrder.end(), [&](const NodeIndexType a, const NodeIndexType b) {
    return (graph.getNode(a).getSubstitution() < graph.getNode(b).getSubstitution());
  });

  // output id of each graph node index:
  std::vector<unsigned> outputId(nodeSize);
  for (unsigned id(0); id < nodeSize; ++id) {
    outputId[nodeOrder[id]] = id;
  }

  _os << "graph {\n";
  for (unsigned id(0); id < nodeSize; ++id) {
    const CooccurrenceNode& node(graph.getNode(nodeOrder[id]));
    _os << indent << id << " [ label = " << quoteLabel(node.getSubstitution().label()) << " ]\n";
  }

  std::vector<std::pair<unsigned, unsigned>> remoteEdges;
  for (unsigned id(0); id < nodeSize; ++id) {
    const CooccurrenceNode& node(graph.getNode(nodeOrder[id]));

    remoteEdges.clear();
    for (const CooccurrenceEdgesType::value_type& edgeIter : node) {
      const unsigned remoteId(outputId[edgeIter.first]);
      if (remoteId < id) continue;
      remoteEdges.push_back(std::make_pair(remoteId, edgeIter.second.getCount()));
    }
    std::sort(remoteEdges.begin(), remoteEdges.end());

    for (const auto& edge : remoteEdges) {
      _os << indent << id << " -- " << edge.first << " [ label = \"" << edge.second
          << "\", weight = " << edge.second << " ]\n";
    }
  }
  _os << "}\n";
}
