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

#include "mutgraph/CooccurrenceGraphPruner.hpp"

#include <set>
#include <utility>
#include <vector>

bool isEdgeRetained(const CooccurrenceGraphOptions& opt, const unsigned sequenceCount, const unsigned edgeCount)
{
  if (edgeCount < opt.minCooccurrenceSupport) return false;
  if (0 == sequenceCount) return false;
  const double freq(static_cast<double>(edgeCount) / static_cast<double>(sequenceCount));
  return (freq >= opt.minCooccurrenceFrequency);
}

unsigned pruneEdges(const CooccurrenceGraphOptions& opt, const unsigned sequenceCount, CooccurrenceGraph& graph)
{
  std::vector<std::pair<NodeIndexType, NodeIndexType>> eraseEdges;

  const unsigned nodeSize(graph.size());
  for (NodeIndexType nodeIndex(0); nodeIndex < nodeSize; ++nodeIndex) {
    for (const CooccurrenceEdgesType::value_type& edgeIter : graph.getNode(nodeIndex)) {
      // each undirected edge is visited twice, only test it from the lower index:
      if (edgeIter.first < nodeIndex) continue;
      if (isEdgeRetained(opt, sequenceCount, edgeIter.second.getCount())) continue;
      eraseEdges.push_back(std::make_pair(nodeIndex, edgeIter.first));
    }
  }

  for (const auto& edge : eraseEdges) {
    graph.eraseEdgePair(edge.first, edge.second);
  }
  return eraseEdges.size();
}

unsigned pruneIsolatedNodes(CooccurrenceGraph& graph)
{
  std::set<NodeIndexType> emptyNodes;

  const unsigned nodeSize(graph.size());
  for (NodeIndexType nodeIndex(0); nodeIndex < nodeSize; ++nodeIndex) {
    if (graph.getNode(nodeIndex).empty()) emptyNodes.insert(nodeIndex);
  }

  graph.eraseNodes(emptyNodes);
  return emptyNodes.size();
}
