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

#include "mutgraph/CooccurrenceGraph.hpp"

#include "common/Exceptions.hpp"

#include "boost/foreach.hpp"

#include <algorithm>
#include <iostream>
#include <sstream>

void CooccurrenceGraph::nodeHurl(const NodeIndexType nodeIndex) const
{
  using namespace convergraph::common;

  std::ostringstream oss;
  oss << "Attempting to access node: " << nodeIndex << " in graph with size: " << size();
  BOOST_THROW_EXCEPTION(GeneralException(oss.str()));
}

const CooccurrenceNode& CooccurrenceGraph::getNode(const NodeIndexType nodeIndex) const
{
  if (nodeIndex >= _graph.size()) nodeHurl(nodeIndex);
  return _graph[nodeIndex];
}

CooccurrenceNode& CooccurrenceGraph::getMutableNode(const NodeIndexType nodeIndex)
{
  if (nodeIndex >= _graph.size()) nodeHurl(nodeIndex);
  return _graph[nodeIndex];
}

unsigned long CooccurrenceGraph::totalEdgeCount() const
{
  unsigned long sum(0);
  const unsigned nodeSize(size());
  for (NodeIndexType nodeIndex(0); nodeIndex < nodeSize; ++nodeIndex) {
    for (const CooccurrenceEdgesType::value_type& edgeIter : getNode(nodeIndex)) {
      if (edgeIter.first < nodeIndex) continue;
      sum += edgeIter.second.getCount();
    }
  }
  return sum;
}

NodeIndexType CooccurrenceGraph::addNode(const Substitution& sub)
{
  NodeIndexType nodeIndex(0);
  if (findNode(sub, nodeIndex)) return nodeIndex;

  nodeIndex = _graph.size();
  _graph.emplace_back(sub);
  _nodeIndex.insert(std::make_pair(sub, nodeIndex));
  return nodeIndex;
}

bool CooccurrenceGraph::findNode(const Substitution& sub, NodeIndexType& nodeIndex) const
{
  const auto iter(_nodeIndex.find(sub));
  if (iter == _nodeIndex.end()) return false;
  nodeIndex = iter->second;
  return true;
}

void CooccurrenceGraph::addEdgeCount(const NodeIndexType index1, const NodeIndexType index2, const unsigned count)
{
  using namespace convergraph::common;

  if (index1 == index2) {
    std::ostringstream oss;
    oss << "Attempting to add self edge to node: " << getNode(index1);
    BOOST_THROW_EXCEPTION(GeneralException(oss.str()));
  }

  getMutableNode(index1).addEdgeCount(index2, count);
  getMutableNode(index2).addEdgeCount(index1, count);
}

unsigned CooccurrenceGraph::getEdgeCount(const Substitution& sub1, const Substitution& sub2) const
{
  NodeIndexType index1(0);
  NodeIndexType index2(0);
  if (!(findNode(sub1, index1) && findNode(sub2, index2))) return 0;
  const CooccurrenceNode& node1(getNode(index1));
  if (!node1.isEdge(index2)) return 0;
  return node1.getEdge(index2).getCount();
}

void CooccurrenceGraph::eraseNode(const NodeIndexType nodeIndex)
{
  CooccurrenceNode& node(getMutableNode(nodeIndex));

  // clear return edges on all remote nodes:
  for (const CooccurrenceEdgesType::value_type& edgeIter : node) {
    getMutableNode(edgeIter.first).eraseEdge(nodeIndex);
  }
  node.clear();
  _nodeIndex.erase(node.getSubstitution());

  const NodeIndexType fromIndex(_graph.size() - 1);

  // If the erased node is not the last indexed position in the node vector, then take the last indexed
  // node and move it to the erased node's current position.
  if (fromIndex != nodeIndex) {
    const CooccurrenceNode& fromNode(getNode(fromIndex));
    for (const CooccurrenceEdgesType::value_type& edgeIter : fromNode) {
      getMutableNode(edgeIter.first).moveEdge(fromIndex, nodeIndex);
    }
    _nodeIndex[fromNode.getSubstitution()] = nodeIndex;
    _graph[nodeIndex]                      = fromNode;
  }
  _graph.pop_back();
}

void CooccurrenceGraph::eraseNodes(const std::set<NodeIndexType>& nodes)
{
  if (nodes.empty()) return;

  if (size() == nodes.size()) {
    // if the whole graph is being erased, this is more efficient:
    clear();
    return;
  }

  // partial deletion must be done in descending order:
  BOOST_REVERSE_FOREACH(const NodeIndexType nodeIndex, nodes) { eraseNode(nodeIndex); }
}

void CooccurrenceGraph::merge(const CooccurrenceGraph& fromGraph)
{
  if (&fromGraph == this) {
    using namespace convergraph::common;
    BOOST_THROW_EXCEPTION(GeneralException("Attempting to merge co-occurrence graph into itself"));
  }

  // map each fromGraph node index into this graph:
  std::vector<NodeIndexType> indexMap;
  indexMap.reserve(fromGraph.size());
  for (const CooccurrenceNode& fromNode : fromGraph) {
    indexMap.push_back(addNode(fromNode.getSubstitution()));
  }

  const unsigned fromSize(fromGraph.size());
  for (NodeIndexType fromIndex(0); fromIndex < fromSize; ++fromIndex) {
    for (const CooccurrenceEdgesType::value_type& edgeIter : fromGraph.getNode(fromIndex)) {
      // each undirected edge is visited twice, only merge it from the lower index:
      if (edgeIter.first < fromIndex) continue;
      addEdgeCount(indexMap[fromIndex], indexMap[edgeIter.first], edgeIter.second.getCount());
    }
  }
}

void CooccurrenceGraph::checkState() const
{
  using namespace convergraph::common;

  if (_nodeIndex.size() != _graph.size()) {
    std::ostringstream oss;
    oss << "Substitution index size: " << _nodeIndex.size() << " does not match graph size: " << size();
    BOOST_THROW_EXCEPTION(GeneralException(oss.str()));
  }

  const unsigned nodeSize(size());
  for (NodeIndexType nodeIndex(0); nodeIndex < nodeSize; ++nodeIndex) {
    const CooccurrenceNode& node(getNode(nodeIndex));

    NodeIndexType lookupIndex(0);
    if ((!findNode(node.getSubstitution(), lookupIndex)) || (lookupIndex != nodeIndex)) {
      std::ostringstream oss;
      oss << "Substitution index is inconsistent for node: " << nodeIndex << " " << node;
      BOOST_THROW_EXCEPTION(GeneralException(oss.str()));
    }

    for (const CooccurrenceEdgesType::value_type& edgeIter : node) {
      if (edgeIter.first == nodeIndex) {
        std::ostringstream oss;
        oss << "Self edge found on node: " << nodeIndex << " " << node;
        BOOST_THROW_EXCEPTION(GeneralException(oss.str()));
      }

      // check that every edge has a return edge with the same count:
      const CooccurrenceNode& remoteNode(getNode(edgeIter.first));
      if ((!remoteNode.isEdge(nodeIndex)) ||
          (remoteNode.getEdge(nodeIndex).getCount() != edgeIter.second.getCount())) {
        std::ostringstream oss;
        oss << "No matching return edge on remote node.\n"
            << "\tlocal_node: " << node << "\tremote_node: " << remoteNode;
        BOOST_THROW_EXCEPTION(GeneralException(oss.str()));
      }
    }
  }
}

void CooccurrenceGraph::dumpStats(std::ostream& os) const
{
  static const char sep('\t');

  unsigned isolatedNodes(0);
  unsigned maxDegree(0);
  unsigned maxEdgeCount(0);
  for (const CooccurrenceNode& node : *this) {
    if (node.empty()) isolatedNodes++;
    maxDegree = std::max(maxDegree, node.size());
    for (const CooccurrenceEdgesType::value_type& edgeIter : node) {
      maxEdgeCount = std::max(maxEdgeCount, edgeIter.second.getCount());
    }
  }

  os << "nodes" << sep << size() << "\n";
  os << "edges" << sep << edgeCount() << "\n";
  os << "isolatedNodes" << sep << isolatedNodes << "\n";
  os << "maxNodeDegree" << sep << maxDegree << "\n";
  os << "maxEdgeCount" << sep << maxEdgeCount << "\n";
  os << "totalEdgeCount" << sep << totalEdgeCount() << "\n";
}

std::ostream& operator<<(std::ostream& os, const CooccurrenceGraph& graph)
{
  os << "GRAPH BEGIN\n";
  const unsigned nodeCount(graph.size());
  for (NodeIndexType nodeIndex(0); nodeIndex < nodeCount; ++nodeIndex) {
    os << "NodeIndex: " << nodeIndex << " " << graph.getNode(nodeIndex);
  }
  os << "GRAPH END\n";
  return os;
}
