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

#include "mutgraph/CooccurrenceNode.hpp"

#include "boost/unordered_map.hpp"

#include <iosfwd>
#include <set>
#include <vector>

/// \brief undirected substitution co-occurrence graph
///
/// Each node represents one distinct substitution. The count of the edge between two nodes is the number of
/// input sequences in which both substitutions were observed. The graph is simple: self edges are never
/// created and each node pair has at most one edge.
///
/// The graph acts as a container of CooccurrenceNode objects. Nodes are addressed by index, but the index of
/// a node may change when another node is erased, so clients should look nodes up by substitution after any
/// erase operation.
///
struct CooccurrenceGraph {
  typedef std::vector<CooccurrenceNode> graph_type;

  typedef graph_type::const_iterator const_iterator;

  bool empty() const { return _graph.empty(); }

  /// total number of nodes
  unsigned size() const { return _graph.size(); }

  const_iterator begin() const { return _graph.begin(); }

  const_iterator end() const { return _graph.end(); }

  /// total number of undirected edges
  unsigned edgeCount() const
  {
    unsigned sum(0);
    for (const CooccurrenceNode& node : *this) {
      sum += node.size();
    }
    return (sum / 2);
  }

  /// sum of the counts of all undirected edges
  unsigned long totalEdgeCount() const;

  const CooccurrenceNode& getNode(const NodeIndexType nodeIndex) const;

  /// Add a node for sub, if the node already exists this has no effect
  ///
  /// \return index of the node representing sub
  NodeIndexType addNode(const Substitution& sub);

  /// \return true if a node for sub exists, and provide its index
  bool findNode(const Substitution& sub, NodeIndexType& nodeIndex) const;

  bool isNode(const Substitution& sub) const
  {
    NodeIndexType nodeIndex(0);
    return findNode(sub, nodeIndex);
  }

  /// add count to the undirected edge between two different nodes, creating the edge if required
  void addEdgeCount(const NodeIndexType index1, const NodeIndexType index2, const unsigned count = 1);

  /// \return count of the edge between the nodes for sub1 and sub2, or zero if there is no such edge
  unsigned getEdgeCount(const Substitution& sub1, const Substitution& sub2) const;

  /// erase the undirected edge between two nodes
  void eraseEdgePair(const NodeIndexType index1, const NodeIndexType index2)
  {
    getMutableNode(index1).eraseEdge(index2);
    getMutableNode(index2).eraseEdge(index1);
  }

  /// \brief Remove node \p nodeIndex and all of its edges
  ///
  /// The last node in the graph is moved into the erased node's index
  void eraseNode(const NodeIndexType nodeIndex);

  /// remove a set of nodes
  void eraseNodes(const std::set<NodeIndexType>& nodes);

  /// \brief merge all nodes and edges from \p fromGraph into this graph
  ///
  /// Node sets are combined and the counts of edges found in both graphs are summed, so that two graphs built
  /// from disjoint sequence subsets merge into the graph built from all sequences.
  void merge(const CooccurrenceGraph& fromGraph);

  /// Assert that internal data-structures are in a consistent state
  ///
  /// Every edge has a return edge with the same count, there are no self edges, and the substitution
  /// lookup matches the node vector.
  void checkState() const;

  void clear()
  {
    _graph.clear();
    _nodeIndex.clear();
  }

  /// write summary statistics for the graph in tsv format
  void dumpStats(std::ostream& os) const;

private:
  CooccurrenceNode& getMutableNode(const NodeIndexType nodeIndex);

  void nodeHurl(const NodeIndexType nodeIndex) const;

  graph_type                                        _graph;
  boost::unordered_map<Substitution, NodeIndexType> _nodeIndex;
};

std::ostream& operator<<(std::ostream& os, const CooccurrenceGraph& graph);
