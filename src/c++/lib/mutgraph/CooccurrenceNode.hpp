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

#include "mutgraph/Substitution.hpp"

#include <iosfwd>
#include <limits>
#include <map>

/// \brief object to represent graph edges
///
/// The edge only holds the co-occurrence count, endpoint information is held by the nodes. Each undirected
/// edge is stored twice, once in each endpoint node, and both copies always carry the same count.
///
struct CooccurrenceEdge {
  unsigned getCount() const { return _count; }

  void addCount(const unsigned increment)
  {
    if ((getCount() + static_cast<unsigned long>(increment)) > maxCount()) {
      _count = maxCount();
    } else {
      _count += increment;
    }
  }

private:
  typedef unsigned count_t;

  static unsigned maxCount() { return std::numeric_limits<count_t>::max(); }

  count_t _count = 0;
};

std::ostream& operator<<(std::ostream& os, const CooccurrenceEdge& edge);

typedef unsigned NodeIndexType;

/// all edges of one node, keyed on the index of the remote node
typedef std::map<NodeIndexType, CooccurrenceEdge> CooccurrenceEdgesType;

/// \brief stores one substitution plus all edges connecting to it
///
struct CooccurrenceNode {
  typedef CooccurrenceEdgesType::const_iterator const_iterator;

  explicit CooccurrenceNode(const Substitution& initSubstitution) : _substitution(initSubstitution) {}

  const Substitution& getSubstitution() const { return _substitution; }

  /// return true if the node has no edges
  bool empty() const { return _edges.empty(); }

  /// total number of edges
  unsigned size() const { return _edges.size(); }

  const_iterator begin() const { return _edges.begin(); }

  const_iterator end() const { return _edges.end(); }

  /// Return true if an edge exists between this and the index node
  bool isEdge(const NodeIndexType index) const { return (_edges.find(index) != _edges.end()); }

  /// return edge from this to the index node
  const CooccurrenceEdge& getEdge(const NodeIndexType index) const
  {
    const_iterator i(_edges.find(index));
    if (i == _edges.end()) getEdgeException(index, "getEdge");
    return i->second;
  }

  /// add count to the edge between this and the index node, creating the edge if required
  void addEdgeCount(const NodeIndexType index, const unsigned count) { _edges[index].addCount(count); }

  /// Eliminate the edge between this and the index node
  void eraseEdge(const NodeIndexType index)
  {
    CooccurrenceEdgesType::iterator i(_edges.find(index));
    if (i == _edges.end()) getEdgeException(index, "eraseEdge");
    _edges.erase(i);
  }

  /// Unhook edge from one node index, and stick it to another
  void moveEdge(const NodeIndexType fromIndex, const NodeIndexType toIndex)
  {
    CooccurrenceEdgesType::iterator i(_edges.find(fromIndex));
    if (i == _edges.end()) getEdgeException(fromIndex, "moveEdge");
    const CooccurrenceEdge edge(i->second);
    _edges.erase(i);
    _edges[toIndex] = edge;
  }

  void clear() { _edges.clear(); }

private:
  void getEdgeException(const NodeIndexType toIndex, const char* label) const;

  Substitution          _substitution;
  CooccurrenceEdgesType _edges;
};

std::ostream& operator<<(std::ostream& os, const CooccurrenceNode& node);
