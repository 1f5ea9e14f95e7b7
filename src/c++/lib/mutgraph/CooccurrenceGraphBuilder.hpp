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

#include "mutgraph/CooccurrenceGraph.hpp"
#include "mutgraph/Substitution.hpp"

#include <string>

/// \brief accumulate substitution co-occurrence from each input sequence into a graph
///
/// Every substitution observed in a sequence is added as a node, and the edge count between every pair of
/// distinct substitutions in the same sequence is incremented once for that sequence.
///
struct CooccurrenceGraphBuilder {
  /// \param[in] reference the ancestral sequence, must outlive this object
  /// \param[in] variablePositions positions to scan for substitutions, must outlive this object
  /// \param[in] graph all nodes and edges are accumulated into this graph
  CooccurrenceGraphBuilder(
      const std::string& reference, const VariablePositionSet& variablePositions, CooccurrenceGraph& graph)
    : _reference(reference), _variablePositions(variablePositions), _graph(graph)
  {
  }

  /// extract substitutions from seq and add them to the graph
  void addSequence(const std::string& seq);

  /// add the substitutions found in a single sequence to the graph
  void addSubstitutions(const SubstitutionList& subs);

  /// number of sequences added so far
  unsigned sequenceCount() const { return _sequenceCount; }

private:
  const std::string&         _reference;
  const VariablePositionSet& _variablePositions;
  CooccurrenceGraph&         _graph;
  unsigned                   _sequenceCount = 0;

  // reused between sequences to limit allocations
  SubstitutionList           _subs;
  std::vector<NodeIndexType> _nodeIndices;
};
