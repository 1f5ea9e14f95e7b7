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

#include "mutgraph/ConservationAnalyzer.hpp"
#include "mutgraph/CooccurrenceGraph.hpp"
#include "options/CooccurrenceGraphOptions.hpp"

#include <iosfwd>
#include <string>
#include <vector>

/// counts reported for each stage of graph construction
struct CooccurrenceGraphRunStats {
  unsigned sequenceCount         = 0;
  unsigned alignmentLength       = 0;
  unsigned variablePositionCount = 0;
  unsigned builtNodeCount        = 0;
  unsigned builtEdgeCount        = 0;
  unsigned prunedEdgeCount       = 0;
  unsigned prunedNodeCount       = 0;
};

std::ostream& operator<<(std::ostream& os, const CooccurrenceGraphRunStats& stats);

/// \brief run all stages of co-occurrence graph construction over an in-memory sequence set
///
/// Conservation analysis over all sequences is completed before any substitution is extracted. The graph is
/// then built from every sequence, pruned of weakly supported edges, and finally pruned of isolated nodes.
///
struct CooccurrenceGraphRunner {
  CooccurrenceGraphRunner(const ConservationOptions& conservationOpt, const CooccurrenceGraphOptions& graphOpt)
    : _conservationOpt(conservationOpt), _graphOpt(graphOpt)
  {
  }

  /// \param[in] logOsPtr if non-null, write per-position conservation diagnostics and stage summaries here
  void run(
      const std::vector<std::string>& sequences, const std::string& reference, std::ostream* logOsPtr = nullptr);

  const CooccurrenceGraph& getGraph() const { return _graph; }

  const VariablePositionSet& getVariablePositions() const { return _variablePositions; }

  const CooccurrenceGraphRunStats& getStats() const { return _stats; }

private:
  const ConservationOptions      _conservationOpt;
  const CooccurrenceGraphOptions _graphOpt;

  VariablePositionSet       _variablePositions;
  CooccurrenceGraph         _graph;
  CooccurrenceGraphRunStats _stats;
};
