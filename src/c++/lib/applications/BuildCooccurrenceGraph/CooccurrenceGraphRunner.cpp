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

#include "CooccurrenceGraphRunner.hpp"

#include "mutgraph/CooccurrenceGraphBuilder.hpp"
#include "mutgraph/CooccurrenceGraphPruner.hpp"

#include <iostream>

std::ostream& operator<<(std::ostream& os, const CooccurrenceGraphRunStats& stats)
{
  static const char sep('\t');

  os << "sequences" << sep << stats.sequenceCount << "\n";
  os << "alignmentLength" << sep << stats.alignmentLength << "\n";
  os << "variablePositions" << sep << stats.variablePositionCount << "\n";
  os << "builtNodes" << sep << stats.builtNodeCount << "\n";
  os << "builtEdges" << sep << stats.builtEdgeCount << "\n";
  os << "prunedEdges" << sep << stats.prunedEdgeCount << "\n";
  os << "prunedNodes" << sep << stats.prunedNodeCount << "\n";
  return os;
}

void CooccurrenceGraphRunner::run(
    const std::vector<std::string>& sequences, const std::string& reference, std::ostream* logOsPtr)
{
  _graph.clear();
  _stats = CooccurrenceGraphRunStats();

  // global conservation pass:
  std::vector<VariablePositionInfo> positionInfo;
  {
    const PositionCountTable counts(sequences);
    _stats.sequenceCount   = counts.sequenceCount();
    _stats.alignmentLength = counts.size();
    if (nullptr != logOsPtr) {
      *logOsPtr << "Data are " << _stats.sequenceCount << " x " << _stats.alignmentLength << "\n";
    }

    findVariablePositions(counts, _conservationOpt.conservationThreshold, _variablePositions, &positionInfo);
    _stats.variablePositionCount = _variablePositions.size();
  }

  if (nullptr != logOsPtr) {
    for (const VariablePositionInfo& info : positionInfo) {
      *logOsPtr << info << "\n";
    }
  }

  // per-sequence substitution pass:
  {
    CooccurrenceGraphBuilder builder(reference, _variablePositions, _graph);
    for (const std::string& seq : sequences) {
      builder.addSequence(seq);
    }
  }
  _stats.builtNodeCount = _graph.size();
  _stats.builtEdgeCount = _graph.edgeCount();

  // edge pruning must be complete before isolated nodes are identified:
  _stats.prunedEdgeCount = pruneEdges(_graphOpt, _stats.sequenceCount, _graph);
  _stats.prunedNodeCount = pruneIsolatedNodes(_graph);

  if (nullptr != logOsPtr) {
    *logOsPtr << _stats;
  }
}
