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

#include "mutgraph/CooccurrenceGraphBuilder.hpp"

#include <algorithm>

void CooccurrenceGraphBuilder::addSequence(const std::string& seq)
{
  extractSubstitutions(seq, _reference, _variablePositions, _subs);
  addSubstitutions(_subs);
}

void CooccurrenceGraphBuilder::addSubstitutions(const SubstitutionList& subs)
{
  _sequenceCount++;

  _nodeIndices.clear();
  for (const Substitution& sub : subs) {
    _nodeIndices.push_back(_graph.addNode(sub));
  }

  // a substitution repeated within one sequence still only counts once for that sequence:
  std::sort(_nodeIndices.begin(), _nodeIndices.end());
  _nodeIndices.erase(std::unique(_nodeIndices.begin(), _nodeIndices.end()), _nodeIndices.end());

  const unsigned nodeCount(_nodeIndices.size());
  for (unsigned i(0); i < nodeCount; ++i) {
    for (unsigned j(i + 1); j < nodeCount; ++j) {
      _graph.addEdgeCount(_nodeIndices[i], _nodeIndices[j]);
    }
  }
}
