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
/// \brief removal of weakly supported edges and isolated nodes from the co-occurrence graph
///

#pragma once

#include "mutgraph/CooccurrenceGraph.hpp"
#include "options/CooccurrenceGraphOptions.hpp"

/// \return true if an edge with count edgeCount meets both the minimum support and the minimum frequency
/// among sequenceCount input sequences
bool isEdgeRetained(const CooccurrenceGraphOptions& opt, const unsigned sequenceCount, const unsigned edgeCount);

/// \brief remove all edges which do not meet the minimum support or minimum frequency
///
/// Nodes are not removed, even if they have no remaining edges.
///
/// \param[in] sequenceCount total number of input sequences, used as the frequency denominator
/// \return number of undirected edges removed
unsigned pruneEdges(const CooccurrenceGraphOptions& opt, const unsigned sequenceCount, CooccurrenceGraph& graph);

/// \brief remove all nodes with no edges
///
/// \return number of nodes removed
unsigned pruneIsolatedNodes(CooccurrenceGraph& graph);
