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

#include "boost/test/unit_test.hpp"

#include "common/Exceptions.hpp"
#include "mutgraph/CooccurrenceGraph.hpp"

#include <set>
#include <sstream>

BOOST_AUTO_TEST_SUITE(test_CooccurrenceGraph)

using namespace convergraph::common;

BOOST_AUTO_TEST_CASE(test_CooccurrenceGraphAddNode)
{
  CooccurrenceGraph graph;
  BOOST_REQUIRE(graph.empty());

  const NodeIndexType index1(graph.addNode(Substitution(2, 'D', 'E')));
  const NodeIndexType index2(graph.addNode(Substitution(4, 'K', 'R')));
  BOOST_REQUIRE_EQUAL(index1, 0u);
  BOOST_REQUIRE_EQUAL(index2, 1u);

  // adding an existing substitution returns the original node:
  BOOST_REQUIRE_EQUAL(graph.addNode(Substitution(2, 'D', 'E')), index1);
  BOOST_REQUIRE_EQUAL(graph.size(), 2u);

  NodeIndexType foundIndex(0);
  BOOST_REQUIRE(graph.findNode(Substitution(4, 'K', 'R'), foundIndex));
  BOOST_REQUIRE_EQUAL(foundIndex, index2);
  BOOST_REQUIRE(!graph.isNode(Substitution(4, 'K', 'Q')));

  BOOST_REQUIRE_THROW(graph.getNode(2), GeneralException);
  graph.checkState();
}

BOOST_AUTO_TEST_CASE(test_CooccurrenceGraphEdges)
{
  const Substitution sub1(2, 'D', 'E');
  const Substitution sub2(4, 'K', 'R');
  const Substitution sub3(9, 'P', 'H');

  CooccurrenceGraph   graph;
  const NodeIndexType index1(graph.addNode(sub1));
  const NodeIndexType index2(graph.addNode(sub2));
  graph.addNode(sub3);

  graph.addEdgeCount(index1, index2);
  graph.addEdgeCount(index2, index1, 3);

  // edges are symmetric:
  BOOST_REQUIRE_EQUAL(graph.getEdgeCount(sub1, sub2), 4u);
  BOOST_REQUIRE_EQUAL(graph.getEdgeCount(sub2, sub1), 4u);
  BOOST_REQUIRE_EQUAL(graph.getEdgeCount(sub1, sub3), 0u);
  BOOST_REQUIRE_EQUAL(graph.getEdgeCount(sub1, Substitution(7, 'A', 'A')), 0u);
  BOOST_REQUIRE_EQUAL(graph.edgeCount(), 1u);
  BOOST_REQUIRE_EQUAL(graph.totalEdgeCount(), 4u);

  BOOST_REQUIRE_THROW(graph.addEdgeCount(index1, index1), GeneralException);
  BOOST_REQUIRE_THROW(graph.getNode(index1).getEdge(2), GeneralException);
  graph.checkState();

  graph.eraseEdgePair(index2, index1);
  BOOST_REQUIRE_EQUAL(graph.edgeCount(), 0u);
  BOOST_REQUIRE_EQUAL(graph.size(), 3u);
  BOOST_REQUIRE_THROW(graph.eraseEdgePair(index2, index1), GeneralException);
  graph.checkState();
}

BOOST_AUTO_TEST_CASE(test_CooccurrenceGraphEraseNode)
{
  const Substitution sub1(2, 'D', 'E');
  const Substitution sub2(4, 'K', 'R');
  const Substitution sub3(9, 'P', 'H');
  const Substitution sub4(11, 'S', 'T');

  CooccurrenceGraph graph;
  graph.addNode(sub1);
  graph.addNode(sub2);
  graph.addNode(sub3);
  graph.addNode(sub4);
  graph.addEdgeCount(0, 1, 5);
  graph.addEdgeCount(0, 3, 2);
  graph.addEdgeCount(1, 3, 7);

  // the last node is moved into the erased node's slot, edges must follow it:
  graph.eraseNode(1);
  graph.checkState();

  BOOST_REQUIRE_EQUAL(graph.size(), 3u);
  BOOST_REQUIRE(!graph.isNode(sub2));
  NodeIndexType index4(0);
  BOOST_REQUIRE(graph.findNode(sub4, index4));
  BOOST_REQUIRE_EQUAL(index4, 1u);
  BOOST_REQUIRE_EQUAL(graph.getEdgeCount(sub1, sub4), 2u);
  BOOST_REQUIRE_EQUAL(graph.getEdgeCount(sub1, sub2), 0u);
  BOOST_REQUIRE_EQUAL(graph.edgeCount(), 1u);

  // erase the last node:
  graph.eraseNode(2);
  graph.checkState();
  BOOST_REQUIRE(!graph.isNode(sub3));
  BOOST_REQUIRE_EQUAL(graph.getEdgeCount(sub1, sub4), 2u);
}

BOOST_AUTO_TEST_CASE(test_CooccurrenceGraphEraseNodes)
{
  CooccurrenceGraph graph;
  for (unsigned pos(0); pos < 5; ++pos) {
    graph.addNode(Substitution(pos, 'A', 'G'));
  }
  graph.addEdgeCount(1, 3);
  graph.addEdgeCount(3, 4);

  std::set<NodeIndexType> nodes = {0, 2, 4};
  graph.eraseNodes(nodes);
  graph.checkState();

  BOOST_REQUIRE_EQUAL(graph.size(), 2u);
  BOOST_REQUIRE(graph.isNode(Substitution(1, 'A', 'G')));
  BOOST_REQUIRE(graph.isNode(Substitution(3, 'A', 'G')));
  BOOST_REQUIRE_EQUAL(graph.getEdgeCount(Substitution(1, 'A', 'G'), Substitution(3, 'A', 'G')), 1u);

  nodes = {0, 1};
  graph.eraseNodes(nodes);
  BOOST_REQUIRE(graph.empty());
  graph.checkState();
}

BOOST_AUTO_TEST_CASE(test_CooccurrenceGraphMerge)
{
  const Substitution sub1(2, 'D', 'E');
  const Substitution sub2(4, 'K', 'R');
  const Substitution sub3(9, 'P', 'H');

  CooccurrenceGraph graph1;
  graph1.addNode(sub1);
  graph1.addNode(sub2);
  graph1.addEdgeCount(0, 1, 2);

  // same substitutions in a different node order:
  CooccurrenceGraph graph2;
  graph2.addNode(sub3);
  graph2.addNode(sub2);
  graph2.addNode(sub1);
  graph2.addEdgeCount(1, 2, 3);
  graph2.addEdgeCount(0, 2, 1);

  graph1.merge(graph2);
  graph1.checkState();

  BOOST_REQUIRE_EQUAL(graph1.size(), 3u);
  BOOST_REQUIRE_EQUAL(graph1.getEdgeCount(sub1, sub2), 5u);
  BOOST_REQUIRE_EQUAL(graph1.getEdgeCount(sub1, sub3), 1u);
  BOOST_REQUIRE_EQUAL(graph1.getEdgeCount(sub2, sub3), 0u);

  BOOST_REQUIRE_THROW(graph1.merge(graph1), GeneralException);
}

BOOST_AUTO_TEST_CASE(test_CooccurrenceGraphDumpStats)
{
  CooccurrenceGraph graph;
  graph.addNode(Substitution(2, 'D', 'E'));
  graph.addNode(Substitution(4, 'K', 'R'));
  graph.addNode(Substitution(9, 'P', 'H'));
  graph.addEdgeCount(0, 1, 6);

  std::ostringstream oss;
  graph.dumpStats(oss);
  BOOST_REQUIRE_EQUAL(
      oss.str(),
      "nodes\t3\n"
      "edges\t1\n"
      "isolatedNodes\t1\n"
      "maxNodeDegree\t1\n"
      "maxEdgeCount\t6\n"
      "totalEdgeCount\t6\n");
}

BOOST_AUTO_TEST_SUITE_END()
