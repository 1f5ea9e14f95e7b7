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
#include "mutgraph/ConservationAnalyzer.hpp"

#include <sstream>
#include <string>
#include <vector>

BOOST_AUTO_TEST_SUITE(test_ConservationAnalyzer)

BOOST_AUTO_TEST_CASE(test_PositionCountTotals)
{
  // the total at each position is the number of sequences covering that position:
  const std::vector<std::string> sequences = {"MADE", "MA", "MAD", ""};
  const PositionCountTable       counts(sequences);

  BOOST_REQUIRE_EQUAL(counts.size(), 4u);
  BOOST_REQUIRE_EQUAL(counts.sequenceCount(), 4u);
  BOOST_REQUIRE_EQUAL(counts.totalCount(0), 3u);
  BOOST_REQUIRE_EQUAL(counts.totalCount(1), 3u);
  BOOST_REQUIRE_EQUAL(counts.totalCount(2), 2u);
  BOOST_REQUIRE_EQUAL(counts.totalCount(3), 1u);
  BOOST_REQUIRE_EQUAL(counts.getCount(2, symbol_to_bin('D')), 2u);

  BOOST_REQUIRE_THROW(counts.getCounts(4), convergraph::common::GeneralException);
}

BOOST_AUTO_TEST_CASE(test_PositionCountCaseFolding)
{
  const std::vector<std::string> sequences = {"m-*", "M-?"};
  const PositionCountTable       counts(sequences);

  BOOST_REQUIRE_EQUAL(counts.getCount(0, symbol_to_bin('M')), 2u);
  BOOST_REQUIRE_EQUAL(counts.getCount(1, AA_BIN::GAP), 2u);
  BOOST_REQUIRE_EQUAL(counts.getCount(2, AA_BIN::STOP), 1u);
  BOOST_REQUIRE_EQUAL(counts.getCount(2, AA_BIN::OTHER), 1u);
}

BOOST_AUTO_TEST_CASE(test_MajorityBinTieBreak)
{
  // equal counts resolve to the first bin in bin order:
  const std::vector<std::string> sequences = {"E", "D", "E", "D"};
  const PositionCountTable       counts(sequences);

  unsigned maxBin(0);
  unsigned maxCount(0);
  BOOST_REQUIRE(counts.getMajorityBin(0, maxBin, maxCount));
  BOOST_REQUIRE_EQUAL(bin_to_symbol(maxBin), 'D');
  BOOST_REQUIRE_EQUAL(maxCount, 2u);

  const std::vector<std::string> gapTie = {"-", "Y"};
  const PositionCountTable       gapCounts(gapTie);
  BOOST_REQUIRE(gapCounts.getMajorityBin(0, maxBin, maxCount));
  BOOST_REQUIRE_EQUAL(bin_to_symbol(maxBin), 'Y');
}

BOOST_AUTO_TEST_CASE(test_FindVariablePositions)
{
  const std::vector<std::string> sequences = {"MAD", "MAE", "MAE", "MAD"};
  const PositionCountTable       counts(sequences);

  VariablePositionSet               variablePositions;
  std::vector<VariablePositionInfo> positionInfo;
  findVariablePositions(counts, 0.97, variablePositions, &positionInfo);

  BOOST_REQUIRE_EQUAL(variablePositions.size(), 1u);
  BOOST_REQUIRE_EQUAL(variablePositions[0], 2u);
  BOOST_REQUIRE_EQUAL(positionInfo.size(), 1u);
  BOOST_REQUIRE_EQUAL(positionInfo[0].pos, 2u);
  BOOST_REQUIRE_EQUAL(positionInfo[0].majoritySymbol, 'D');
  BOOST_REQUIRE_CLOSE(positionInfo[0].majorityFreq, 0.5, 0.0001);
  BOOST_REQUIRE_EQUAL(positionInfo[0].totalCount, 4u);

  std::ostringstream oss;
  oss << positionInfo[0];
  BOOST_REQUIRE_EQUAL(oss.str(), std::string("0003 / D: 0.5000 (4)"));
}

BOOST_AUTO_TEST_CASE(test_FindVariablePositionsAscending)
{
  const std::vector<std::string> sequences = {"KAKAK", "MAMAM"};
  const PositionCountTable       counts(sequences);

  VariablePositionSet variablePositions;
  findVariablePositions(counts, 0.97, variablePositions);

  const VariablePositionSet expected = {0, 2, 4};
  BOOST_REQUIRE_EQUAL_COLLECTIONS(
      variablePositions.begin(), variablePositions.end(), expected.begin(), expected.end());
}

BOOST_AUTO_TEST_CASE(test_ConservationThresholdBoundary)
{
  // 97 of 100 sequences share the majority residue:
  std::vector<std::string> sequences(97, "A");
  sequences.resize(100, "G");
  {
    const PositionCountTable counts(sequences);
    VariablePositionSet      variablePositions;

    // a frequency equal to the threshold is conserved:
    findVariablePositions(counts, 0.97, variablePositions);
    BOOST_REQUIRE(variablePositions.empty());

    findVariablePositions(counts, 0.98, variablePositions);
    BOOST_REQUIRE_EQUAL(variablePositions.size(), 1u);
  }

  // a fully conserved position is never variable, even at the maximum threshold:
  {
    const std::vector<std::string> sameSequences(10, "A");
    const PositionCountTable       counts(sameSequences);
    VariablePositionSet            variablePositions;
    findVariablePositions(counts, 1.0, variablePositions);
    BOOST_REQUIRE(variablePositions.empty());
  }
}

BOOST_AUTO_TEST_CASE(test_FindVariablePositionsNoSequences)
{
  PositionCountTable counts;
  BOOST_REQUIRE(counts.empty());

  VariablePositionSet variablePositions(1, 7);
  findVariablePositions(counts, 0.97, variablePositions);
  BOOST_REQUIRE(variablePositions.empty());
}

BOOST_AUTO_TEST_SUITE_END()
