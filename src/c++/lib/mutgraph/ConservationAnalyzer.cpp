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

#include "mutgraph/ConservationAnalyzer.hpp"

#include "common/Exceptions.hpp"

#include <iomanip>
#include <iostream>
#include <numeric>
#include <sstream>

void PositionCountTable::addSequence(const std::string& seq)
{
  if (seq.size() > _counts.size()) {
    bin_counts_t zero;
    zero.fill(0);
    _counts.resize(seq.size(), zero);
  }

  const unsigned seqSize(seq.size());
  for (unsigned pos(0); pos < seqSize; ++pos) {
    _counts[pos][symbol_to_bin(seq[pos])]++;
  }
  _sequenceCount++;
}

const PositionCountTable::bin_counts_t& PositionCountTable::getCounts(const AlignmentPosType pos) const
{
  if (pos >= _counts.size()) {
    using namespace convergraph::common;
    std::ostringstream oss;
    oss << "Attempting to access count table position: " << pos << " in table with size: " << size();
    BOOST_THROW_EXCEPTION(GeneralException(oss.str()));
  }
  return _counts[pos];
}

unsigned PositionCountTable::totalCount(const AlignmentPosType pos) const
{
  const bin_counts_t& counts(getCounts(pos));
  return std::accumulate(counts.begin(), counts.end(), 0u);
}

bool PositionCountTable::getMajorityBin(const AlignmentPosType pos, unsigned& maxBin, unsigned& maxCount) const
{
  const bin_counts_t& counts(getCounts(pos));

  bool isFound(false);
  maxBin   = 0;
  maxCount = 0;
  for (unsigned bin(0); bin < AA_BIN::SIZE; ++bin) {
    if (counts[bin] > maxCount) {
      maxCount = counts[bin];
      maxBin   = bin;
      isFound  = true;
    }
  }
  return isFound;
}

std::ostream& operator<<(std::ostream& os, const VariablePositionInfo& info)
{
  std::ostringstream oss;
  oss << std::setfill('0') << std::setw(4) << (info.pos + 1) << " / " << info.majoritySymbol << ": "
      << std::fixed << std::setprecision(4) << info.majorityFreq << " (" << info.totalCount << ")";
  os << oss.str();
  return os;
}

void findVariablePositions(
    const PositionCountTable&          counts,
    const double                       conservationThreshold,
    VariablePositionSet&               variablePositions,
    std::vector<VariablePositionInfo>* positionInfo)
{
  variablePositions.clear();
  if (nullptr != positionInfo) positionInfo->clear();

  const unsigned posCount(counts.size());
  for (AlignmentPosType pos(0); pos < posCount; ++pos) {
    unsigned maxBin(0);
    unsigned maxCount(0);
    if (!counts.getMajorityBin(pos, maxBin, maxCount)) continue;

    const unsigned total(counts.totalCount(pos));
    const double   freq(static_cast<double>(maxCount) / static_cast<double>(total));
    if (freq >= conservationThreshold) continue;

    variablePositions.push_back(pos);
    if (nullptr != positionInfo) {
      VariablePositionInfo info;
      info.pos            = pos;
      info.majoritySymbol = bin_to_symbol(maxBin);
      info.majorityFreq   = freq;
      info.totalCount     = total;
      positionInfo->push_back(info);
    }
  }
}
