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
/// \brief per-position residue counts and conservation filtering over a set of aligned sequences
///

#pragma once

#include "mutgraph/AminoAcidAlphabet.hpp"
#include "mutgraph/MutGraphTypes.hpp"

#include <array>
#include <iosfwd>
#include <string>
#include <vector>

/// \brief residue bin counts for every alignment position
///
/// The table extends to the length of the longest sequence added. Shorter sequences only contribute counts
/// up to their own length.
///
struct PositionCountTable {
  typedef std::array<unsigned, AA_BIN::SIZE> bin_counts_t;

  PositionCountTable() = default;

  explicit PositionCountTable(const std::vector<std::string>& sequences)
  {
    for (const std::string& seq : sequences) {
      addSequence(seq);
    }
  }

  /// count every residue of seq into the bin for its position
  void addSequence(const std::string& seq);

  bool empty() const { return _counts.empty(); }

  /// number of alignment positions (the maximum sequence length observed)
  unsigned size() const { return _counts.size(); }

  /// number of sequences added
  unsigned sequenceCount() const { return _sequenceCount; }

  const bin_counts_t& getCounts(const AlignmentPosType pos) const;

  unsigned getCount(const AlignmentPosType pos, const unsigned bin) const { return getCounts(pos)[bin]; }

  /// sum of all bin counts at pos
  unsigned totalCount(const AlignmentPosType pos) const;

  /// find the bin with the strictly greatest count at pos
  ///
  /// ties are resolved to the lowest bin index
  ///
  /// \return false if no residue was counted at pos
  bool getMajorityBin(const AlignmentPosType pos, unsigned& maxBin, unsigned& maxCount) const;

private:
  std::vector<bin_counts_t> _counts;
  unsigned                  _sequenceCount = 0;
};

/// conservation summary of one variable position
struct VariablePositionInfo {
  AlignmentPosType pos            = 0;
  char             majoritySymbol = '?';
  double           majorityFreq   = 0;
  unsigned         totalCount     = 0;
};

std::ostream& operator<<(std::ostream& os, const VariablePositionInfo& info);

/// \brief find all positions which are not conserved
///
/// A position is variable when its majority residue frequency is strictly less than conservationThreshold.
/// Positions without any observed residue are neither conserved nor variable, and are skipped.
///
/// \param[out] variablePositions variable positions in ascending order
/// \param[out] positionInfo optional conservation summary for each variable position, in the same order
void findVariablePositions(
    const PositionCountTable&          counts,
    const double                       conservationThreshold,
    VariablePositionSet&               variablePositions,
    std::vector<VariablePositionInfo>* positionInfo = nullptr);
