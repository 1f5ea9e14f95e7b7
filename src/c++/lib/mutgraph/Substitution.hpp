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
/// \brief amino acid substitution value type, used as the co-occurrence graph node key
///

#pragma once

#include "mutgraph/MutGraphTypes.hpp"

#include "boost/functional/hash.hpp"

#include <cstddef>
#include <iosfwd>
#include <string>
#include <vector>

/// \brief an observed residue difference between one sequence and the reference
///
/// Identity is structural: two substitutions are equal iff position, ancestral and derived residues all
/// match. Ordering is by position, then ancestral residue, then derived residue.
///
struct Substitution {
  Substitution(const AlignmentPosType initPos, const char initAncestral, const char initDerived)
    : pos(initPos), ancestral(initAncestral), derived(initDerived)
  {
  }

  bool operator<(const Substitution& rhs) const
  {
    if (pos != rhs.pos) return (pos < rhs.pos);
    if (ancestral != rhs.ancestral) return (ancestral < rhs.ancestral);
    return (derived < rhs.derived);
  }

  bool operator==(const Substitution& rhs) const
  {
    return ((pos == rhs.pos) && (ancestral == rhs.ancestral) && (derived == rhs.derived));
  }

  bool operator!=(const Substitution& rhs) const { return (!(*this == rhs)); }

  /// display label: ancestral residue, 1-indexed position, derived residue, eg. "D614G"
  std::string label() const;

  AlignmentPosType pos;
  char             ancestral;
  char             derived;
};

std::ostream& operator<<(std::ostream& os, const Substitution& sub);

inline std::size_t hash_value(const Substitution& sub)
{
  std::size_t seed(0);
  boost::hash_combine(seed, sub.pos);
  boost::hash_combine(seed, sub.ancestral);
  boost::hash_combine(seed, sub.derived);
  return seed;
}

typedef std::vector<Substitution> SubstitutionList;

/// \brief find all substitutions of seq relative to reference at the variable positions
///
/// Positions beyond the end of either seq or reference are skipped. Residues are compared exactly, so
/// substitutions are reported in ascending position order with at most one per position.
///
/// \param[out] subs substitutions found in seq
void extractSubstitutions(
    const std::string&         seq,
    const std::string&         reference,
    const VariablePositionSet& variablePositions,
    SubstitutionList&          subs);
