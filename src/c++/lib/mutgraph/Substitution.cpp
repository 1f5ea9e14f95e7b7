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

#include "mutgraph/Substitution.hpp"

#include <iostream>
#include <sstream>

std::string Substitution::label() const
{
  std::ostringstream oss;
  oss << *this;
  return oss.str();
}

std::ostream& operator<<(std::ostream& os, const Substitution& sub)
{
  os << sub.ancestral << (sub.pos + 1) << sub.derived;
  return os;
}

void extractSubstitutions(
    const std::string&         seq,
    const std::string&         reference,
    const VariablePositionSet& variablePositions,
    SubstitutionList&          subs)
{
  subs.clear();
  for (const AlignmentPosType pos : variablePositions) {
    if ((pos >= seq.size()) || (pos >= reference.size())) continue;
    if (reference[pos] == seq[pos]) continue;
    subs.emplace_back(pos, reference[pos], seq[pos]);
  }
}
