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
/// \brief mapping between amino acid residue symbols and fixed count-table bins
///

#pragma once

#include <cstdint>

/// Residue bins used to index per-position count tables
///
/// Letters are case folded into bins A..Z (0..25), followed by the gap, stop and catch-all bins.
///
namespace AA_BIN {
enum index_t { A = 0, Z = 25, GAP, STOP, OTHER, SIZE };
}

inline uint8_t symbol_to_bin(const char a)
{
  if ((a >= 'A') && (a <= 'Z')) return static_cast<uint8_t>(a - 'A');
  if ((a >= 'a') && (a <= 'z')) return static_cast<uint8_t>(a - 'a');
  switch (a) {
  case '-':
    return AA_BIN::GAP;
  case '*':
    return AA_BIN::STOP;
  default:
    return AA_BIN::OTHER;
  }
}

void bin_to_symbol_error(const unsigned i);

/// Inverse of symbol_to_bin for uppercase letters and the special bins, the catch-all bin is shown as '?'
inline char bin_to_symbol(const unsigned i)
{
  if (i <= AA_BIN::Z) return static_cast<char>('A' + i);
  switch (i) {
  case AA_BIN::GAP:
    return '-';
  case AA_BIN::STOP:
    return '*';
  case AA_BIN::OTHER:
    return '?';
  default:
    bin_to_symbol_error(i);
    return '?';
  }
}
