//
// Convergraph - Amino Acid Substitution Co-occurrence Graph
// Copyright (c) 2013-2019 Illumina, Inc.
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

#include "blt_util/istream_line_splitter.hpp"
#include "blt_util/blt_exception.hpp"

#include <iostream>
#include <sstream>

void istream_line_splitter::write_line(std::ostream& os) const
{
  for (unsigned i(0); i < n_word(); ++i) {
    if (i) os << _sep;
    os << word[i];
  }
  os << "\n";
}

void istream_line_splitter::dump(std::ostream& os) const
{
  os << "\tline_no: " << _line_no << "\n";
  os << "\tline: ";
  write_line(os);
}

bool istream_line_splitter::parse_line()
{
  word.clear();

  if (!std::getline(_is, _line)) {
    if (_is.bad()) {
      std::ostringstream oss;
      oss << "Unexpected failure while attempting to read line " << (_line_no + 1);
      throw blt_exception(oss.str());
    }
    // normal eof
    return false;
  }
  _line_no++;

  if ((!_line.empty()) && (_line[_line.size() - 1] == '\r')) {
    _line.resize(_line.size() - 1);
  }

  if (_line.empty()) return true;

  // do a low-level separator parse:
  char* p(&_line[0]);
  word.push_back(p);
  for (; *p != '\0'; ++p) {
    if (*p == _sep) {
      *p = '\0';
      word.push_back(p + 1);
    }
  }
  return true;
}
