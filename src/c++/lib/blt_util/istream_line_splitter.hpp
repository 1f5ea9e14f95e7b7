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
/// an efficient (and slightly unsafe) splitter for tab-delimited text streams
///

#pragma once

#include <iosfwd>
#include <string>
#include <vector>

/// Reads one line at a time from an input stream and splits it into words in place
///
/// The word pointers refer into an internal line buffer, so they are only valid until the next call to
/// parse_line(). A trailing carriage return is removed from each line before splitting.
///
struct istream_line_splitter {
  explicit istream_line_splitter(std::istream& is, const char word_separator = '\t')
    : _is(is), _line_no(0), _sep(word_separator)
  {
  }

  unsigned n_word() const { return word.size(); }

  /// 1-indexed number of the most recently parsed line
  unsigned line_no() const { return _line_no; }

  /// returns false for regular end of input:
  bool parse_line();

  // recreates the line before parsing
  void write_line(std::ostream& os) const;

  // debug output, which provides line number and other info before calling write_line
  void dump(std::ostream& os) const;

  /// words of the current line, empty for a blank line
  std::vector<char*> word;

private:
  std::istream& _is;
  unsigned      _line_no;
  char          _sep;
  std::string   _line;
};
