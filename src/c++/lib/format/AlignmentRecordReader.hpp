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
/// \brief reader for tab-delimited aligned protein sequence records
///

#pragma once

#include "blt_util/istream_line_splitter.hpp"

#include <iosfwd>
#include <string>
#include <vector>

/// \brief read the aligned amino acid sequence from each record of a tab-delimited stream
///
/// Records have the columns:
///
///     cds_id accession date_first_seen strain_count country_first_seen aa_aln cds_aln
///
/// When the stream has a header line, the aa_aln column is located by name and every record must have the
/// same number of columns as the header. Without a header every record must have exactly the columns above.
/// Blank lines are skipped. Any malformed record throws an InputFormatException.
///
struct AlignmentRecordReader {
  AlignmentRecordReader(std::istream& is, const bool isHeader, const std::string& sourceLabel = "stdin");

  /// advance to the next record
  ///
  /// \return false for regular end of input
  bool next();

  /// aligned amino acid sequence of the current record
  const char* getAlignment() const { return _dparse.word[_alignmentColumn]; }

  /// 1-indexed line number of the current record
  unsigned getLineNumber() const { return _dparse.line_no(); }

  /// column layout of a record without a header
  static const std::vector<std::string>& getDefaultColumnNames();

private:
  void parseHeader();

  /// true if the current line holds the expected column names
  bool isDefaultColumnNameRecord() const;

  void recordException(const std::string& message) const;

  istream_line_splitter _dparse;
  const bool            _isHeader;
  const std::string     _sourceLabel;
  bool                  _isHeaderParsed = false;
  unsigned              _columnCount;
  unsigned              _alignmentColumn;
};

/// read all aligned amino acid sequences from a record stream
void readAlignedSequences(
    std::istream&             is,
    const bool                isHeader,
    const std::string&        sourceLabel,
    std::vector<std::string>& sequences);
