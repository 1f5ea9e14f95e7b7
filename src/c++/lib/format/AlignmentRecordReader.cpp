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

#include "format/AlignmentRecordReader.hpp"

#include "common/Exceptions.hpp"

#include <cstring>
#include <iostream>
#include <sstream>

static const char alignmentColumnName[] = "aa_aln";

const std::vector<std::string>& AlignmentRecordReader::getDefaultColumnNames()
{
  static const std::vector<std::string> columnNames = {
      "cds_id", "accession", "date_first_seen", "strain_count", "country_first_seen", "aa_aln", "cds_aln"};
  return columnNames;
}

static unsigned getDefaultAlignmentColumn()
{
  const std::vector<std::string>& columnNames(AlignmentRecordReader::getDefaultColumnNames());
  const unsigned                  columnCount(columnNames.size());
  for (unsigned columnIndex(0); columnIndex < columnCount; ++columnIndex) {
    if (columnNames[columnIndex] == alignmentColumnName) return columnIndex;
  }
  return 0;
}

AlignmentRecordReader::AlignmentRecordReader(
    std::istream& is, const bool isHeader, const std::string& sourceLabel)
  : _dparse(is),
    _isHeader(isHeader),
    _sourceLabel(sourceLabel),
    _columnCount(getDefaultColumnNames().size()),
    _alignmentColumn(getDefaultAlignmentColumn())
{
}

void AlignmentRecordReader::recordException(const std::string& message) const
{
  using namespace convergraph::common;

  std::ostringstream oss;
  oss << message << "\n";
  _dparse.dump(oss);
  BOOST_THROW_EXCEPTION(
      InputFormatException(oss.str())
      << input_source_info(_sourceLabel) << input_line_number_info(_dparse.line_no()));
}

void AlignmentRecordReader::parseHeader()
{
  using namespace convergraph::common;

  _isHeaderParsed = true;
  if (!_isHeader) return;

  while (true) {
    if (!_dparse.parse_line()) {
      std::ostringstream oss;
      oss << "Input is missing the expected header line in '" << _sourceLabel << "'";
      BOOST_THROW_EXCEPTION(InputFormatException(oss.str()) << input_source_info(_sourceLabel));
    }
    if (_dparse.n_word() > 0) break;
  }

  _columnCount = _dparse.n_word();
  for (unsigned columnIndex(0); columnIndex < _columnCount; ++columnIndex) {
    if (0 == strcmp(_dparse.word[columnIndex], alignmentColumnName)) {
      _alignmentColumn = columnIndex;
      return;
    }
  }

  std::ostringstream oss;
  oss << "Input header is missing the required field '" << alignmentColumnName << "'";
  recordException(oss.str());
}

bool AlignmentRecordReader::isDefaultColumnNameRecord() const
{
  const std::vector<std::string>& columnNames(getDefaultColumnNames());
  if (_dparse.n_word() != columnNames.size()) return false;
  for (unsigned columnIndex(0); columnIndex < columnNames.size(); ++columnIndex) {
    if (columnNames[columnIndex] != _dparse.word[columnIndex]) return false;
  }
  return true;
}

bool AlignmentRecordReader::next()
{
  if (!_isHeaderParsed) parseHeader();

  while (_dparse.parse_line()) {
    if (_dparse.n_word() == 0) continue;

    if (_dparse.n_word() != _columnCount) {
      std::ostringstream oss;
      oss << "Unexpected number of fields in alignment record. Expected: " << _columnCount
          << " observed: " << _dparse.n_word();
      recordException(oss.str());
    }

    // a header line read as data would be counted as a sequence:
    if ((!_isHeader) && isDefaultColumnNameRecord()) {
      recordException(
          "Alignment record matches the input column header names. "
          "Use --has-header for input which starts with a header line");
    }
    return true;
  }
  return false;
}

void readAlignedSequences(
    std::istream& is, const bool isHeader, const std::string& sourceLabel, std::vector<std::string>& sequences)
{
  sequences.clear();
  AlignmentRecordReader reader(is, isHeader, sourceLabel);
  while (reader.next()) {
    sequences.emplace_back(reader.getAlignment());
  }
}
