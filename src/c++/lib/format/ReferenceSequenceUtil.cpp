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

#include "format/ReferenceSequenceUtil.hpp"

#include "blt_util/io_util.hpp"
#include "common/Exceptions.hpp"

#include "boost/algorithm/string/trim.hpp"

#include <sstream>

void parseReferenceSequence(const std::string& contents, const std::string& sourceLabel, std::string& refSeq)
{
  using namespace convergraph::common;

  refSeq.clear();

  unsigned           deflineCount(0);
  std::istringstream iss(contents);
  std::string        line;
  while (std::getline(iss, line)) {
    boost::algorithm::trim(line);
    if (line.empty()) continue;
    if (line[0] == '>') {
      deflineCount++;
      if (deflineCount > 1) {
        std::ostringstream oss;
        oss << "Reference file contains more than one sequence: '" << sourceLabel << "'";
        BOOST_THROW_EXCEPTION(InputFormatException(oss.str()) << input_source_info(sourceLabel));
      }
      continue;
    }
    refSeq += line;
  }

  if (refSeq.empty()) {
    std::ostringstream oss;
    oss << "Reference file contains no sequence: '" << sourceLabel << "'";
    BOOST_THROW_EXCEPTION(InputFormatException(oss.str()) << input_source_info(sourceLabel));
  }
}

void readReferenceSequence(const std::string& filename, std::string& refSeq)
{
  std::string contents;
  read_file_contents(filename, contents);
  parseReferenceSequence(contents, filename, refSeq);
}
