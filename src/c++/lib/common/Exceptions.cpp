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
/// \brief Formatting of exception context for fatal error reports
///

#include "common/Exceptions.hpp"

#include "boost/date_time/posix_time/posix_time.hpp"

#include <cstring>
#include <sstream>

namespace convergraph {
namespace common {

std::string ExceptionData::getContext() const
{
  std::ostringstream oss;
  oss << boost::posix_time::to_simple_string(boost::posix_time::second_clock::local_time()) << " " << _message;
  if (_errorNumber != 0) oss << " '" << strerror(_errorNumber) << "'";

  // input location, when the error is tied to a record or file:
  const std::string* const sourcePtr(boost::get_error_info<input_source_info>(*this));
  if (nullptr != sourcePtr) {
    oss << "\n\tinput: " << *sourcePtr;
    const unsigned* const lineNumberPtr(boost::get_error_info<input_line_number_info>(*this));
    if (nullptr != lineNumberPtr) oss << " line: " << *lineNumberPtr;
  }

  // throw site, recorded by BOOST_THROW_EXCEPTION:
  const auto filePtr(boost::get_error_info<boost::throw_file>(*this));
  const auto linePtr(boost::get_error_info<boost::throw_line>(*this));
  if ((nullptr != filePtr) && (nullptr != linePtr)) {
    oss << "\n\tthrown at: " << *filePtr << ":" << *linePtr;
    const auto functionPtr(boost::get_error_info<boost::throw_function>(*this));
    if (nullptr != functionPtr) oss << " in " << *functionPtr;
  }
  return oss.str();
}

}  // namespace common
}  // namespace convergraph
