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

#include "common/OutStream.hpp"

#include "common/Exceptions.hpp"

#include "boost/filesystem.hpp"

#include <cerrno>
#include <fstream>
#include <iostream>
#include <sstream>

OutStream::OutStream(const std::string& fileName)
  : _fileName(fileName), _osptr(&std::cout), _isCommitted(false)
{
  using namespace convergraph::common;

  if (_fileName.empty()) return;

  _tempFileName = _fileName + boost::filesystem::unique_path(".%%%%-%%%%.tmp").string();
  _ofsptr.reset(new std::ofstream(_tempFileName.c_str()));
  if (!*_ofsptr) {
    std::ostringstream oss;
    oss << "Can't open output file: '" << _fileName << "'";
    BOOST_THROW_EXCEPTION(GeneralException(oss.str(), errno));
  }
  _osptr = _ofsptr.get();
}

OutStream::~OutStream()
{
  if (_isCommitted || _tempFileName.empty()) return;

  _ofsptr.reset();
  boost::system::error_code ec;
  boost::filesystem::remove(_tempFileName, ec);
}

void OutStream::commit()
{
  using namespace convergraph::common;

  if (_isCommitted) return;

  _osptr->flush();
  if (_ofsptr) _ofsptr->close();
  if (!*_osptr) {
    std::ostringstream oss;
    oss << "Failed to write output to '" << (_fileName.empty() ? "stdout" : _fileName) << "'";
    BOOST_THROW_EXCEPTION(GeneralException(oss.str()));
  }

  if (!_tempFileName.empty()) {
    boost::system::error_code ec;
    boost::filesystem::rename(_tempFileName, _fileName, ec);
    if (ec) {
      std::ostringstream oss;
      oss << "Can't move completed output to '" << _fileName << "': " << ec.message();
      BOOST_THROW_EXCEPTION(GeneralException(oss.str()));
    }
  }
  _isCommitted = true;
}
