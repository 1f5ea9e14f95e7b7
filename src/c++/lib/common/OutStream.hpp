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

#pragma once

#include "boost/noncopyable.hpp"

#include <iosfwd>
#include <memory>
#include <string>

/// \brief Output stream which writes to a file if a filename is given, or else to stdout
///
/// File output is written to a temporary file beside the target, which is opened at construction as an
/// early test of write permission. The target file only appears once commit() is called, so a run which
/// fails part way leaves no partial output behind.
///
struct OutStream : private boost::noncopyable {
  explicit OutStream(const std::string& fileName);

  /// removes the temporary file if output was never committed
  ~OutStream();

  std::ostream& getStream() { return *_osptr; }

  /// flush all output and move the completed file to its final name
  void commit();

  bool isCommitted() const { return _isCommitted; }

private:
  std::string                    _fileName;
  std::string                    _tempFileName;
  std::ostream*                  _osptr;
  std::unique_ptr<std::ofstream> _ofsptr;
  bool                           _isCommitted;
};
