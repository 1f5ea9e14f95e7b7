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

#include "blt_util/io_util.hpp"

#include "blt_util/blt_exception.hpp"

#include <fstream>
#include <iostream>
#include <sstream>

void open_ifstream(std::ifstream& ifs, const char* filename)
{
  ifs.open(filename);
  if (!ifs) {
    std::ostringstream oss;
    oss << "Can't open file: '" << filename << "'";
    throw blt_exception(oss.str());
  }
}

void read_file_contents(const std::string& filename, std::string& contents)
{
  std::ifstream ifs;
  open_ifstream(ifs, filename.c_str());

  std::ostringstream oss;
  oss << ifs.rdbuf();
  if (ifs.bad()) {
    std::ostringstream eoss;
    eoss << "Unexpected failure while reading file: '" << filename << "'";
    throw blt_exception(eoss.str());
  }
  contents = oss.str();
}
