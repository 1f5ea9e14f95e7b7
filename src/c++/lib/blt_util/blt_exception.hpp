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

#include <exception>
#include <string>

/// \brief a minimal exception class for low-level parsing and file utilities
///
/// Domain errors should use the boost::exception based types in common/Exceptions.hpp instead.
///
struct blt_exception : public std::exception {
  explicit blt_exception(const char* s);

  explicit blt_exception(const std::string& s);

  const char* what() const noexcept override { return message.c_str(); }

  std::string message;
};
