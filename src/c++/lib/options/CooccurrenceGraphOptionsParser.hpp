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

#pragma once

#include "options/CooccurrenceGraphOptions.hpp"

#include "boost/program_options.hpp"

#include <string>

boost::program_options::options_description getOptionsDescription(ConservationOptions& opt);

boost::program_options::options_description getOptionsDescription(CooccurrenceGraphOptions& opt);

/// validate conservation options
///
/// \return true on error and provide errorMsg
bool parseOptions(
    const boost::program_options::variables_map& vm, ConservationOptions& opt, std::string& errorMsg);

/// validate graph pruning options
///
/// \return true on error and provide errorMsg
bool parseOptions(
    const boost::program_options::variables_map& vm, CooccurrenceGraphOptions& opt, std::string& errorMsg);
