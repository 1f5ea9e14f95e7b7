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
/// \brief command line handling shared by all programs
///

#pragma once

#include "common/Program.hpp"

#include "boost/program_options.hpp"

#include <iosfwd>

/// exit status for command line usage errors
const int usageErrorExitStatus = 2;

/// program specific text of the usage message
struct ProgramUsageText {
  /// one line program description
  const char* description;

  /// shown after the options placeholder in the usage line, eg. " < input > output"
  const char* afterOptions;
};

/// print program usage information and an optional error message to os, then exit with usageErrorExitStatus
void usage(
    std::ostream&                                      os,
    const convergraph::Program&                        prog,
    const ProgramUsageText&                            text,
    const boost::program_options::options_description& visible,
    const char*                                        msg = nullptr);

/// parse the command line against the visible options into vm
///
/// Usage is printed and the program exits if the command line can't be parsed, no arguments are given, or
/// help is requested.
void parseCommandLineOrExit(
    std::ostream&                                      os,
    const convergraph::Program&                        prog,
    const ProgramUsageText&                            text,
    const boost::program_options::options_description& visible,
    int                                                argc,
    char*                                              argv[],
    boost::program_options::variables_map&             vm);
