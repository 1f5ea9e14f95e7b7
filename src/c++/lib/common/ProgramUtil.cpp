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

#include "common/ProgramUtil.hpp"

#include <cstdlib>

#include <iostream>

void usage(
    std::ostream&                                      os,
    const convergraph::Program&                        prog,
    const ProgramUsageText&                            text,
    const boost::program_options::options_description& visible,
    const char*                                        msg)
{
  os << "\n" << prog.name() << " " << prog.version() << ": " << text.description << "\n\n";
  os << "Usage: " << prog.name() << " [options]" << text.afterOptions << "\n\n";
  os << visible << "\n";

  if (nullptr != msg) {
    os << "ERROR: " << msg << "\n\n";
  }
  os << "build: " << prog.buildTime() << " " << prog.compiler() << "\n" << std::flush;
  exit(usageErrorExitStatus);
}

void parseCommandLineOrExit(
    std::ostream&                                      os,
    const convergraph::Program&                        prog,
    const ProgramUsageText&                            text,
    const boost::program_options::options_description& visible,
    int                                                argc,
    char*                                              argv[],
    boost::program_options::variables_map&             vm)
{
  namespace po = boost::program_options;

  try {
    po::store(po::parse_command_line(argc, argv, visible), vm);
    po::notify(vm);
  } catch (const po::error& e) {
    usage(os, prog, text, visible, e.what());
  }

  if ((argc <= 1) || vm.count("help")) usage(os, prog, text, visible);
}
