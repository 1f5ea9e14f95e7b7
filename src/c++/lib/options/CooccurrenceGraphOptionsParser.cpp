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

#include "options/CooccurrenceGraphOptionsParser.hpp"

boost::program_options::options_description getOptionsDescription(ConservationOptions& opt)
{
  namespace po = boost::program_options;
  po::options_description desc("conservation");
  // clang-format off
  desc.add_options()
  ("conservation-threshold,c", po::value(&opt.conservationThreshold)->default_value(opt.conservationThreshold),
   "Alignment positions where the majority residue frequency is below this value are analyzed for substitutions. Range: (0,1]")
  ;
  // clang-format on

  return desc;
}

boost::program_options::options_description getOptionsDescription(CooccurrenceGraphOptions& opt)
{
  namespace po = boost::program_options;
  po::options_description desc("co-occurrence-graph");
  // clang-format off
  desc.add_options()
  ("minimum-cooccurrence-support,s", po::value(&opt.minCooccurrenceSupport)->default_value(opt.minCooccurrenceSupport),
   "Minimum number of sequences containing both substitutions required to retain a graph edge")
  ("minimum-cooccurrence-frequency,f", po::value(&opt.minCooccurrenceFrequency)->default_value(opt.minCooccurrenceFrequency, "0.10"),
   "Minimum fraction of all sequences containing both substitutions required to retain a graph edge. Range: [0,1]")
  ;
  // clang-format on

  return desc;
}

bool parseOptions(
    const boost::program_options::variables_map& /*vm*/, ConservationOptions& opt, std::string& errorMsg)
{
  errorMsg.clear();
  if ((opt.conservationThreshold <= 0.) || (opt.conservationThreshold > 1.)) {
    errorMsg = "conservation-threshold argument is restricted to (0,1]";
  }
  return (!errorMsg.empty());
}

bool parseOptions(
    const boost::program_options::variables_map& /*vm*/, CooccurrenceGraphOptions& opt, std::string& errorMsg)
{
  errorMsg.clear();
  if (opt.minCooccurrenceSupport < 1) {
    errorMsg = "minimum-cooccurrence-support argument must be at least 1";
  } else if ((opt.minCooccurrenceFrequency < 0.) || (opt.minCooccurrenceFrequency > 1.)) {
    errorMsg = "minimum-cooccurrence-frequency argument is restricted to [0,1]";
  }
  return (!errorMsg.empty());
}
