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

#include "BCGOptions.hpp"

#include "blt_util/log.hpp"
#include "common/ProgramUtil.hpp"
#include "options/CooccurrenceGraphOptionsParser.hpp"
#include "options/optionsUtil.hpp"

#include "boost/program_options.hpp"

#include <iostream>

static const ProgramUsageText bcgUsageText = {
    "build a graph of co-occurring amino acid substitutions from aligned protein sequence records",
    " < records.tsv > graph.dot"};

void parseBCGOptions(const convergraph::Program& prog, int argc, char* argv[], BCGOptions& opt)
{
  namespace po = boost::program_options;
  po::options_description req("configuration");
  // clang-format off
  req.add_options()
  ("reference-file,r", po::value(&opt.referenceFilename),
   "reference protein sequence, plain text or single record fasta (required)")
  ("has-header,q", po::bool_switch(&opt.isHeader),
   "the first line of the record input is a header")
  ("input-file", po::value(&opt.inputFilename),
   "read tab-delimited alignment records from filename (default: stdin)")
  ("output-file", po::value(&opt.outputFilename),
   "write the graph in dot format to filename (default: stdout)")
  ;
  // clang-format on

  po::options_description conservationDesc(getOptionsDescription(opt.conservationOpt));
  po::options_description graphDesc(getOptionsDescription(opt.graphOpt));

  po::options_description help("help");
  help.add_options()("help,h", "print this message");

  po::options_description visible("options");
  visible.add(req).add(conservationDesc).add(graphDesc).add(help);

  po::variables_map vm;
  parseCommandLineOrExit(log_os, prog, bcgUsageText, visible, argc, argv, vm);

  std::string errorMsg;
  if (parseOptions(vm, opt.conservationOpt, errorMsg)) {
    usage(log_os, prog, bcgUsageText, visible, errorMsg.c_str());
  } else if (parseOptions(vm, opt.graphOpt, errorMsg)) {
    usage(log_os, prog, bcgUsageText, visible, errorMsg.c_str());
  } else if (checkAndStandardizeRequiredInputFilePath(opt.referenceFilename, "reference", errorMsg)) {
    usage(log_os, prog, bcgUsageText, visible, errorMsg.c_str());
  }

  if (!opt.inputFilename.empty()) {
    if (checkAndStandardizeRequiredInputFilePath(opt.inputFilename, "alignment record input", errorMsg)) {
      usage(log_os, prog, bcgUsageText, visible, errorMsg.c_str());
    }
  }
}
