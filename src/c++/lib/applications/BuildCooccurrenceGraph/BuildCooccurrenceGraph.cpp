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

#include "BuildCooccurrenceGraph.hpp"
#include "BCGOptions.hpp"
#include "CooccurrenceGraphRunner.hpp"

#include "blt_util/io_util.hpp"
#include "blt_util/log.hpp"
#include "common/OutStream.hpp"
#include "format/AlignmentRecordReader.hpp"
#include "format/DotGraphWriter.hpp"
#include "format/ReferenceSequenceUtil.hpp"

#include <fstream>
#include <iostream>

static void readInputSequences(const BCGOptions& opt, std::vector<std::string>& sequences)
{
  if (opt.inputFilename.empty()) {
    readAlignedSequences(std::cin, opt.isHeader, "stdin", sequences);
  } else {
    std::ifstream ifs;
    open_ifstream(ifs, opt.inputFilename.c_str());
    readAlignedSequences(ifs, opt.isHeader, opt.inputFilename, sequences);
  }
}

static void runBCG(const BCGOptions& opt)
{
  // early test that we have permission to write to output file
  OutStream outs(opt.outputFilename);

  std::string reference;
  readReferenceSequence(opt.referenceFilename, reference);

  std::vector<std::string> sequences;
  readInputSequences(opt, sequences);

  CooccurrenceGraphRunner runner(opt.conservationOpt, opt.graphOpt);
  runner.run(sequences, reference, &log_os);

  DotGraphWriter writer(outs.getStream());
  writer.write(runner.getGraph());
  outs.commit();
}

void BuildCooccurrenceGraph::runInternal(int argc, char* argv[]) const
{
  BCGOptions opt;

  parseBCGOptions(*this, argc, argv, opt);
  runBCG(opt);
}
