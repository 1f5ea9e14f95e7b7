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

#include "boost/test/unit_test.hpp"

#include "options/CooccurrenceGraphOptionsParser.hpp"
#include "options/optionsUtil.hpp"
#include "test/testFileMakers.hpp"

#include "boost/filesystem.hpp"

#include <vector>

BOOST_AUTO_TEST_SUITE(test_CooccurrenceGraphOptionsParser)

namespace po = boost::program_options;

/// parse command-line style arguments into the option group for opt and validate the result
///
/// \return true on validation error
template <typename Options>
static bool testParseOptions(const std::vector<const char*>& args, Options& opt, std::string& errorMsg)
{
  std::vector<const char*> argv(1, "test");
  argv.insert(argv.end(), args.begin(), args.end());

  const po::options_description desc(getOptionsDescription(opt));
  po::variables_map             vm;
  po::store(po::parse_command_line(argv.size(), argv.data(), desc), vm);
  po::notify(vm);
  return parseOptions(vm, opt, errorMsg);
}

BOOST_AUTO_TEST_CASE(test_ConservationOptionsDefault)
{
  ConservationOptions opt;
  std::string         errorMsg;
  BOOST_REQUIRE(!testParseOptions({}, opt, errorMsg));
  BOOST_REQUIRE_CLOSE(opt.conservationThreshold, 0.97, 0.0001);
}

BOOST_AUTO_TEST_CASE(test_ConservationOptionsRange)
{
  std::string errorMsg;
  {
    ConservationOptions opt;
    BOOST_REQUIRE(!testParseOptions({"-c", "1"}, opt, errorMsg));
    BOOST_REQUIRE_CLOSE(opt.conservationThreshold, 1.0, 0.0001);
  }
  {
    ConservationOptions opt;
    BOOST_REQUIRE(testParseOptions({"--conservation-threshold", "0"}, opt, errorMsg));
    BOOST_REQUIRE(!errorMsg.empty());
  }
  {
    ConservationOptions opt;
    BOOST_REQUIRE(testParseOptions({"--conservation-threshold", "1.5"}, opt, errorMsg));
  }
}

BOOST_AUTO_TEST_CASE(test_CooccurrenceGraphOptionsDefault)
{
  CooccurrenceGraphOptions opt;
  std::string              errorMsg;
  BOOST_REQUIRE(!testParseOptions({}, opt, errorMsg));
  BOOST_REQUIRE_EQUAL(opt.minCooccurrenceSupport, 4u);
  BOOST_REQUIRE_CLOSE(opt.minCooccurrenceFrequency, 0.10, 0.0001);
}

BOOST_AUTO_TEST_CASE(test_CooccurrenceGraphOptionsRange)
{
  std::string errorMsg;
  {
    CooccurrenceGraphOptions opt;
    BOOST_REQUIRE(!testParseOptions({"-s", "1", "-f", "0"}, opt, errorMsg));
    BOOST_REQUIRE_EQUAL(opt.minCooccurrenceSupport, 1u);
    BOOST_REQUIRE_EQUAL(opt.minCooccurrenceFrequency, 0.);
  }
  {
    CooccurrenceGraphOptions opt;
    BOOST_REQUIRE(testParseOptions({"--minimum-cooccurrence-support", "0"}, opt, errorMsg));
  }
  {
    CooccurrenceGraphOptions opt;
    BOOST_REQUIRE(testParseOptions({"--minimum-cooccurrence-frequency", "1.1"}, opt, errorMsg));
  }
}

BOOST_AUTO_TEST_CASE(test_CheckInputFilePath)
{
  std::string errorMsg;
  {
    std::string filename;
    BOOST_REQUIRE(checkAndStandardizeRequiredInputFilePath(filename, "reference", errorMsg));
  }
  {
    const TestFilenameMaker missingFile;
    std::string             filename(missingFile.getFilename());
    BOOST_REQUIRE(checkAndStandardizeRequiredInputFilePath(filename, "reference", errorMsg));
  }
  {
    std::string filename(boost::filesystem::temp_directory_path().string());
    BOOST_REQUIRE(checkAndStandardizeRequiredInputFilePath(filename, "reference", errorMsg));
  }
  {
    const TestTextFileMaker refFile("MAD\n");
    std::string             filename(refFile.getFilename());
    BOOST_REQUIRE(!checkAndStandardizeRequiredInputFilePath(filename, "reference", errorMsg));
    BOOST_REQUIRE(boost::filesystem::path(filename).is_absolute());
  }
}

BOOST_AUTO_TEST_SUITE_END()
