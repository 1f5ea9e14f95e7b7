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

#include "boost/test/unit_test.hpp"

#include "blt_util/istream_line_splitter.hpp"

#include <sstream>
#include <string>

BOOST_AUTO_TEST_SUITE(test_istream_line_splitter)

BOOST_AUTO_TEST_CASE(test_istream_line_splitter_parse)
{
  std::string        test_input("1\t2\t3\t4\n11\t22\t33\t44\n");
  std::istringstream iss(test_input);

  istream_line_splitter dparse(iss);

  int line_no(0);
  while (dparse.parse_line()) {
    line_no++;
    static const unsigned expected_col_count(4);
    BOOST_CHECK_EQUAL(dparse.n_word(), expected_col_count);
    BOOST_CHECK_EQUAL(dparse.line_no(), static_cast<unsigned>(line_no));
    if (1 == line_no) {
      BOOST_CHECK_EQUAL(std::string(dparse.word[1]), std::string("2"));
    } else if (2 == line_no) {
      BOOST_CHECK_EQUAL(std::string(dparse.word[1]), std::string("22"));
    }
  }
  BOOST_REQUIRE_EQUAL(line_no, 2);
}

BOOST_AUTO_TEST_CASE(test_istream_line_splitter_long_line)
{
  // longer than any fixed initial buffer, with many columns:
  std::string        longWord(20000, 'M');
  std::ostringstream oss;
  for (unsigned i(0); i < 80; ++i) {
    if (i) oss << '\t';
    oss << i;
  }
  oss << '\t' << longWord << "\n";
  std::istringstream iss(oss.str());

  istream_line_splitter dparse(iss);
  BOOST_REQUIRE(dparse.parse_line());
  BOOST_REQUIRE_EQUAL(dparse.n_word(), 81u);
  BOOST_REQUIRE_EQUAL(std::string(dparse.word[79]), std::string("79"));
  BOOST_REQUIRE_EQUAL(std::string(dparse.word[80]), longWord);
  BOOST_REQUIRE(!dparse.parse_line());
}

BOOST_AUTO_TEST_CASE(test_istream_line_splitter_empty_fields_and_crlf)
{
  std::istringstream iss("a\t\tc\r\n\nx");

  istream_line_splitter dparse(iss);
  BOOST_REQUIRE(dparse.parse_line());
  BOOST_REQUIRE_EQUAL(dparse.n_word(), 3u);
  BOOST_REQUIRE_EQUAL(std::string(dparse.word[1]), std::string(""));
  BOOST_REQUIRE_EQUAL(std::string(dparse.word[2]), std::string("c"));

  // blank line:
  BOOST_REQUIRE(dparse.parse_line());
  BOOST_REQUIRE_EQUAL(dparse.n_word(), 0u);
  BOOST_REQUIRE_EQUAL(dparse.line_no(), 2u);

  // final line without a terminator:
  BOOST_REQUIRE(dparse.parse_line());
  BOOST_REQUIRE_EQUAL(dparse.n_word(), 1u);
  BOOST_REQUIRE_EQUAL(std::string(dparse.word[0]), std::string("x"));
  BOOST_REQUIRE(!dparse.parse_line());
}

BOOST_AUTO_TEST_CASE(test_istream_line_splitter_write_line)
{
  std::istringstream iss("a\tb\tc\n");

  istream_line_splitter dparse(iss);
  BOOST_REQUIRE(dparse.parse_line());

  std::ostringstream oss;
  dparse.write_line(oss);
  BOOST_REQUIRE_EQUAL(oss.str(), std::string("a\tb\tc\n"));
}

BOOST_AUTO_TEST_SUITE_END()
