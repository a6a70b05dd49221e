/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#define BOOST_TEST_MODULE CsvReaderTest
#include "utils/CsvReader.hpp"
#include <boost/test/unit_test.hpp>
#include <cstdio>
#include <fstream>

using namespace Smallville;

BOOST_AUTO_TEST_SUITE(CsvReaderParsingTests)

BOOST_AUTO_TEST_CASE(TestBlockTable) {
  CsvReader reader;
  BOOST_REQUIRE(reader.parse("32135, the Ville, Hobbs Cafe\n"
                             "32145, the Ville, Johnson Park\r\n"));

  const auto& rows = reader.getRows();
  BOOST_REQUIRE_EQUAL(rows.size(), 2);
  BOOST_REQUIRE_EQUAL(rows[0].size(), 3);
  BOOST_CHECK_EQUAL(rows[0][0], "32135");
  BOOST_CHECK_EQUAL(rows[0][2], "Hobbs Cafe");
  BOOST_CHECK_EQUAL(rows[1].back(), "Johnson Park");
}

BOOST_AUTO_TEST_CASE(TestLayerRow) {
  CsvReader reader;
  BOOST_REQUIRE(reader.parse("0,0,32125,0,,32125"));

  const auto& rows = reader.getRows();
  BOOST_REQUIRE_EQUAL(rows.size(), 1);
  const CsvRow expected{"0", "0", "32125", "0", "", "32125"};
  BOOST_CHECK_EQUAL_COLLECTIONS(rows[0].begin(), rows[0].end(), expected.begin(),
                                expected.end());
}

BOOST_AUTO_TEST_CASE(TestQuotedCells) {
  CsvReader reader;
  BOOST_REQUIRE(reader.parse("1, \"Lin family's house, kitchen\", \"say \"\"hi\"\"\"\n"));

  const auto& row = reader.getRows().at(0);
  BOOST_REQUIRE_EQUAL(row.size(), 3);
  BOOST_CHECK_EQUAL(row[1], "Lin family's house, kitchen");
  BOOST_CHECK_EQUAL(row[2], "say \"hi\"");
}

BOOST_AUTO_TEST_CASE(TestQuotedNewline) {
  CsvReader reader;
  BOOST_REQUIRE(reader.parse("a,\"two\nlines\"\nb,c\n"));

  const auto& rows = reader.getRows();
  BOOST_REQUIRE_EQUAL(rows.size(), 2);
  BOOST_CHECK_EQUAL(rows[0][1], "two\nlines");
  BOOST_CHECK_EQUAL(rows[1][0], "b");
}

BOOST_AUTO_TEST_CASE(TestBlankLinesSkipped) {
  CsvReader reader;
  BOOST_REQUIRE(reader.parse("\n  \n1,park\n\n2,cafe\n   "));

  const auto& rows = reader.getRows();
  BOOST_REQUIRE_EQUAL(rows.size(), 2);
  BOOST_CHECK_EQUAL(rows[0][1], "park");
  BOOST_CHECK_EQUAL(rows[1][1], "cafe");
}

BOOST_AUTO_TEST_CASE(TestEmptyInput) {
  CsvReader reader;
  BOOST_CHECK(reader.parse(""));
  BOOST_CHECK(reader.getRows().empty());
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE(CsvReaderErrorTests)

BOOST_AUTO_TEST_CASE(TestUnterminatedQuote) {
  CsvReader reader;
  BOOST_CHECK(!reader.parse("1,park\n2,\"cafe\n"));
  BOOST_CHECK(reader.getRows().empty());
  BOOST_CHECK_EQUAL(reader.getLastError(), "Line 3: unterminated quoted cell");
}

BOOST_AUTO_TEST_CASE(TestNonExistentFile) {
  CsvReader reader;
  BOOST_CHECK(!reader.loadFromFile("non_existent_blocks.csv"));
  BOOST_CHECK(reader.getLastError().find("non_existent_blocks.csv") != std::string::npos);
}

BOOST_AUTO_TEST_CASE(TestFileErrorNamesFile) {
  const std::string filename = "test_temp_broken.csv";
  {
    std::ofstream file(filename);
    file << "1,\"open\n";
  }

  CsvReader reader;
  BOOST_CHECK(!reader.loadFromFile(filename));
  BOOST_CHECK_EQUAL(reader.getLastError().rfind(filename, 0), 0u);

  std::remove(filename.c_str());
}

BOOST_AUTO_TEST_SUITE_END()
