/*
 * Copyright 2022 HEAVY.AI, Inc.
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *     http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

#include "Import/Detector.h"

#include <gtest/gtest.h>

#include "Import/DelimitedParserUtils.h"
#include "Import/ImportErrors.h"
#include "ImportTestDoubles.h"
#include "TestHelpers.h"

using namespace csv2db;
using TestDoubles::MemorySource;

class DetectorTest : public ::testing::Test {
 protected:
  Detector detect(const std::string& csv, const std::string& table_name = "items") {
    MemorySource source(csv);
    return Detector(source, table_name, params_, log_);
  }

  ImportParams params_;
  logger::LogSource log_;
};

TEST_F(DetectorTest, DetectAffinity) {
  EXPECT_EQ(Detector::detect_affinity("42"), ColumnAffinity::INTEGER);
  EXPECT_EQ(Detector::detect_affinity("-9000000000"), ColumnAffinity::INTEGER);
  EXPECT_EQ(Detector::detect_affinity("1.5"), ColumnAffinity::REAL);
  EXPECT_EQ(Detector::detect_affinity("2e10"), ColumnAffinity::REAL);
  EXPECT_EQ(Detector::detect_affinity("99999999999999999999"), ColumnAffinity::REAL);
  EXPECT_EQ(Detector::detect_affinity("abc"), ColumnAffinity::TEXT);
  EXPECT_EQ(Detector::detect_affinity("12abc"), ColumnAffinity::TEXT);
  EXPECT_EQ(Detector::detect_affinity("2021-01-01"), ColumnAffinity::TEXT);
}

TEST_F(DetectorTest, WideningOrder) {
  EXPECT_TRUE(
      Detector::more_restrictive_affinity(ColumnAffinity::REAL, ColumnAffinity::INTEGER));
  EXPECT_FALSE(
      Detector::more_restrictive_affinity(ColumnAffinity::INTEGER, ColumnAffinity::REAL));
  EXPECT_FALSE(
      Detector::more_restrictive_affinity(ColumnAffinity::REAL, ColumnAffinity::TEXT));
}

TEST_F(DetectorTest, HeaderRowIsDetected) {
  const auto detector = detect("id,name,price\n1,apple,1.5\n2,pear,2\n");

  EXPECT_TRUE(detector.hasHeaders());
  EXPECT_EQ(detector.getHeaders(), (std::vector<std::string>{"id", "name", "price"}));
  EXPECT_EQ(detector.getBestAffinities(),
            (std::vector<ColumnAffinity>{
                ColumnAffinity::INTEGER, ColumnAffinity::TEXT, ColumnAffinity::REAL}));
  EXPECT_EQ(detector.getCreateTableSql(),
            "CREATE TABLE \"items\" (\"id\" INTEGER, \"name\" TEXT, \"price\" REAL);");
}

TEST_F(DetectorTest, RowsWithoutHeaderGetNumberedColumns) {
  const auto detector = detect("1,2.5\n3,4\n");

  EXPECT_FALSE(detector.hasHeaders());
  EXPECT_EQ(detector.getCreateTableSql(),
            "CREATE TABLE \"items\" (\"column_1\" INTEGER, \"column_2\" REAL);");
}

TEST_F(DetectorTest, HeaderSettingOverridesDetection) {
  params_.has_header = ImportHeaderRow::HAS_HEADER;
  const auto with_header = detect("first,last\nada,lovelace\n");
  EXPECT_TRUE(with_header.hasHeaders());
  EXPECT_EQ(with_header.getHeaders(), (std::vector<std::string>{"first", "last"}));

  params_.has_header = ImportHeaderRow::NO_HEADER;
  const auto without_header = detect("id,n\n1,2\n");
  EXPECT_FALSE(without_header.hasHeaders());
  EXPECT_EQ(without_header.getBestAffinities(),
            (std::vector<ColumnAffinity>{ColumnAffinity::TEXT, ColumnAffinity::TEXT}));
}

TEST_F(DetectorTest, NullsDoNotNarrowColumns) {
  const auto detector = detect("a,b,c\n1,,x\n2,\\N,NULL\n,NULL,y\n");

  EXPECT_EQ(detector.getBestAffinities(),
            (std::vector<ColumnAffinity>{
                ColumnAffinity::INTEGER, ColumnAffinity::TEXT, ColumnAffinity::TEXT}));
}

TEST_F(DetectorTest, ColumnNamesAreSanitizedAndUnique) {
  params_.has_header = ImportHeaderRow::HAS_HEADER;
  const auto detector = detect("unit price,Unit_Price,2nd,select,\n1,2,3,4,5\n");

  EXPECT_EQ(detector.getHeaders(),
            (std::vector<std::string>{
                "unit_price", "Unit_Price_2", "_2nd", "select_", "column_5"}));
}

TEST_F(DetectorTest, MaxRowsLimitsTheSample) {
  params_.max_rows = 2;
  const auto detector = detect("n\n1\n2\nnot a number\n");

  EXPECT_EQ(detector.getSampledRowCount(), size_t(3));
  EXPECT_EQ(detector.getBestAffinities(),
            (std::vector<ColumnAffinity>{ColumnAffinity::INTEGER}));
}

TEST_F(DetectorTest, SampleSpansReadBlocks) {
  std::string csv = "n,s\n";
  for (int i = 0; i < 200000; ++i) {
    csv += std::to_string(i % 1000) + ",abc\n";
  }
  const auto detector = detect(csv);

  EXPECT_EQ(detector.getSampledRowCount(), size_t(200001));
  EXPECT_TRUE(detector.hasHeaders());
}

TEST_F(DetectorTest, EmptySourceIsSchemaError) {
  EXPECT_THROW(detect(""), SchemaError);
  EXPECT_THROW(detect("\n\n"), SchemaError);
}

TEST_F(DetectorTest, QuotedTableAndColumnNames) {
  params_.has_header = ImportHeaderRow::HAS_HEADER;
  const auto detector = detect("v\n1\n", "we\"ird");
  EXPECT_EQ(detector.getCreateTableSql(), "CREATE TABLE \"we\"\"ird\" (\"v\" INTEGER);");
}

TEST(DelimitedParser, GetRowHandlesQuotesAndEscapes) {
  ImportParams params;
  const std::string buf = "\"x,y\",\"he said \"\"hi\"\"\", plain ,\"\"\nnext,row\n";
  std::vector<std::string> row;

  const char* next =
      delimited_parser::get_row(buf.data(), buf.data() + buf.size(), params, row);

  EXPECT_EQ(row, (std::vector<std::string>{"x,y", "he said \"hi\"", "plain", ""}));
  EXPECT_EQ(std::string(next), "next,row\n");
}

TEST(DelimitedParser, GetRowWithoutLineEnding) {
  ImportParams params;
  params.delimiter = '\t';
  const std::string buf = "a\tb\t";
  std::vector<std::string> row;

  delimited_parser::get_row(buf.data(), buf.data() + buf.size(), params, row);

  EXPECT_EQ(row, (std::vector<std::string>{"a", "b", ""}));
}

TEST(DelimitedParser, FindEndIgnoresLineBreaksInQuotes) {
  ImportParams params;
  const std::string buf = "1,\"multi\nline\"\n2,\"open\n";
  unsigned int num_rows = 0;

  const auto end = delimited_parser::find_end(buf.data(), buf.size(), params, num_rows);

  EXPECT_EQ(end, std::string("1,\"multi\nline\"\n").size());
  EXPECT_EQ(num_rows, 1u);
  EXPECT_EQ(delimited_parser::find_end("no newline", 10, params, num_rows), size_t(0));
}

int main(int argc, char* argv[]) {
  TestHelpers::init_logger_stderr_only(argc, argv);
  ::testing::InitGoogleTest(&argc, argv);

  int err{0};
  try {
    err = RUN_ALL_TESTS();
  } catch (const std::exception& e) {
    logger::LogSource log;
    LOG(log, ERROR) << e.what();
  }
  return err;
}
