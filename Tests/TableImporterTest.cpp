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

#include "Import/TableImporter.h"

#include <signal.h>

#include <gtest/gtest.h>

#include <boost/filesystem.hpp>

#include "Import/ImportErrors.h"
#include "ImportTestDoubles.h"
#include "LogCaptureTestHelper.h"
#include "TestHelpers.h"

using namespace csv2db;
using TestDoubles::FakeChannelManager;
using TestDoubles::FakeLoaderController;
using TestDoubles::MemorySource;
using TestDoubles::Trace;

namespace {

constexpr char const* kCreate = "CREATE TABLE \"t\" (\"a\" INTEGER, \"b\" TEXT);";
const std::string kRows = "1,x\n2,y\n3,z\n4,w\n5,v\n6,u\n7,t\n8,s\n";  // 32 bytes

}  // namespace

class TableImporterTest : public ::testing::Test {
 protected:
  TableImporterTest() : channels_(trace_), loaders_(trace_), source_(kRows, &trace_) {
    params_.start_exponent = 8;
  }

  ImportStatus import(const size_t skip_rows = 0) {
    TableImporter importer(channels_, loaders_, params_, log_);
    ImportJob job{source_, "t", "test.db", kCreate, skip_rows};
    return importer.importTable(job);
  }

  Trace trace_;
  FakeChannelManager channels_;
  FakeLoaderController loaders_;
  MemorySource source_;
  ImportParams params_;
  logger::LogSource log_;
};

TEST_F(TableImporterTest, SuccessfulImportCleansUpInOrder) {
  const auto status = import();

  EXPECT_EQ(trace_,
            (Trace{std::string("run ") + kCreate,
                   "open channel",
                   "start",
                   "open writer",
                   "terminate",
                   "close channel",
                   "close source"}));
  EXPECT_EQ(status.table_name, "t");
  EXPECT_EQ(status.bytes_transferred, kRows.size());
  EXPECT_EQ(status.attempts, size_t(1));
  EXPECT_EQ(status.failed_attempts, size_t(0));
  EXPECT_EQ(status.exponent, 8);
  EXPECT_TRUE(status.loader_terminated_cleanly);
  EXPECT_EQ(status.diagnostics, "fake diagnostics\n");
  ASSERT_EQ(channels_.received.size(), size_t(1));
  EXPECT_EQ(channels_.received[0], kRows);
}

TEST_F(TableImporterTest, StartsImportOfChannelIntoTable) {
  import(1);

  ASSERT_EQ(loaders_.scripts.size(), size_t(2));
  EXPECT_EQ(loaders_.scripts[1],
            (std::vector<std::string>{
                ".mode csv",
                ".separator \",\" \"\\n\"",
                ".import --skip 1 \"/fake/csv2db-dir/t_0123\" \"t\""}));
}

TEST_F(TableImporterTest, ReplaceDropsTableFirst) {
  params_.replace_existing = true;
  import();

  ASSERT_FALSE(loaders_.scripts.empty());
  EXPECT_EQ(loaders_.scripts[0],
            (std::vector<std::string>{"DROP TABLE IF EXISTS \"t\";", kCreate}));
}

TEST_F(TableImporterTest, ExhaustedTransferStillCleansUpInOrder) {
  params_.restart_loader_on_retry = false;
  channels_.max_write = 0;

  EXPECT_THROW(import(), TransferExhaustedError);

  ASSERT_GE(trace_.size(), size_t(3));
  EXPECT_EQ(Trace(trace_.end() - 3, trace_.end()),
            (Trace{"terminate", "close channel", "close source"}));
  EXPECT_EQ(TestDoubles::count(trace_, "open writer"), size_t(8));
  EXPECT_EQ(TestDoubles::count(trace_, "close channel"), size_t(1));
  EXPECT_EQ(TestDoubles::count(trace_, "start"), size_t(1));
}

TEST_F(TableImporterTest, TableCreationFailureIsSchemaError) {
  loaders_.fail_create = true;

  EXPECT_THROW(import(), SchemaError);

  EXPECT_EQ(trace_, (Trace{std::string("run ") + kCreate, "close source"}));
  EXPECT_FALSE(source_.isOpen());
}

TEST_F(TableImporterTest, ChannelFailureReleasesSource) {
  channels_.fail_open = true;

  EXPECT_THROW(import(), ResourceError);

  EXPECT_EQ(TestDoubles::count(trace_, "start"), size_t(0));
  EXPECT_EQ(trace_.back(), "close source");
}

TEST_F(TableImporterTest, LoaderStartFailureRemovesChannel) {
  loaders_.fail_start = true;

  EXPECT_THROW(import(), LoaderError);

  EXPECT_EQ(Trace(trace_.end() - 2, trace_.end()),
            (Trace{"close channel", "close source"}));
  EXPECT_EQ(TestDoubles::count(trace_, "close channel"), size_t(1));
}

TEST_F(TableImporterTest, TerminationErrorIsLoggedNotThrown) {
  loaders_.fail_terminate = true;
  LogCapture capture;

  const auto status = import();

  EXPECT_FALSE(status.loader_terminated_cleanly);
  EXPECT_EQ(status.bytes_transferred, kRows.size());
  EXPECT_TRUE(capture.contains("ERROR [t] loader exited with code 1"));
  EXPECT_EQ(trace_.back(), "close source");
}

TEST_F(TableImporterTest, ChannelRemovalErrorIsLoggedNotThrown) {
  channels_.fail_close = true;
  LogCapture capture;

  EXPECT_NO_THROW(import());

  EXPECT_TRUE(capture.contains("failed to remove named pipe"));
  EXPECT_EQ(TestDoubles::count(trace_, "close channel"), size_t(1));
  EXPECT_EQ(trace_.back(), "close source");
}

TEST_F(TableImporterTest, RetryRestartsLoaderOnEmptiedTable) {
  // 32 byte source: chunks of 256, 128, 64 and 32 bytes are refused, 16 get through
  channels_.max_write = 16;

  const auto status = import();

  EXPECT_EQ(status.failed_attempts, size_t(4));
  EXPECT_EQ(status.exponent, 4);
  EXPECT_EQ(TestDoubles::count(trace_, "start"), size_t(5));
  EXPECT_EQ(TestDoubles::count(trace_, "terminate"), size_t(5));
  EXPECT_EQ(TestDoubles::count(trace_, "run DELETE FROM \"t\";"), size_t(4));

  // every retry: old loader gone, rows discarded, new loader up, then the next attempt
  const auto first_retry = std::find(trace_.begin(), trace_.end(), "terminate");
  ASSERT_NE(first_retry, trace_.end());
  EXPECT_EQ(Trace(first_retry, first_retry + 4),
            (Trace{"terminate", "run DELETE FROM \"t\";", "start", "open writer"}));
  EXPECT_EQ(Trace(trace_.end() - 3, trace_.end()),
            (Trace{"terminate", "close channel", "close source"}));
  EXPECT_EQ(channels_.received.back(), kRows);
}

TEST_F(TableImporterTest, RetryWithoutRestartKeepsLoader) {
  params_.restart_loader_on_retry = false;
  channels_.max_write = 16;

  const auto status = import();

  EXPECT_EQ(status.failed_attempts, size_t(4));
  EXPECT_EQ(TestDoubles::count(trace_, "start"), size_t(1));
  EXPECT_EQ(TestDoubles::count(trace_, "run DELETE FROM \"t\";"), size_t(0));
}

TEST_F(TableImporterTest, FailureToDiscardRowsOnRetryStillCleansUp) {
  channels_.max_write = 16;
  loaders_.fail_delete = true;

  EXPECT_THROW(import(), LoaderError);

  EXPECT_EQ(TestDoubles::count(trace_, "start"), size_t(1));
  EXPECT_EQ(TestDoubles::count(trace_, "open writer"), size_t(1));
  EXPECT_EQ(Trace(trace_.end() - 4, trace_.end()),
            (Trace{"terminate",
                   "run DELETE FROM \"t\";",
                   "close channel",
                   "close source"}));
}

TEST_F(TableImporterTest, LoaderExitingBeforeOpeningChannelFailsWithoutRetries) {
  loaders_.loader_exits_early = true;

  try {
    import();
    FAIL() << "expected LoaderError";
  } catch (const LoaderError& e) {
    EXPECT_NE(std::string(e.what()).find("loader exited before opening"),
              std::string::npos);
    EXPECT_EQ(e.getDiagnostics(), "fake diagnostics\n");
  }

  EXPECT_EQ(TestDoubles::count(trace_, "start"), size_t(1));
  EXPECT_EQ(TestDoubles::count(trace_, "open writer"), size_t(0));
  EXPECT_EQ(TestDoubles::count(trace_, "run DELETE FROM \"t\";"), size_t(0));
  EXPECT_EQ(Trace(trace_.end() - 3, trace_.end()),
            (Trace{"terminate", "close channel", "close source"}));
}

class SqliteTableImporterTest : public ::testing::Test {
 protected:
  void SetUp() override {
    command_.executable = find_loader_executable("sqlite3");
    if (command_.executable.empty()) {
      GTEST_SKIP() << "sqlite3 is not installed";
    }
    database_ = (dir_.path() / "import.db").string();
    params_.start_exponent = 10;
  }

  // header row plus ids 1..3000; the first name holds the delimiter
  static std::string make_rows(const char delimiter) {
    const std::string d(1, delimiter);
    std::string rows = "id" + d + "name" + d + "price\n";
    rows += "1" + d + "\"first" + d + " quoted\"" + d + "0.5\n";
    for (int id = 2; id <= 3000; ++id) {
      rows += std::to_string(id) + d + "item " + std::to_string(id) + d +
              std::to_string(id) + ".25\n";
    }
    return rows;
  }

  ImportStatus import(const std::string& rows) {
    FifoChannelManager channels(dir_.path(), log_);
    SubprocessLoaderController loaders(command_, log_);
    TableImporter importer(channels, loaders, params_, log_);
    MemorySource source(rows);
    ImportJob job{source,
                  "items",
                  database_,
                  "CREATE TABLE \"items\" "
                  "(\"id\" INTEGER, \"name\" TEXT, \"price\" REAL);",
                  1};
    return importer.importTable(job);
  }

  std::string query(const std::string& sql) {
    SubprocessLoaderController loaders(command_, log_);
    return loaders.runOnce({sql}, database_);
  }

  size_t leftover_directories() const {
    size_t count = 0;
    for (boost::filesystem::directory_iterator it(dir_.path()), end; it != end; ++it) {
      count += boost::filesystem::is_directory(it->path()) ? 1 : 0;
    }
    return count;
  }

  TestHelpers::TempDirectory dir_;
  LoaderCommand command_;
  std::string database_;
  ImportParams params_;
  logger::LogSource log_;
};

TEST_F(SqliteTableImporterTest, CommaSeparatedRows) {
  const auto rows = make_rows(',');

  const auto status = import(rows);

  EXPECT_EQ(status.attempts, size_t(1));
  EXPECT_EQ(status.bytes_transferred, rows.size());
  EXPECT_TRUE(status.loader_terminated_cleanly) << status.diagnostics;
  EXPECT_EQ(query("SELECT count(*), sum(\"id\") FROM \"items\";"), "3000|4501500\n");
  EXPECT_EQ(query("SELECT \"name\" FROM \"items\" WHERE \"id\" = 1;"), "first, quoted\n");
  EXPECT_EQ(leftover_directories(), size_t(0));
}

TEST_F(SqliteTableImporterTest, TabSeparatedRows) {
  params_.delimiter = '\t';
  const auto rows = make_rows('\t');

  const auto status = import(rows);

  EXPECT_EQ(status.attempts, size_t(1));
  EXPECT_TRUE(status.loader_terminated_cleanly) << status.diagnostics;
  EXPECT_EQ(query("SELECT count(*), sum(\"id\") FROM \"items\";"), "3000|4501500\n");
  EXPECT_EQ(query("SELECT \"name\" FROM \"items\" WHERE \"id\" = 1;"),
            "first\t quoted\n");
  EXPECT_EQ(query("SELECT \"price\" FROM \"items\" WHERE \"id\" = 3000;"), "3000.25\n");
  EXPECT_EQ(leftover_directories(), size_t(0));
}

int main(int argc, char* argv[]) {
  // readers that close early must fail writes with EPIPE
  signal(SIGPIPE, SIG_IGN);
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
