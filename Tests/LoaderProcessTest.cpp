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

#include "Import/LoaderProcess.h"

#include <signal.h>
#include <thread>

#include <gtest/gtest.h>

#include <boost/filesystem.hpp>

#include "Import/ImportErrors.h"
#include "Import/LoaderCommands.h"
#include "LogCaptureTestHelper.h"
#include "TestHelpers.h"

using namespace csv2db;

namespace {

// The database argument reaches the script as $1.
LoaderCommand shell_loader(const std::string& script) {
  LoaderCommand command;
  command.executable = "/bin/sh";
  command.arguments = {"-c", script, "fake-loader"};
  return command;
}

// Appends every control line to the database file until .quit arrives.
constexpr char const* kRecordingLoader =
    "while IFS= read -r line; do printf '%s\\n' \"$line\" >> \"$1\"; "
    "[ \"$line\" = .quit ] && exit 0; done; exit 0";

}  // namespace

class LoaderProcessTest : public ::testing::Test {
 protected:
  TestHelpers::TempDirectory temp_;
  logger::LogSource log_;

  std::string database() const { return (temp_.path() / "test.db").string(); }
};

TEST_F(LoaderProcessTest, RunOnceFeedsScriptAndReturnsStdout) {
  SubprocessLoaderController loaders(shell_loader("tee \"$1\""), log_);

  const auto output =
      loaders.runOnce({"CREATE TABLE \"t\" (\"a\" INTEGER);"}, database());

  EXPECT_EQ(output, "CREATE TABLE \"t\" (\"a\" INTEGER);\n");
  EXPECT_EQ(TestHelpers::read_file(database()), output);
}

TEST_F(LoaderProcessTest, RunOnceNonZeroExitIsLoaderError) {
  SubprocessLoaderController loaders(
      shell_loader("cat > /dev/null; echo 'Error: near \"CREAT\": syntax error' >&2; exit 3"),
      log_);

  try {
    loaders.runOnce({"CREAT TABLE t (a);"}, database());
    FAIL() << "expected LoaderError";
  } catch (const LoaderError& e) {
    EXPECT_EQ(e.getExitCode(), 3);
    EXPECT_NE(e.getDiagnostics().find("syntax error"), std::string::npos);
  }
}

TEST_F(LoaderProcessTest, SpawnFailureIsLoaderError) {
  LoaderCommand command;
  command.executable = (temp_.path() / "no-such-loader").string();
  SubprocessLoaderController loaders(command, log_);

  EXPECT_THROW(loaders.runOnce({".tables"}, database()), LoaderError);
  EXPECT_THROW(loaders.start({".tables"}, database()), LoaderError);
}

TEST_F(LoaderProcessTest, TerminateSendsQuitAndWaits) {
  SubprocessLoaderController loaders(shell_loader(kRecordingLoader), log_);
  const auto script = loader_commands::import_script("/tmp/fifo", "t", ',', 1);

  auto loader = loaders.start(script, database());
  EXPECT_EQ(loader->state(), LoaderState::RUNNING);
  EXPECT_TRUE(loader->running());

  loader->terminate();

  EXPECT_EQ(loader->state(), LoaderState::EXITED);
  EXPECT_FALSE(loader->running());
  EXPECT_EQ(TestHelpers::read_file(database()),
            ".mode csv\n"
            ".separator \",\" \"\\n\"\n"
            ".import --skip 1 \"/tmp/fifo\" \"t\"\n"
            ".quit\n");
  EXPECT_NO_THROW(loader->terminate());
}

TEST_F(LoaderProcessTest, NonZeroExitOnQuitIsTerminationError) {
  SubprocessLoaderController loaders(
      shell_loader("while read line; do [ \"$line\" = .quit ] && exit 4; done"), log_);
  auto loader = loaders.start({".mode csv"}, database());

  EXPECT_THROW(loader->terminate(), LoaderTerminationError);
  // reaped all the same
  EXPECT_EQ(loader->state(), LoaderState::EXITED);
  EXPECT_NO_THROW(loader->terminate());
}

TEST_F(LoaderProcessTest, LoaderThatAlreadyExitedFailsTermination) {
  SubprocessLoaderController loaders(shell_loader("exit 0"), log_);
  auto loader = loaders.start({}, database());
  while (loader->running()) {
    std::this_thread::sleep_for(std::chrono::milliseconds(1));
  }

  EXPECT_THROW(loader->terminate(), LoaderTerminationError);
  EXPECT_EQ(loader->state(), LoaderState::EXITED);
}

TEST_F(LoaderProcessTest, DestroyingHandleTerminatesLoader) {
  SubprocessLoaderController loaders(shell_loader(kRecordingLoader), log_);
  {
    auto loader = loaders.start({".mode csv"}, database());
  }
  EXPECT_EQ(TestHelpers::read_file(database()), ".mode csv\n.quit\n");
}

TEST_F(LoaderProcessTest, DestroyingHandleLogsTerminationError) {
  SubprocessLoaderController loaders(
      shell_loader("while read line; do [ \"$line\" = .quit ] && exit 5; done"), log_);
  LogCapture capture;
  {
    auto loader = loaders.start({".mode csv"}, database());
  }
  EXPECT_TRUE(capture.contains("did not terminate cleanly"));
}

TEST_F(LoaderProcessTest, ChattyLoaderDoesNotBlock) {
  // far more than a pipe buffer on both streams before the control input is read
  SubprocessLoaderController loaders(
      shell_loader("i=0; while [ $i -lt 4000 ]; do "
                   "echo 'stdout line that keeps the pipe busy'; "
                   "echo 'stderr line that keeps the pipe busy' >&2; i=$((i+1)); done; "
                   "while read line; do [ \"$line\" = .quit ] && exit 0; done"),
      log_);
  auto loader = loaders.start({".mode csv"}, database());

  loader->terminate();

  const auto diagnostics = loader->diagnostics();
  EXPECT_GT(diagnostics.size(), size_t(2 * 4000 * 30));
  EXPECT_NE(diagnostics.find("stderr line"), std::string::npos);
}

TEST_F(LoaderProcessTest, FindsLoaderExecutable) {
  EXPECT_FALSE(find_loader_executable("sh").empty());
  EXPECT_EQ(find_loader_executable("/bin/sh"), boost::filesystem::path("/bin/sh"));
  EXPECT_TRUE(find_loader_executable("csv2db-no-such-loader").empty());
  EXPECT_TRUE(find_loader_executable((temp_.path() / "missing").string()).empty());
  EXPECT_TRUE(find_loader_executable("").empty());
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
