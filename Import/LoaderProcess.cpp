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

#include <mutex>
#include <ostream>
#include <system_error>
#include <thread>

#include <boost/algorithm/string/join.hpp>
#include <boost/filesystem.hpp>
#include <boost/process.hpp>

#include "Import/ImportErrors.h"
#include "Import/LoaderCommands.h"

namespace bp = boost::process;

namespace csv2db {

std::ostream& operator<<(std::ostream& os, const LoaderState state) {
  switch (state) {
    case LoaderState::NOT_STARTED:
      return os << "NOT_STARTED";
    case LoaderState::RUNNING:
      return os << "RUNNING";
    case LoaderState::TERMINATING:
      return os << "TERMINATING";
    case LoaderState::EXITED:
      return os << "EXITED";
  }
  return os;
}

namespace {

class SubprocessLoader : public LoaderProcess {
 public:
  SubprocessLoader(const LoaderCommand& command,
                   const std::string& database,
                   const logger::LogSource& log)
      : command_(command), database_(database), log_(log) {}

  ~SubprocessLoader() override {
    if (state_ != LoaderState::EXITED) {
      try {
        terminate();
      } catch (const LoaderTerminationError& e) {
        LOG(log_, ERROR) << e.what();
      }
    }
  }

  void spawn() {
    CHECK(state_ == LoaderState::NOT_STARTED);
    auto arguments = command_.arguments;
    arguments.push_back(database_);
    LOG(log_, DEBUG1) << "spawning " << command_.executable << " "
                      << boost::algorithm::join(arguments, " ");
    std::error_code ec;
    child_ = bp::child(bp::exe = command_.executable.string(),
                       bp::args = arguments,
                       bp::std_in < in_,
                       bp::std_out > out_,
                       bp::std_err > err_,
                       ec);
    if (ec) {
      state_ = LoaderState::EXITED;
      throw LoaderError(
          "failed to spawn " + command_.executable.string(), -1, ec.message());
    }
    state_ = LoaderState::RUNNING;
    out_reader_ = std::thread([this] { drain(out_, "stdout", out_text_); });
    err_reader_ = std::thread([this] { drain(err_, "stderr", err_text_); });
  }

  // Writes the lines to the control input. Returns false once the input is broken.
  bool send(const std::vector<std::string>& lines) {
    for (const auto& line : lines) {
      LOG(log_, DEBUG2) << "loader <- " << line;
      in_ << line << '\n';
    }
    in_.flush();
    return in_.good();
  }

  // Closes the control input, optionally after the quit command, and reaps the process.
  // Returns the exit code, or -1 if the wait failed. Problems are appended to errors.
  int closeAndWait(const bool send_quit, std::string& errors) {
    state_ = LoaderState::TERMINATING;
    if (send_quit && in_.good()) {
      in_ << loader_commands::kQuit << '\n';
    }
    in_.flush();
    if (!in_.good()) {
      errors = "control input is broken";
    }
    in_.pipe().close();

    std::error_code ec;
    child_.wait(ec);
    if (out_reader_.joinable()) {
      out_reader_.join();
    }
    if (err_reader_.joinable()) {
      err_reader_.join();
    }
    state_ = LoaderState::EXITED;
    if (ec) {
      errors +=
          (errors.empty() ? "" : "; ") + std::string("wait failed: ") + ec.message();
      return -1;
    }
    const int exit_code = child_.exit_code();
    if (exit_code != 0) {
      errors += (errors.empty() ? "" : "; ") + std::string("exit code ") +
                std::to_string(exit_code);
    }
    return exit_code;
  }

  LoaderState state() const override { return state_; }

  bool running() override {
    if (state_ != LoaderState::RUNNING) {
      return false;
    }
    std::error_code ec;
    const bool alive = child_.running(ec);
    return alive && !ec;
  }

  void terminate() override {
    if (LoaderState::EXITED == state_) {
      return;
    }
    if (LoaderState::NOT_STARTED == state_) {
      state_ = LoaderState::EXITED;
      return;
    }
    LOG(log_, DEBUG1) << "loader .quit/flush/close";
    std::string errors;
    closeAndWait(true, errors);
    LOG(log_, DEBUG1) << "loader .quit/flush/close done";
    if (!errors.empty()) {
      const auto diagnostics_text = diagnostics();
      throw LoaderTerminationError(
          command_.executable.filename().string() + " did not terminate cleanly: " +
          errors + (diagnostics_text.empty() ? "" : ": " + diagnostics_text));
    }
  }

  std::string diagnostics() const override {
    std::lock_guard<std::mutex> lock(text_mutex_);
    return out_text_ + err_text_;
  }

  std::string standardOutput() const {
    std::lock_guard<std::mutex> lock(text_mutex_);
    return out_text_;
  }

 private:
  void drain(bp::ipstream& stream, char const* name, std::string& text) {
    std::string line;
    while (std::getline(stream, line)) {
      LOG(log_, DEBUG1) << "loader " << name << ": " << line;
      std::lock_guard<std::mutex> lock(text_mutex_);
      text += line + '\n';
    }
  }

  const LoaderCommand command_;
  const std::string database_;
  logger::LogSource log_;
  LoaderState state_{LoaderState::NOT_STARTED};
  bp::opstream in_;
  bp::ipstream out_;
  bp::ipstream err_;
  bp::child child_;
  std::thread out_reader_;
  std::thread err_reader_;
  mutable std::mutex text_mutex_;
  std::string out_text_;
  std::string err_text_;
};

}  // namespace

boost::filesystem::path find_loader_executable(const std::string& name) {
  if (name.empty()) {
    return {};
  }
  if (name.find('/') != std::string::npos) {
    boost::system::error_code ec;
    return boost::filesystem::is_regular_file(name, ec) ? boost::filesystem::path(name)
                                                        : boost::filesystem::path();
  }
  return bp::search_path(name);
}

SubprocessLoaderController::SubprocessLoaderController(const LoaderCommand& command,
                                                       const logger::LogSource& log)
    : command_(command), log_(log.tag("Component", "loader")) {}

std::string SubprocessLoaderController::runOnce(const std::vector<std::string>& script,
                                                const std::string& database) {
  SubprocessLoader loader(command_, database, log_);
  loader.spawn();
  loader.send(script);
  std::string errors;
  const int exit_code = loader.closeAndWait(false, errors);
  if (!errors.empty()) {
    throw LoaderError(command_.executable.filename().string() + " failed running '" +
                          boost::algorithm::join(script, " ") + "' (" + errors + ")",
                      exit_code,
                      loader.diagnostics());
  }
  return loader.standardOutput();
}

std::unique_ptr<LoaderProcess> SubprocessLoaderController::start(
    const std::vector<std::string>& script,
    const std::string& database) {
  auto loader = std::make_unique<SubprocessLoader>(command_, database, log_);
  loader->spawn();
  if (!loader->send(script)) {
    std::string errors;
    const int exit_code = loader->closeAndWait(false, errors);
    throw LoaderError(
        command_.executable.filename().string() + " rejected its control script (" +
            errors + ")",
        exit_code,
        loader->diagnostics());
  }
  LOG(log_, DEBUG1) << "started blocking import: " << boost::algorithm::join(script, " ");
  return loader;
}

}  // namespace csv2db
