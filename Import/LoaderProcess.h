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

/*
 * @file LoaderProcess.h
 * @brief Spawns and drives the external bulk-load tool over its control input.
 */

#ifndef CSV2DB_IMPORT_LOADERPROCESS_H
#define CSV2DB_IMPORT_LOADERPROCESS_H

#include <memory>
#include <string>
#include <vector>

#include <boost/filesystem/path.hpp>

#include "Logger/Logger.h"

namespace csv2db {

enum class LoaderState { NOT_STARTED, RUNNING, TERMINATING, EXITED };

std::ostream& operator<<(std::ostream& os, const LoaderState state);

// Handle to a long-lived loader that is importing from a channel.
class LoaderProcess {
 public:
  virtual ~LoaderProcess() {}

  virtual LoaderState state() const = 0;

  // True while the process has not exited. Polled while waiting for the loader to
  // open the channel.
  virtual bool running() = 0;

  /**
   * @brief Sends the quit command, closes the control input and waits for exit.
   *
   * Moves through TERMINATING to EXITED. Calling it again once EXITED is a no-op.
   *
   * @throws LoaderTerminationError once the process has been waited on, if the control
   * input was already broken, the wait failed, or the exit code was non-zero.
   */
  virtual void terminate() = 0;

  // stdout and stderr text captured so far.
  virtual std::string diagnostics() const = 0;
};

class LoaderController {
 public:
  virtual ~LoaderController() {}

  /**
   * @brief Runs the loader against database, feeds it script and waits for it to exit.
   *
   * @return captured stdout
   * @throws LoaderError if it cannot be spawned or exits non-zero
   */
  virtual std::string runOnce(const std::vector<std::string>& script,
                              const std::string& database) = 0;

  /**
   * @brief Spawns the loader against database and writes script to its control input,
   * which stays open until the returned handle is terminated.
   *
   * @throws LoaderError if it cannot be spawned or rejects the script
   */
  virtual std::unique_ptr<LoaderProcess> start(const std::vector<std::string>& script,
                                               const std::string& database) = 0;
};

struct LoaderCommand {
  boost::filesystem::path executable;
  std::vector<std::string> arguments{"-batch", "-bail"};
};

/**
 * @brief Resolves the loader executable. A name without a slash is looked up on PATH.
 *
 * @return an empty path if nothing was found
 */
boost::filesystem::path find_loader_executable(const std::string& name);

class SubprocessLoaderController : public LoaderController {
 public:
  SubprocessLoaderController(const LoaderCommand& command, const logger::LogSource& log);

  std::string runOnce(const std::vector<std::string>& script,
                      const std::string& database) override;
  std::unique_ptr<LoaderProcess> start(const std::vector<std::string>& script,
                                       const std::string& database) override;

 private:
  const LoaderCommand command_;
  logger::LogSource log_;
};

}  // namespace csv2db

#endif  // CSV2DB_IMPORT_LOADERPROCESS_H
