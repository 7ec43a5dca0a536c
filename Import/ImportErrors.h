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
 * @file ImportErrors.h
 * @brief Exceptions raised while importing a table through the loader.
 */

#ifndef CSV2DB_IMPORT_IMPORTERRORS_H
#define CSV2DB_IMPORT_IMPORTERRORS_H

#include <stdexcept>
#include <string>

namespace csv2db {

class ImportError : public std::runtime_error {
 public:
  ImportError(const std::string& message) : std::runtime_error(message) {}
};

// Channel or temporary directory could not be created or removed.
class ResourceError : public ImportError {
 public:
  ResourceError(const std::string& message) : ImportError(message) {}
};

// Table creation failed, or no schema could be derived for the table.
class SchemaError : public ImportError {
 public:
  SchemaError(const std::string& message) : ImportError(message) {}
};

// Every chunk size down to 2^1 bytes failed with a transport failure.
class TransferExhaustedError : public ImportError {
 public:
  TransferExhaustedError(const std::string& message, const int start_exponent)
      : ImportError(message), start_exponent_(start_exponent) {}

  int getStartExponent() const { return start_exponent_; }

 private:
  int start_exponent_;
};

// The quit sequence or the wait on the loader failed. The process has been waited on
// by the time this is thrown.
class LoaderTerminationError : public ImportError {
 public:
  LoaderTerminationError(const std::string& message) : ImportError(message) {}
};

// A loader invocation could not be spawned or exited non-zero.
class LoaderError : public ImportError {
 public:
  LoaderError(const std::string& message,
              const int exit_code,
              const std::string& diagnostics)
      : ImportError(message + (diagnostics.empty() ? "" : ": " + diagnostics))
      , exit_code_(exit_code)
      , diagnostics_(diagnostics) {}

  int getExitCode() const { return exit_code_; }
  const std::string& getDiagnostics() const { return diagnostics_; }

 private:
  int exit_code_;
  std::string diagnostics_;
};

// The reader closed its end of the channel while bytes were still unsent. Recovered by
// the transfer session's backoff and never seen by callers of TableImporter.
class TransportError : public ImportError {
 public:
  TransportError(const std::string& message) : ImportError(message) {}
};

// The source stream failed or ended before its declared length.
class SourceError : public ImportError {
 public:
  SourceError(const std::string& message) : ImportError(message) {}
};

class ConfigurationError : public ImportError {
 public:
  ConfigurationError(const std::string& message) : ImportError(message) {}
};

}  // namespace csv2db

#endif  // CSV2DB_IMPORT_IMPORTERRORS_H
