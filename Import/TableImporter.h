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
 * @file TableImporter.h
 * @brief Creates one table and streams its rows into it through a loader process.
 */

#ifndef CSV2DB_IMPORT_TABLEIMPORTER_H
#define CSV2DB_IMPORT_TABLEIMPORTER_H

#include <cstdint>
#include <memory>
#include <string>

#include "Import/ImportParams.h"
#include "Import/LoaderProcess.h"
#include "Import/NamedChannel.h"
#include "Import/SourceStream.h"
#include "Logger/Logger.h"

namespace csv2db {

struct ImportJob {
  SourceStream& source;
  std::string table_name;
  std::string database;
  std::string create_table_sql;  // single line
  size_t skip_rows;              // 1 when the source starts with a header row
};

struct ImportStatus {
  std::string table_name;
  size_t bytes_transferred{0};
  size_t attempts{0};
  size_t failed_attempts{0};
  int exponent{0};
  int64_t elapsed_ms{0};
  bool loader_terminated_cleanly{false};
  std::string diagnostics;
};

class TableImporter {
 public:
  TableImporter(ChannelManager& channels,
                LoaderController& loaders,
                const ImportParams& params,
                const logger::LogSource& log);

  /**
   * @brief Creates the table, then transfers the job's source into it.
   *
   * Whatever happens, the streaming loader is terminated first, then the channel is
   * removed, then the source is closed. Failures of the first two are logged and never
   * replace the outcome of the transfer.
   *
   * @throws SchemaError if the table could not be created
   * @throws TransferExhaustedError if no chunk size got the data through
   * @throws ResourceError if the channel could not be created
   * @throws LoaderError if the streaming loader could not be started, exited before
   * opening the channel, or, while retrying, the rows of the failed attempt could not be
   * discarded or its replacement could not be started
   * @throws SourceError if the source could not be read to its end
   */
  ImportStatus importTable(ImportJob& job);

 private:
  // Replaces the loader after a failed attempt so the next attempt starts on an empty
  // table with a reader that opens the channel again.
  void restartLoader(std::unique_ptr<LoaderProcess>& loader,
                     const std::vector<std::string>& import_script,
                     const ImportJob& job,
                     const logger::LogSource& log);

  ChannelManager& channels_;
  LoaderController& loaders_;
  const int start_exponent_;
  const bool restart_loader_on_retry_;
  const bool replace_existing_;
  const char delimiter_;
  logger::LogSource log_;
};

}  // namespace csv2db

#endif  // CSV2DB_IMPORT_TABLEIMPORTER_H
