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

#include <exception>

#include "Import/ImportErrors.h"
#include "Import/LoaderCommands.h"
#include "Import/TransferSession.h"
#include "Shared/measure.h"
#include "Shared/scope.h"

namespace csv2db {

TableImporter::TableImporter(ChannelManager& channels,
                             LoaderController& loaders,
                             const ImportParams& params,
                             const logger::LogSource& log)
    : channels_(channels)
    , loaders_(loaders)
    , start_exponent_(params.start_exponent)
    , restart_loader_on_retry_(params.restart_loader_on_retry)
    , replace_existing_(params.replace_existing)
    , delimiter_(params.delimiter)
    , log_(log.tag("Component", "importer")) {}

void TableImporter::restartLoader(std::unique_ptr<LoaderProcess>& loader,
                                  const std::vector<std::string>& import_script,
                                  const ImportJob& job,
                                  const logger::LogSource& log) {
  try {
    loader->terminate();
  } catch (const LoaderTerminationError& e) {
    LOG(log, WARNING) << "loader of the failed attempt: " << e.what();
  }
  loaders_.runOnce(loader_commands::delete_rows_script(job.table_name), job.database);
  LOG(log, INFO) << "discarded rows of the failed attempt";
  loader = loaders_.start(import_script, job.database);
}

ImportStatus TableImporter::importTable(ImportJob& job) {
  const auto clock_begin = timer_start();
  const auto log = log_.tag("Table", job.table_name);

  ScopeGuard release_source = [&job, &log] {
    if (job.source.isOpen()) {
      job.source.close();
      LOG(log, DEBUG1) << "source closed";
    }
  };

  try {
    loaders_.runOnce(loader_commands::create_table_script(
                         job.table_name, job.create_table_sql, replace_existing_),
                     job.database);
  } catch (const LoaderError& e) {
    throw SchemaError("failed to create table " + job.table_name + ": " + e.what());
  }
  LOG(log, INFO) << "created table in " << job.database;

  ScopedChannel channel(channels_, job.table_name, log);
  const auto import_script = loader_commands::import_script(
      channel.get().path, job.table_name, delimiter_, job.skip_rows);
  auto loader = loaders_.start(import_script, job.database);
  LOG(log, DEBUG1) << "loader waiting on " << channel.get().path;

  ImportStatus status;
  status.table_name = job.table_name;
  std::exception_ptr transfer_error;
  try {
    TransferSession session(
        job.source,
        [this, &channel, &loader, &log] {
          try {
            return channels_.openWriter(channel.get(),
                                        [&loader] { return loader->running(); });
          } catch (const TransportError&) {
            if (loader->running()) {
              throw;
            }
            // the loader rejected its script, which no smaller chunk or new loader fixes
            try {
              loader->terminate();
            } catch (const LoaderTerminationError& e) {
              LOG(log, WARNING) << e.what();
            }
            throw LoaderError(
                "loader exited before opening " + channel.get().path.string(),
                -1,
                loader->diagnostics());
          }
        },
        log,
        start_exponent_);
    if (restart_loader_on_retry_) {
      session.setRetryHook([this, &loader, &import_script, &job, &log](
                               const TransferAttempt&) {
        restartLoader(loader, import_script, job, log);
      });
    }
    const auto result = session.run();
    status.bytes_transferred = result.bytes_transferred;
    status.attempts = result.attempts.size();
    status.failed_attempts = result.failedAttempts();
    status.exponent = result.exponent;
  } catch (const std::exception&) {
    transfer_error = std::current_exception();
  }

  // the loader holds the channel open, so it goes first
  status.loader_terminated_cleanly = true;
  try {
    loader->terminate();
  } catch (const LoaderTerminationError& e) {
    status.loader_terminated_cleanly = false;
    LOG(log, ERROR) << e.what();
  }
  status.diagnostics = loader->diagnostics();

  try {
    channel.close();
  } catch (const ResourceError& e) {
    LOG(log, ERROR) << e.what();
  }

  release_source.dismiss();
  if (job.source.isOpen()) {
    job.source.close();
    LOG(log, DEBUG1) << "source closed";
  }

  if (transfer_error) {
    std::rethrow_exception(transfer_error);
  }
  status.elapsed_ms = timer_stop(clock_begin);
  LOG(log, INFO) << "imported " << status.bytes_transferred << " bytes in "
                 << status.elapsed_ms << " ms";
  return status;
}

}  // namespace csv2db
