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
 * @file csv2db.cpp
 * @brief Creates a SQLite table for every csv file in an archive and bulk loads it
 * through the sqlite3 shell.
 */

#include <signal.h>

#include <iostream>
#include <memory>
#include <string>

#include <boost/filesystem.hpp>
#include <boost/program_options.hpp>

#include "Import/ArchiveImporter.h"
#include "Import/ImportErrors.h"
#include "Import/ImportParams.h"
#include "Import/LoaderProcess.h"
#include "Import/NamedChannel.h"
#include "Import/TableImporter.h"
#include "Logger/Logger.h"

using namespace csv2db;

namespace {

char parse_delimiter(const std::string& value) {
  if (value == "\\t" || value == "tab") {
    return '\t';
  }
  if (value.size() != 1) {
    throw ConfigurationError("delimiter must be a single character, got '" + value +
                             "'");
  }
  return value[0];
}

int run_import(ImportParams& params, const logger::LogSource& log) {
  params.validate();

  std::unique_ptr<FifoChannelManager> channels;
  std::unique_ptr<SubprocessLoaderController> loaders;
  std::unique_ptr<TableImporter> importer;
  if (params.database_path) {
    LoaderCommand command;
    command.executable = find_loader_executable(params.loader_executable);
    if (command.executable.empty()) {
      throw ConfigurationError("loader '" + params.loader_executable + "' not found");
    }
    command.arguments = params.loader_arguments;
    channels = std::make_unique<FifoChannelManager>(params.temp_root, log);
    loaders = std::make_unique<SubprocessLoaderController>(command, log);
    importer = std::make_unique<TableImporter>(*channels, *loaders, params, log);
  }

  ArchiveImporter archive_importer(params, importer.get(), log);
  const auto reports = archive_importer.run();

  int failures = 0;
  for (const auto& report : reports) {
    if (report.failed()) {
      ++failures;
      continue;
    }
    if (!params.database_path) {
      std::cout << report.create_table_sql << std::endl;
    }
  }
  if (failures) {
    LOG(log, ERROR) << failures << " of " << reports.size() << " table(s) failed";
    return 1;
  }
  return 0;
}

}  // namespace

int main(int argc, char* argv[]) {
  // a loader that exits early must surface as EPIPE, not terminate csv2db
  signal(SIGPIPE, SIG_IGN);

  ImportParams params;
  std::string database_path;
  std::string delimiter{","};
  namespace po = boost::program_options;

  po::options_description desc(
      "CSV Schema Generator: extracts the top -n rows from .CSV files in a .ZIP "
      "archive.\nOptions");
  desc.add_options()("help,h", "Print help messages ");
  desc.add_options()("zip,z",
                     po::value<std::string>(&params.archive_path),
                     "Archive (or single .csv file) to read.");
  desc.add_options()("sqlite,s",
                     po::value<std::string>(&database_path),
                     "SQLite database to load into. Without it the CREATE TABLE "
                     "statements are printed.");
  desc.add_options()("filter,f",
                     po::value<std::string>(&params.name_filter),
                     "Case-insensitive regex matched from the start of member paths.");
  desc.add_options()("max,n",
                     po::value<int64_t>(&params.max_rows)->default_value(params.max_rows),
                     "Rows sampled for type detection, 0 for all.");
  desc.add_options()(
      "loader",
      po::value<std::string>(&params.loader_executable)
          ->default_value(params.loader_executable),
      "Bulk load tool, looked up on PATH unless it contains a slash.");
  desc.add_options()(
      "chunk-exponent",
      po::value<int>(&params.start_exponent)->default_value(params.start_exponent),
      "First transfer chunk size as a power of two.");
  desc.add_options()("temp-dir",
                     po::value<std::string>(&params.temp_root),
                     "Parent directory of the per-table named pipes.");
  desc.add_options()(
      "header",
      po::value<ImportHeaderRow>(&params.has_header)->default_value(params.has_header),
      "Whether csv files start with a header row: auto, yes, no.");
  desc.add_options()("replace",
                     po::bool_switch(&params.replace_existing),
                     "Drop existing tables before creating them.");
  desc.add_options()("restart-loader-on-retry",
                     po::value<bool>(&params.restart_loader_on_retry)
                         ->default_value(params.restart_loader_on_retry)
                         ->implicit_value(true),
                     "Empty the table and restart the loader before a retried transfer.");
  desc.add_options()("delimiter",
                     po::value<std::string>(&delimiter)->default_value(delimiter),
                     "Field delimiter, \\t for tab.");

  logger::LogOptions log_options(argv[0]);
  log_options.max_files_ = 0;
  log_options.severity_clog_ = logger::INFO;
  log_options.set_options();
  desc.add(log_options.get_options());

  po::variables_map vm;

  try {
    po::store(po::command_line_parser(argc, argv).options(desc).run(), vm);
    if (vm.count("help")) {
      std::cout << desc;
      return 0;
    }
    po::notify(vm);
  } catch (boost::program_options::error& e) {
    std::cerr << "Usage Error: " << e.what() << std::endl;
    return 1;
  }

  if (params.archive_path.empty()) {
    std::cout << desc;
    return 0;
  }
  if (!database_path.empty()) {
    params.database_path = database_path;
  }

  logger::init(log_options);
  logger::LogShutdown log_shutdown;
  logger::LogSource log;

  try {
    params.delimiter = parse_delimiter(delimiter);
    return run_import(params, log);
  } catch (const ConfigurationError& e) {
    std::cerr << "Usage Error: " << e.what() << std::endl;
    return 1;
  } catch (const ImportError& e) {
    LOG(log, ERROR) << e.what();
    return 1;
  }
}
