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
 * @file ArchiveImporter.h
 * @brief Walks the csv members of an archive and imports each into its own table.
 */

#ifndef CSV2DB_IMPORT_ARCHIVEIMPORTER_H
#define CSV2DB_IMPORT_ARCHIVEIMPORTER_H

#include <string>
#include <vector>

#include <boost/optional.hpp>
#include <boost/regex.hpp>

#include "Archive/ArchiveEntrySource.h"
#include "Import/ImportParams.h"
#include "Import/TableImporter.h"
#include "Logger/Logger.h"

namespace csv2db {

struct TableReport {
  std::string member_path;
  std::string table_name;
  std::string create_table_sql;
  boost::optional<ImportStatus> status;  // set once the rows are in the database
  std::string error;                     // empty on success

  bool failed() const { return !error.empty(); }
};

class ArchiveImporter {
 public:
  /**
   * @param importer  creates and fills the tables; without one the tables are only
   *                  described
   * @throws ConfigurationError if the name filter is not a valid regex
   */
  ArchiveImporter(const ImportParams& params,
                  TableImporter* importer,
                  const logger::LogSource& log);

  // Members whose path matches the name filter case-insensitively from its start.
  bool selected(const std::string& member_path) const;

  static bool is_csv_member(const std::string& member_path);

  /**
   * @brief Processes every selected csv member in archive order.
   *
   * A member that fails is reported and the walk moves on to the next one.
   *
   * @throws SourceError if the archive itself cannot be read
   */
  std::vector<TableReport> run();

 private:
  TableReport process(const ArchiveEntry& entry);

  const ImportParams params_;
  TableImporter* importer_;
  boost::optional<boost::regex> name_filter_;
  logger::LogSource log_;
};

}  // namespace csv2db

#endif  // CSV2DB_IMPORT_ARCHIVEIMPORTER_H
