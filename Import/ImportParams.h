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
 * @file ImportParams.h
 * @brief Settings for one csv2db run.
 */

#ifndef CSV2DB_IMPORT_IMPORTPARAMS_H
#define CSV2DB_IMPORT_IMPORTPARAMS_H

#include <cstdint>
#include <iosfwd>
#include <string>
#include <vector>

#include <boost/optional.hpp>

#include "Import/TransferSession.h"

namespace csv2db {

enum class ImportHeaderRow { AUTODETECT, NO_HEADER, HAS_HEADER };

// Used by boost::program_options: "auto", "yes", "no".
std::istream& operator>>(std::istream& in, ImportHeaderRow& has_header);
std::ostream& operator<<(std::ostream& out, const ImportHeaderRow has_header);

struct ImportParams {
  std::string archive_path;
  // Without a database the tables are only described, not created.
  boost::optional<std::string> database_path;
  std::string name_filter;  // empty matches every member
  int64_t max_rows;         // rows sampled for type detection, 0 for all
  std::string loader_executable;
  std::vector<std::string> loader_arguments;
  int start_exponent;
  std::string temp_root;  // empty for the system temp directory
  ImportHeaderRow has_header;
  bool replace_existing;
  bool restart_loader_on_retry;
  // csv dialect shared by the detector and the loader
  char delimiter;
  char quote;
  char escape;
  char line_delim;
  std::string null_str;

  ImportParams()
      : max_rows(0)
      , loader_executable("sqlite3")
      , loader_arguments({"-batch", "-bail"})
      , start_exponent(kDefaultStartExponent)
      , has_header(ImportHeaderRow::AUTODETECT)
      , replace_existing(false)
      , restart_loader_on_retry(true)
      , delimiter(',')
      , quote('"')
      , escape('"')
      , line_delim('\n')
      , null_str("\\N") {}

  /**
   * @brief Rejects settings no import could run with.
   *
   * @throws ConfigurationError for a negative row cap, a chunk exponent outside
   * 1..kMaxStartExponent or a delimiter that collides with the quote or line delimiter.
   * The name filter is compiled, and rejected if invalid, by ArchiveImporter.
   */
  void validate() const;
};

}  // namespace csv2db

#endif  // CSV2DB_IMPORT_IMPORTPARAMS_H
