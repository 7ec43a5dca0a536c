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
 * @file LoaderCommands.h
 * @brief Control scripts understood by the sqlite3 command-line shell.
 */

#ifndef CSV2DB_IMPORT_LOADERCOMMANDS_H
#define CSV2DB_IMPORT_LOADERCOMMANDS_H

#include <string>
#include <vector>

#include <boost/filesystem/path.hpp>

namespace csv2db {
namespace loader_commands {

constexpr char const* kQuit = ".quit";

// Quotes a dot-command argument. The shell resolves backslash escapes inside double
// quotes, so backslashes and quotes are escaped.
std::string quote_argument(const std::string& argument);

// Renders a separator as a quoted .separator argument, e.g. "," or "\t". The shell
// reads unquoted arguments literally, so "\t" unquoted would be two characters.
std::string separator_argument(const char delimiter);

/**
 * @brief Script that sets csv mode and the separators, then starts importing the
 * channel into the table. The shell blocks in .import until a writer opens the channel.
 *
 * @param skip_rows  leading rows to discard (1 when the source has a header row)
 */
std::vector<std::string> import_script(const boost::filesystem::path& channel,
                                       const std::string& table_name,
                                       const char delimiter,
                                       const size_t skip_rows);

// CREATE TABLE script, optionally dropping an existing table of the same name first.
std::vector<std::string> create_table_script(const std::string& table_name,
                                             const std::string& create_table_sql,
                                             const bool replace_existing);

std::vector<std::string> delete_rows_script(const std::string& table_name);

}  // namespace loader_commands
}  // namespace csv2db

#endif  // CSV2DB_IMPORT_LOADERCOMMANDS_H
