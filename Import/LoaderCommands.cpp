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

#include "Import/LoaderCommands.h"

#include <cctype>

#include "Shared/import_helpers.h"

namespace csv2db {
namespace loader_commands {

std::string quote_argument(const std::string& argument) {
  std::string quoted{"\""};
  for (const auto c : argument) {
    if ('"' == c || '\\' == c) {
      quoted += '\\';
    }
    quoted += c;
  }
  return quoted + "\"";
}

std::string separator_argument(const char delimiter) {
  switch (delimiter) {
    case '\t':
      return "\"\\t\"";
    case '\n':
      return "\"\\n\"";
    default:
      return quote_argument(std::string(1, delimiter));
  }
}

std::vector<std::string> import_script(const boost::filesystem::path& channel,
                                       const std::string& table_name,
                                       const char delimiter,
                                       const size_t skip_rows) {
  std::string import_command{".import "};
  if (skip_rows > 0) {
    import_command += "--skip " + std::to_string(skip_rows) + " ";
  }
  import_command += quote_argument(channel.string()) + " " + quote_argument(table_name);
  return {".mode csv",
          ".separator " + separator_argument(delimiter) + " " + separator_argument('\n'),
          import_command};
}

std::vector<std::string> create_table_script(const std::string& table_name,
                                             const std::string& create_table_sql,
                                             const bool replace_existing) {
  std::vector<std::string> script;
  if (replace_existing) {
    script.push_back("DROP TABLE IF EXISTS " +
                     ImportHelpers::quote_identifier(table_name) + ";");
  }
  auto statement = create_table_sql;
  while (!statement.empty() &&
         std::isspace(static_cast<unsigned char>(statement.back()))) {
    statement.pop_back();
  }
  if (statement.empty() || statement.back() != ';') {
    statement += ';';
  }
  script.push_back(statement);
  return script;
}

std::vector<std::string> delete_rows_script(const std::string& table_name) {
  return {"DELETE FROM " + ImportHelpers::quote_identifier(table_name) + ";"};
}

}  // namespace loader_commands
}  // namespace csv2db
