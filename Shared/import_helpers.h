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

#ifndef CSV2DB_SHARED_IMPORT_HELPERS_H
#define CSV2DB_SHARED_IMPORT_HELPERS_H

#include <set>
#include <string>

#include <boost/algorithm/string.hpp>
#include <boost/filesystem/path.hpp>
#include <boost/regex.hpp>

namespace csv2db {
namespace ImportHelpers {

inline bool is_reserved_name(const std::string& name) {
  static const std::set<std::string> reserved_keywords{
      "ABORT",    "ALTER",    "AND",       "AS",        "BETWEEN", "BY",
      "CASE",     "CHECK",    "COLUMN",    "COMMIT",    "CREATE",  "CROSS",
      "DEFAULT",  "DELETE",   "DISTINCT",  "DROP",      "ELSE",    "END",
      "EXISTS",   "FOREIGN",  "FROM",      "GROUP",     "HAVING",  "IN",
      "INDEX",    "INSERT",   "INTO",      "IS",        "JOIN",    "KEY",
      "LIMIT",    "NOT",      "NULL",      "ON",        "OR",      "ORDER",
      "PRIMARY",  "REFERENCES", "REPLACE", "SELECT",    "SET",     "TABLE",
      "THEN",     "TO",       "TRANSACTION", "UNION",   "UNIQUE",  "UPDATE",
      "USING",    "VALUES",   "VIEW",      "WHEN",      "WHERE",   "WITH"};
  return reserved_keywords.find(boost::to_upper_copy<std::string>(name)) !=
         reserved_keywords.end();
}

inline std::string sanitize_name(const std::string& name) {
  boost::regex invalid_chars{R"([^0-9a-z_])",
                             boost::regex::extended | boost::regex::icase};
  std::string sanitized_name = boost::regex_replace(name, invalid_chars, "_");
  boost::regex starts_with_digit{R"(^[0-9].*)"};
  if (sanitized_name.empty() || boost::regex_match(sanitized_name, starts_with_digit)) {
    sanitized_name = "_" + sanitized_name;
  }
  if (is_reserved_name(sanitized_name)) {
    sanitized_name += "_";
  }
  return sanitized_name;
}

// "dir/orders.2021.csv" names the table "orders".
inline std::string table_name_from_path(const std::string& member_path) {
  const auto file_name = boost::filesystem::path(member_path).filename().string();
  return sanitize_name(file_name.substr(0, file_name.find('.')));
}

inline std::string quote_identifier(const std::string& identifier) {
  return "\"" + boost::replace_all_copy(identifier, "\"", "\"\"") + "\"";
}

inline bool is_null_datum(const std::string& datum, const std::string& null_indicator) {
  return datum == null_indicator || datum == "NULL" || datum == "\\N";
}

}  // namespace ImportHelpers
}  // namespace csv2db

#endif  // CSV2DB_SHARED_IMPORT_HELPERS_H
