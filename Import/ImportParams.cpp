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

#include "Import/ImportParams.h"

#include <istream>
#include <ostream>

#include <boost/algorithm/string.hpp>

#include "Import/ImportErrors.h"

namespace csv2db {

std::istream& operator>>(std::istream& in, ImportHeaderRow& has_header) {
  std::string token;
  in >> token;
  boost::algorithm::to_lower(token);
  if (token == "auto") {
    has_header = ImportHeaderRow::AUTODETECT;
  } else if (token == "yes" || token == "true") {
    has_header = ImportHeaderRow::HAS_HEADER;
  } else if (token == "no" || token == "false") {
    has_header = ImportHeaderRow::NO_HEADER;
  } else {
    in.setstate(std::ios_base::failbit);
  }
  return in;
}

std::ostream& operator<<(std::ostream& out, const ImportHeaderRow has_header) {
  switch (has_header) {
    case ImportHeaderRow::AUTODETECT:
      return out << "auto";
    case ImportHeaderRow::HAS_HEADER:
      return out << "yes";
    case ImportHeaderRow::NO_HEADER:
      return out << "no";
  }
  return out;
}

void ImportParams::validate() const {
  if (max_rows < 0) {
    throw ConfigurationError("row cap must not be negative, got " +
                             std::to_string(max_rows));
  }
  validate_start_exponent(start_exponent);
  if (delimiter == quote || delimiter == line_delim || delimiter == '\0') {
    throw ConfigurationError("invalid field delimiter '" + std::string(1, delimiter) +
                             "'");
  }
}

}  // namespace csv2db
