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
 * @file DelimitedParserUtils.h
 * @brief Splits delimited text into rows and fields.
 */

#ifndef CSV2DB_IMPORT_DELIMITEDPARSERUTILS_H
#define CSV2DB_IMPORT_DELIMITEDPARSERUTILS_H

#include <string>
#include <vector>

#include "Import/ImportParams.h"

namespace csv2db {
namespace delimited_parser {

/**
 * @brief Finds the end of the last complete row in the given buffer.
 *
 * @param buffer               Given buffer which has the rows in csv format. (NOT OWN)
 * @param size                 Size of the buffer.
 * @param params               Dialect of the buffer.
 * @param num_rows_this_buffer Incremented for every row ending found.
 *
 * @return The position just past the last line delimiter outside quotes, or 0 if the
 * buffer does not hold a complete row.
 */
size_t find_end(const char* buffer,
                size_t size,
                const ImportParams& params,
                unsigned int& num_rows_this_buffer);

/**
 * @brief Parses the first row in the given buffer and appends its fields to row.
 *
 * Surrounding spaces and quotes are trimmed and escaped quotes are resolved. A last
 * row without a line delimiter ends at buf_end.
 *
 * @return Pointer to the beginning of the next row.
 */
const char* get_row(const char* buf,
                    const char* buf_end,
                    const ImportParams& params,
                    std::vector<std::string>& row);

}  // namespace delimited_parser
}  // namespace csv2db

#endif  // CSV2DB_IMPORT_DELIMITEDPARSERUTILS_H
