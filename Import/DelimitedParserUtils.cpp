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

#include "Import/DelimitedParserUtils.h"

namespace {

inline bool is_eol(const char& c, const csv2db::ImportParams& params) {
  return c == params.line_delim || c == '\n' || c == '\r';
}

inline void trim_space(const char*& field_begin, const char*& field_end) {
  while (field_begin < field_end && (*field_begin == ' ' || *field_begin == '\r')) {
    ++field_begin;
  }
  while (field_begin < field_end &&
         (*(field_end - 1) == ' ' || *(field_end - 1) == '\r')) {
    --field_end;
  }
}

inline void trim_quotes(const char*& field_begin,
                        const char*& field_end,
                        const csv2db::ImportParams& params) {
  if (field_end - field_begin > 1 && *field_begin == params.quote &&
      *(field_end - 1) == params.quote) {
    ++field_begin;
    --field_end;
  }
}

}  // namespace

namespace csv2db {
namespace delimited_parser {

size_t find_end(const char* buffer,
                size_t size,
                const ImportParams& params,
                unsigned int& num_rows_this_buffer) {
  size_t end = 0;
  const char* current = buffer;
  bool in_quote = false;
  while (current < buffer + size) {
    if (in_quote) {
      // We are in a quoted field. We have to find the ending quote.
      if (*current == params.escape && params.escape != params.quote &&
          current < buffer + size - 1 && *(current + 1) == params.quote) {
        ++current;
      } else if (*current == params.quote) {
        in_quote = false;
      }
    } else if (*current == params.quote) {
      in_quote = true;
    } else if (*current == params.line_delim) {
      end = current - buffer + 1;
      ++num_rows_this_buffer;
    }
    ++current;
  }
  return end;
}

const char* get_row(const char* buf,
                    const char* buf_end,
                    const ImportParams& params,
                    std::vector<std::string>& row) {
  const char* field = buf;
  const char* p;
  bool in_quote = false;
  bool has_escape = false;

  auto push_field = [&](const char* field_end) {
    const char* field_begin = field;
    trim_space(field_begin, field_end);
    trim_quotes(field_begin, field_end, params);
    if (!has_escape) {
      row.emplace_back(field_begin, field_end - field_begin);
      return;
    }
    std::string value;
    for (const char* c = field_begin; c < field_end; ++c) {
      if (*c == params.escape && c + 1 < field_end && *(c + 1) == params.quote) {
        ++c;
      }
      value += *c;
    }
    row.push_back(value);
  };

  for (p = buf; p < buf_end; ++p) {
    if (in_quote && *p == params.escape && p < buf_end - 1 && *(p + 1) == params.quote) {
      p++;
      has_escape = true;
    } else if (*p == params.quote) {
      in_quote = !in_quote;
    } else if (!in_quote && (*p == params.delimiter || is_eol(*p, params))) {
      push_field(p);
      field = p + 1;
      has_escape = false;
      if (is_eol(*p, params)) {
        // We are at the end of the row. Skip the line endings now.
        while (p + 1 < buf_end && is_eol(*(p + 1), params)) {
          p++;
        }
        return p + 1;
      }
    }
  }
  if (field < buf_end || !row.empty()) {
    push_field(buf_end);
  }
  return buf_end;
}

}  // namespace delimited_parser
}  // namespace csv2db
