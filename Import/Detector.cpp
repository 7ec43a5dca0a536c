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

#include "Import/Detector.h"

#include <algorithm>
#include <ostream>
#include <set>
#include <sstream>

#include <boost/lexical_cast.hpp>

#include "Import/DelimitedParserUtils.h"
#include "Import/ImportErrors.h"
#include "Shared/import_helpers.h"

namespace csv2db {

namespace {

constexpr size_t kSampleBlockSize = 1 << 20;

template <class T>
bool try_cast(const std::string& str) {
  try {
    boost::lexical_cast<T>(str);
  } catch (const boost::bad_lexical_cast& e) {
    return false;
  }
  return true;
}

}  // namespace

std::ostream& operator<<(std::ostream& os, const ColumnAffinity affinity) {
  switch (affinity) {
    case ColumnAffinity::INTEGER:
      return os << "INTEGER";
    case ColumnAffinity::REAL:
      return os << "REAL";
    case ColumnAffinity::TEXT:
      return os << "TEXT";
  }
  return os;
}

Detector::Detector(SourceStream& source,
                   const std::string& table_name,
                   const ImportParams& params,
                   const logger::LogSource& log)
    : table_name_(table_name)
    , params_(params)
    , log_(log.tag("Component", "detector").tag("Table", table_name)) {
  read_sample(source);
  if (raw_rows_.empty()) {
    throw SchemaError("No rows found in: " + table_name_);
  }

  switch (params_.has_header) {
    case ImportHeaderRow::HAS_HEADER:
      has_headers_ = true;
      break;
    case ImportHeaderRow::NO_HEADER:
      has_headers_ = false;
      break;
    case ImportHeaderRow::AUTODETECT:
      if (raw_rows_.size() > 1) {
        has_headers_ = detect_headers(
            detect_column_types(raw_rows_.front()),
            find_best_affinities(raw_rows_.begin() + 1, raw_rows_.end()));
      }
      break;
  }
  best_affinities_ = has_headers_
                         ? find_best_affinities(raw_rows_.begin() + 1, raw_rows_.end())
                         : find_best_affinities(raw_rows_.begin(), raw_rows_.end());
  headers_ = make_headers();
  LOG(log_, DEBUG1) << "sampled " << raw_rows_.size() << " rows, "
                    << best_affinities_.size() << " columns, header row: "
                    << (has_headers_ ? "yes" : "no");
}

void Detector::read_sample(SourceStream& source) {
  source.rewind();
  const size_t row_limit =
      params_.max_rows > 0 ? static_cast<size_t>(params_.max_rows) + 1 : 0;
  std::vector<char> block(kSampleBlockSize);
  std::string pending;
  bool eof = false;

  while (true) {
    size_t parse_end = pending.size();
    if (!eof) {
      unsigned int num_rows = 0;
      parse_end =
          delimited_parser::find_end(pending.data(), pending.size(), params_, num_rows);
    }
    const char* p = pending.data();
    const char* end = pending.data() + parse_end;
    while (p < end) {
      std::vector<std::string> row;
      p = delimited_parser::get_row(p, end, params_, row);
      // blank lines
      if (row.empty() || (row.size() == 1 && row.front().empty())) {
        continue;
      }
      raw_rows_.push_back(std::move(row));
      if (row_limit && raw_rows_.size() >= row_limit) {
        return;
      }
    }
    pending.erase(0, parse_end);
    if (eof) {
      return;
    }
    const auto nread = source.read(block.data(), block.size());
    if (0 == nread) {
      eof = true;
    } else {
      pending.append(block.data(), nread);
    }
  }
}

ColumnAffinity Detector::detect_affinity(const std::string& str) {
  ColumnAffinity type = ColumnAffinity::TEXT;
  if (try_cast<double>(str)) {
    type = ColumnAffinity::REAL;
    if (try_cast<int64_t>(str)) {
      type = ColumnAffinity::INTEGER;
    }
  }
  return type;
}

std::vector<ColumnAffinity> Detector::detect_column_types(
    const std::vector<std::string>& row) {
  std::vector<ColumnAffinity> types(row.size());
  for (size_t i = 0; i < row.size(); i++) {
    types[i] = detect_affinity(row[i]);
  }
  return types;
}

bool Detector::more_restrictive_affinity(const ColumnAffinity a, const ColumnAffinity b) {
  // the enum is ordered most to least restrictive
  return static_cast<int>(b) < static_cast<int>(a);
}

std::vector<ColumnAffinity> Detector::find_best_affinities(
    std::vector<std::vector<std::string>>::const_iterator row_begin,
    std::vector<std::vector<std::string>>::const_iterator row_end) const {
  size_t num_cols = raw_rows_.front().size();
  std::vector<ColumnAffinity> best_types(num_cols, ColumnAffinity::INTEGER);
  std::vector<size_t> non_null_col_counts(num_cols, 0);
  for (auto row = row_begin; row != row_end; row++) {
    while (best_types.size() < row->size()) {
      best_types.push_back(ColumnAffinity::INTEGER);
      non_null_col_counts.push_back(0);
    }
    for (size_t col_idx = 0; col_idx < row->size(); col_idx++) {
      // do not count nulls
      if (row->at(col_idx).empty() ||
          ImportHelpers::is_null_datum(row->at(col_idx), params_.null_str)) {
        continue;
      }
      const auto t = detect_affinity(row->at(col_idx));
      non_null_col_counts[col_idx]++;
      if (!more_restrictive_affinity(best_types[col_idx], t)) {
        best_types[col_idx] = t;
      }
    }
  }
  for (size_t col_idx = 0; col_idx < best_types.size(); col_idx++) {
    // if we don't have any non-null values for this column make it text to be
    // safe b/c that is least restrictive type
    if (non_null_col_counts[col_idx] == 0) {
      best_types[col_idx] = ColumnAffinity::TEXT;
    }
  }
  return best_types;
}

// detect_headers returns true if:
// - all elements of the first argument are TEXT
// - there is at least one instance where tail_types is more restrictive than head_types
// (ie, not TEXT)
bool Detector::detect_headers(const std::vector<ColumnAffinity>& head_types,
                              const std::vector<ColumnAffinity>& tail_types) {
  if (head_types.size() != tail_types.size()) {
    return false;
  }
  bool has_headers = false;
  for (size_t col_idx = 0; col_idx < tail_types.size(); col_idx++) {
    if (head_types[col_idx] != ColumnAffinity::TEXT) {
      return false;
    }
    has_headers = has_headers || tail_types[col_idx] != ColumnAffinity::TEXT;
  }
  return has_headers;
}

std::vector<std::string> Detector::make_headers() const {
  std::vector<std::string> headers(best_affinities_.size());
  std::set<std::string> seen;
  for (size_t i = 0; i < best_affinities_.size(); i++) {
    std::string base_name = "column_" + std::to_string(i + 1);
    if (has_headers_ && i < raw_rows_.front().size() && !raw_rows_.front()[i].empty()) {
      base_name = ImportHelpers::sanitize_name(raw_rows_.front()[i]);
    }
    // sqlite compares column names case-insensitively
    auto name = base_name;
    auto key = boost::algorithm::to_lower_copy(name);
    for (size_t suffix = 2; seen.count(key); ++suffix) {
      name = base_name + "_" + std::to_string(suffix);
      key = boost::algorithm::to_lower_copy(name);
    }
    seen.insert(key);
    headers[i] = name;
  }
  return headers;
}

std::string Detector::getCreateTableSql() const {
  std::ostringstream sql;
  sql << "CREATE TABLE " << ImportHelpers::quote_identifier(table_name_) << " (";
  for (size_t i = 0; i < headers_.size(); i++) {
    sql << (i ? ", " : "") << ImportHelpers::quote_identifier(headers_[i]) << " "
        << best_affinities_[i];
  }
  sql << ");";
  return sql.str();
}

}  // namespace csv2db
