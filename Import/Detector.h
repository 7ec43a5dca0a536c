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
 * @file Detector.h
 * @brief Infers a table schema from a sample of csv rows.
 */

#ifndef CSV2DB_IMPORT_DETECTOR_H
#define CSV2DB_IMPORT_DETECTOR_H

#include <string>
#include <vector>

#include "Import/ImportParams.h"
#include "Import/SourceStream.h"
#include "Logger/Logger.h"

namespace csv2db {

// SQLite column affinities, ordered from most to least restrictive.
enum class ColumnAffinity { INTEGER, REAL, TEXT };

std::ostream& operator<<(std::ostream& os, const ColumnAffinity affinity);

class Detector {
 public:
  /**
   * @brief Samples the source from its start and derives column names and types.
   *
   * Reads up to params.max_rows rows after the first one (all rows when 0). The source
   * is left at an unspecified position.
   *
   * @throws SchemaError if the source holds no rows
   * @throws SourceError if the source cannot be read
   */
  Detector(SourceStream& source,
           const std::string& table_name,
           const ImportParams& params,
           const logger::LogSource& log);

  static ColumnAffinity detect_affinity(const std::string& str);
  static std::vector<ColumnAffinity> detect_column_types(
      const std::vector<std::string>& row);
  // true if b is less restrictive than a, i.e. a column of type a that sees b must widen
  static bool more_restrictive_affinity(const ColumnAffinity a, const ColumnAffinity b);
  static bool detect_headers(const std::vector<ColumnAffinity>& head_types,
                             const std::vector<ColumnAffinity>& tail_types);

  bool hasHeaders() const { return has_headers_; }
  const std::vector<std::string>& getHeaders() const { return headers_; }
  const std::vector<ColumnAffinity>& getBestAffinities() const {
    return best_affinities_;
  }
  size_t getSampledRowCount() const { return raw_rows_.size(); }

  // CREATE TABLE "name" ("col" TYPE, ...); on a single line.
  std::string getCreateTableSql() const;

 private:
  void read_sample(SourceStream& source);
  std::vector<ColumnAffinity> find_best_affinities(
      std::vector<std::vector<std::string>>::const_iterator row_begin,
      std::vector<std::vector<std::string>>::const_iterator row_end) const;
  std::vector<std::string> make_headers() const;

  const std::string table_name_;
  const ImportParams params_;
  logger::LogSource log_;
  std::vector<std::vector<std::string>> raw_rows_;
  std::vector<ColumnAffinity> best_affinities_;
  std::vector<std::string> headers_;
  bool has_headers_{false};
};

}  // namespace csv2db

#endif  // CSV2DB_IMPORT_DETECTOR_H
