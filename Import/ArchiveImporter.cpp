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

#include "Import/ArchiveImporter.h"

#include <memory>

#include <boost/algorithm/string/predicate.hpp>

#include "Import/Detector.h"
#include "Import/ImportErrors.h"
#include "Shared/import_helpers.h"

namespace csv2db {

ArchiveImporter::ArchiveImporter(const ImportParams& params,
                                 TableImporter* importer,
                                 const logger::LogSource& log)
    : params_(params), importer_(importer), log_(log.tag("Component", "archive")) {
  if (importer_ && !params_.database_path) {
    throw ConfigurationError("importing tables requires a database");
  }
  if (!params_.name_filter.empty()) {
    try {
      name_filter_ =
          boost::regex(params_.name_filter, boost::regex::perl | boost::regex::icase);
    } catch (const boost::regex_error& e) {
      throw ConfigurationError("invalid name filter '" + params_.name_filter +
                               "': " + e.what());
    }
  }
}

bool ArchiveImporter::selected(const std::string& member_path) const {
  return !name_filter_ ||
         boost::regex_search(member_path, *name_filter_, boost::match_continuous);
}

bool ArchiveImporter::is_csv_member(const std::string& member_path) {
  return boost::algorithm::iends_with(member_path, ".csv");
}

std::vector<TableReport> ArchiveImporter::run() {
  const bool plain_text = PosixFileArchive::is_plain_text_path(params_.archive_path);
  std::vector<TableReport> reports;
  for (const auto& entry : list_archive_entries(params_.archive_path)) {
    if (!selected(entry.path)) {
      LOG(log_, DEBUG1) << "skipping " << entry.path << ": filtered out";
      continue;
    }
    if (!plain_text && !is_csv_member(entry.path)) {
      LOG(log_, DEBUG1) << "skipping " << entry.path << ": not a csv file";
      continue;
    }
    reports.push_back(process(entry));
  }
  LOG(log_, INFO) << reports.size() << " csv member(s) processed in "
                  << params_.archive_path;
  return reports;
}

TableReport ArchiveImporter::process(const ArchiveEntry& entry) {
  TableReport report;
  report.member_path = entry.path;
  report.table_name = ImportHelpers::table_name_from_path(entry.path);
  const auto log = log_.tag("Table", report.table_name);
  try {
    // a plain file rewinds by seeking instead of reopening an archive
    std::unique_ptr<SourceStream> source;
    if (PosixFileArchive::is_plain_text_path(params_.archive_path)) {
      source = std::make_unique<FileSourceStream>(params_.archive_path);
    } else {
      source = std::make_unique<ArchiveEntrySource>(params_.archive_path, entry);
    }
    Detector detector(*source, report.table_name, params_, log);
    report.create_table_sql = detector.getCreateTableSql();
    if (importer_) {
      ImportJob job{*source,
                    report.table_name,
                    *params_.database_path,
                    report.create_table_sql,
                    detector.hasHeaders() ? size_t(1) : size_t(0)};
      report.status = importer_->importTable(job);
      LOG(log, INFO) << entry.path << " -> " << report.table_name << ": "
                     << report.status->bytes_transferred << " bytes, "
                     << report.status->failed_attempts << " failed attempt(s)";
    }
  } catch (const ImportError& e) {
    report.error = e.what();
    LOG(log, ERROR) << entry.path << ": " << e.what();
  }
  return report;
}

}  // namespace csv2db
