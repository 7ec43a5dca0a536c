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
 * @file ArchiveEntrySource.h
 * @brief Source stream over one member of an archive.
 */

#ifndef CSV2DB_ARCHIVE_ARCHIVEENTRYSOURCE_H
#define CSV2DB_ARCHIVE_ARCHIVEENTRYSOURCE_H

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "Archive/PosixFileArchive.h"
#include "Import/SourceStream.h"

namespace csv2db {

struct ArchiveEntry {
  size_t index;  // position in archive order
  std::string path;
  int64_t size;  // -1 if the archive does not record it
};

// Regular file entries of the archive, in archive order.
std::vector<ArchiveEntry> list_archive_entries(const std::string& archive_path);

// Archives are read forward only, so rewinding reopens the archive and skips to the
// entry again.
class ArchiveEntrySource : public SourceStream {
 public:
  ArchiveEntrySource(const std::string& archive_path, const ArchiveEntry& entry);

  size_t length() const override { return length_; }
  void rewind() override;
  size_t read(char* buffer, const size_t size) override;
  void close() override;
  bool isOpen() const override { return archive_ != nullptr; }

 private:
  void open();

  const std::string archive_path_;
  const ArchiveEntry entry_;
  size_t length_{0};
  std::unique_ptr<PosixFileArchive> archive_;
  const char* block_{nullptr};
  size_t block_size_{0};
  size_t block_pos_{0};
  bool end_of_entry_{false};
};

}  // namespace csv2db

#endif  // CSV2DB_ARCHIVE_ARCHIVEENTRYSOURCE_H
