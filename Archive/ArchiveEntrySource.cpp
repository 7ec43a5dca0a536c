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

#include "Archive/ArchiveEntrySource.h"

#include <algorithm>
#include <cstring>

namespace csv2db {

std::vector<ArchiveEntry> list_archive_entries(const std::string& archive_path) {
  std::vector<ArchiveEntry> entries;
  PosixFileArchive archive(archive_path, false);
  for (size_t index = 0; archive.read_next_header(); ++index) {
    if (archive.entry_is_regular_file()) {
      entries.push_back({index, archive.entry_path(), archive.entry_size()});
    }
  }
  return entries;
}

ArchiveEntrySource::ArchiveEntrySource(const std::string& archive_path,
                                       const ArchiveEntry& entry)
    : archive_path_(archive_path), entry_(entry) {
  open();
  if (entry_.size >= 0) {
    length_ = entry_.size;
    return;
  }
  // the archive does not record the size, so count the bytes once
  std::vector<char> buffer(1 << 16);
  size_t nread;
  while ((nread = read(buffer.data(), buffer.size())) > 0) {
    length_ += nread;
  }
  open();
}

void ArchiveEntrySource::open() {
  archive_.reset();
  archive_ = std::make_unique<PosixFileArchive>(archive_path_, false);
  for (size_t index = 0; index <= entry_.index; ++index) {
    if (!archive_->read_next_header()) {
      archive_.reset();
      throw SourceError(archive_path_ + ": entry '" + entry_.path + "' disappeared");
    }
  }
  block_ = nullptr;
  block_size_ = 0;
  block_pos_ = 0;
  end_of_entry_ = false;
}

void ArchiveEntrySource::rewind() {
  open();
}

size_t ArchiveEntrySource::read(char* buffer, const size_t size) {
  if (!archive_) {
    throw SourceError(archive_path_ + ": entry '" + entry_.path + "' is closed");
  }
  size_t copied = 0;
  while (copied < size && !end_of_entry_) {
    if (block_pos_ == block_size_) {
      const void* block;
      int64_t offset;
      if (!archive_->read_data_block(&block, &block_size_, &offset)) {
        end_of_entry_ = true;
        break;
      }
      block_ = static_cast<const char*>(block);
      block_pos_ = 0;
      continue;
    }
    const auto n = std::min(size - copied, block_size_ - block_pos_);
    memcpy(buffer + copied, block_ + block_pos_, n);
    block_pos_ += n;
    copied += n;
  }
  return copied;
}

void ArchiveEntrySource::close() {
  archive_.reset();
}

}  // namespace csv2db
