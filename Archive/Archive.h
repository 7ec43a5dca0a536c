/*
 * Copyright 2017 MapD Technologies, Inc.
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

#ifndef CSV2DB_ARCHIVE_ARCHIVE_H
#define CSV2DB_ARCHIVE_ARCHIVE_H

#include <cstdint>
#include <string>

#include <archive.h>
#include <archive_entry.h>

#include "Import/ImportErrors.h"

namespace csv2db {

// Base class of the archives members are read from. Entries are visited in archive
// order; only the current entry's data can be read.
class Archive {
 public:
  Archive(const std::string& path, const bool plain_text)
      : path(path), plain_text(plain_text) {
    if (0 == (ar = archive_read_new())) {
      throw SourceError(std::string("archive_read_new failed!"));
    }

    // list supported formats to bypass the mtree exception
    archive_read_support_format_ar(ar);
    archive_read_support_format_cpio(ar);
    archive_read_support_format_empty(ar);
    archive_read_support_format_lha(ar);
    archive_read_support_format_tar(ar);
    archive_read_support_format_xar(ar);
    archive_read_support_format_7zip(ar);
    archive_read_support_format_cab(ar);
    archive_read_support_format_rar(ar);
    archive_read_support_format_iso9660(ar);
    archive_read_support_format_zip(ar);

    archive_read_support_filter_bzip2(ar);
    archive_read_support_filter_compress(ar);
    archive_read_support_filter_gzip(ar);
    archive_read_support_filter_lzip(ar);
    archive_read_support_filter_lzma(ar);
    archive_read_support_filter_xz(ar);
    archive_read_support_filter_uu(ar);
    archive_read_support_filter_rpm(ar);
    archive_read_support_filter_lrzip(ar);
    archive_read_support_filter_lzop(ar);
    archive_read_support_filter_grzip(ar);
  }

  virtual ~Archive() {
    if (ar) {
      archive_read_close(ar);
      archive_read_free(ar);
    }
    ar = 0;
  }

  Archive(const Archive&) = delete;
  Archive& operator=(const Archive&) = delete;

  std::string archive_error(int err) const {
    auto cstr = archive_error_string(ar);
    return std::string("libarchive error: ") +
           (cstr ? std::string(cstr) : std::to_string(err));
  }

  // Moves to the next entry. Returns false at the end of the archive.
  virtual bool read_next_header() {
    int rc;
    switch (rc = archive_read_next_header(ar, &entry)) {
      case ARCHIVE_EOF:
        entry = nullptr;
        return false;  // signal caller end of stream
      case ARCHIVE_OK:
      case ARCHIVE_WARN:
        return true;
    }
    throw SourceError(path + ": " + archive_error(rc));
  }

  virtual bool read_data_block(const void** buff, size_t* size, int64_t* offset) {
    int rc;
    switch (rc = archive_read_data_block(ar, buff, size, offset)) {
      case ARCHIVE_EOF:
        return false;  // signal caller end of stream
      case ARCHIVE_OK:
      case ARCHIVE_WARN:
        return true;
    }
    throw SourceError(path + ": " + archive_error(rc));
  }

  virtual std::string entry_path() const {
    auto cstr = entry ? archive_entry_pathname(entry) : nullptr;
    return cstr ? std::string(cstr) : std::string();
  }

  // Uncompressed size of the current entry, -1 if the archive does not record it.
  virtual int64_t entry_size() const {
    return entry && archive_entry_size_is_set(entry) ? archive_entry_size(entry) : -1;
  }

  virtual bool entry_is_regular_file() const {
    return entry && AE_IFREG == archive_entry_filetype(entry);
  }

  bool is_plain_text() const { return plain_text; }

 protected:
  std::string path;
  archive* ar = 0;
  archive_entry* entry = nullptr;
  bool plain_text;
};

}  // namespace csv2db

#endif  // CSV2DB_ARCHIVE_ARCHIVE_H
