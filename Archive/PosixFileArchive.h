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

#ifndef CSV2DB_ARCHIVE_POSIXFILEARCHIVE_H
#define CSV2DB_ARCHIVE_POSIXFILEARCHIVE_H

#include <stdio.h>
#include <cerrno>
#include <cstring>
#include <memory>

#include <boost/algorithm/string/case_conv.hpp>
#include <boost/filesystem.hpp>

#include "Archive/Archive.h"

namespace csv2db {

// Archive stored in a local file. A plain text file (.csv, .tsv, .txt) is read as an
// archive holding that single file.
class PosixFileArchive : public Archive {
  const size_t buf_size = (1 << 20);

 public:
  PosixFileArchive(const std::string& path, const bool plain_text)
      : Archive(path, plain_text || is_plain_text_path(path)) {
    if (this->plain_text) {
      buf.reset(new char[buf_size]);
    }
    init_for_read();
  }

  ~PosixFileArchive() override {
    if (fp) {
      fclose(fp);
    }
  }

  static bool is_plain_text_path(const std::string& path) {
    const auto extension = boost::algorithm::to_lower_copy(
        boost::filesystem::path(path).extension().string());
    return extension == ".csv" || extension == ".tsv" || extension == ".txt";
  }

  void init_for_read() {
    if (plain_text) {
      if (nullptr == (fp = fopen(path.c_str(), "rb"))) {
        throw SourceError(std::string("fopen(") + path + "): " + strerror(errno));
      }
    } else {
      if (ARCHIVE_OK != archive_read_open_filename(ar, path.c_str(), 1 << 16)) {
        throw SourceError(std::string("archive_read_open_filename(") + path +
                          "): " + archive_error(ARCHIVE_FATAL));
      }
    }
  }

  bool read_next_header() override {
    if (plain_text) {
      // the file itself is the only entry
      return !header_read && (header_read = true);
    }
    return Archive::read_next_header();
  }

  bool read_data_block(const void** buff, size_t* size, int64_t* offset) override {
    if (plain_text) {
      size_t nread;
      if (0 >= (nread = fread(buf.get(), 1, buf_size, fp))) {
        if (ferror(fp)) {
          throw SourceError(std::string("fread(") + path + "): " + strerror(errno));
        }
        return false;
      }
      *buff = buf.get();
      *size = nread;
      *offset = ftell(fp);
      return true;
    }
    return Archive::read_data_block(buff, size, offset);
  }

  std::string entry_path() const override {
    if (plain_text) {
      return header_read ? boost::filesystem::path(path).filename().string()
                         : std::string();
    }
    return Archive::entry_path();
  }

  int64_t entry_size() const override {
    if (plain_text) {
      boost::system::error_code ec;
      const auto size = boost::filesystem::file_size(path, ec);
      return ec ? -1 : static_cast<int64_t>(size);
    }
    return Archive::entry_size();
  }

  bool entry_is_regular_file() const override {
    return plain_text ? header_read : Archive::entry_is_regular_file();
  }

 private:
  std::unique_ptr<char[]> buf;
  FILE* fp = nullptr;
  bool header_read = false;
};

}  // namespace csv2db

#endif  // CSV2DB_ARCHIVE_POSIXFILEARCHIVE_H
