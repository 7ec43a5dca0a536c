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

#include "Import/SourceStream.h"

#include <cerrno>
#include <cstring>

#include <boost/filesystem.hpp>

#include "Import/ImportErrors.h"

namespace csv2db {

FileSourceStream::FileSourceStream(const std::string& file_path)
    : file_path_(file_path) {
  boost::system::error_code ec;
  const auto size = boost::filesystem::file_size(file_path_, ec);
  if (ec) {
    throw SourceError("cannot stat '" + file_path_ + "': " + ec.message());
  }
  length_ = size;
  if (nullptr == (fp_ = fopen(file_path_.c_str(), "rb"))) {
    throw SourceError(std::string("fopen(") + file_path_ + "): " + strerror(errno));
  }
}

FileSourceStream::~FileSourceStream() {
  close();
}

void FileSourceStream::rewind() {
  if (!fp_) {
    throw SourceError("'" + file_path_ + "' is closed");
  }
  if (fseek(fp_, 0, SEEK_SET) != 0) {
    throw SourceError(std::string("fseek(") + file_path_ + "): " + strerror(errno));
  }
}

size_t FileSourceStream::read(char* buffer, const size_t size) {
  if (!fp_) {
    throw SourceError("'" + file_path_ + "' is closed");
  }
  const auto nread = fread(buffer, 1, size, fp_);
  if (nread < size && ferror(fp_)) {
    throw SourceError(std::string("fread(") + file_path_ + "): " + strerror(errno));
  }
  return nread;
}

void FileSourceStream::close() {
  if (fp_) {
    fclose(fp_);
    fp_ = nullptr;
  }
}

}  // namespace csv2db
