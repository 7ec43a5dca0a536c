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
 * @file SourceStream.h
 * @brief Rewindable byte stream of known length feeding one table import.
 */

#ifndef CSV2DB_IMPORT_SOURCESTREAM_H
#define CSV2DB_IMPORT_SOURCESTREAM_H

#include <cstdio>
#include <string>

namespace csv2db {

class SourceStream {
 public:
  virtual ~SourceStream() {}

  // Total number of bytes the stream yields from its start.
  virtual size_t length() const = 0;

  // Repositions the stream at offset zero. Throws SourceError if that is impossible.
  virtual void rewind() = 0;

  // Reads at most size bytes into buffer, returning 0 only at the end of the stream.
  virtual size_t read(char* buffer, const size_t size) = 0;

  // Releases the underlying handle. Further calls are no-ops.
  virtual void close() = 0;
  virtual bool isOpen() const = 0;
};

class FileSourceStream : public SourceStream {
 public:
  FileSourceStream(const std::string& file_path);
  ~FileSourceStream() override;

  FileSourceStream(const FileSourceStream&) = delete;
  FileSourceStream& operator=(const FileSourceStream&) = delete;

  size_t length() const override { return length_; }
  void rewind() override;
  size_t read(char* buffer, const size_t size) override;
  void close() override;
  bool isOpen() const override { return fp_ != nullptr; }

 private:
  const std::string file_path_;
  FILE* fp_{nullptr};
  size_t length_{0};
};

}  // namespace csv2db

#endif  // CSV2DB_IMPORT_SOURCESTREAM_H
