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
 * @file NamedChannel.h
 * @brief Named pipes that carry one table's rows from the importer to the loader.
 */

#ifndef CSV2DB_IMPORT_NAMEDCHANNEL_H
#define CSV2DB_IMPORT_NAMEDCHANNEL_H

#include <chrono>
#include <functional>
#include <memory>
#include <string>

#include <boost/filesystem/path.hpp>

#include "Logger/Logger.h"

namespace csv2db {

struct NamedChannel {
  boost::filesystem::path directory;  // private to this channel
  boost::filesystem::path path;       // the fifo, inside directory
  std::string table_name;
  bool closed{false};
};

// Write end of a channel. write() and flush() throw TransportError once the reader
// has closed its end.
class ChannelWriter {
 public:
  virtual ~ChannelWriter() {}
  virtual void write(const char* data, const size_t size) = 0;
  virtual void flush() = 0;
  virtual void close() = 0;
};

class ChannelManager {
 public:
  virtual ~ChannelManager() {}

  /**
   * @brief Creates a private directory and a fifo inside it named after the table.
   *
   * @throws ResourceError if either cannot be created. Nothing is left behind.
   */
  virtual NamedChannel open(const std::string& table_name) = 0;

  /**
   * @brief Removes the fifo, then its directory. A second call is a no-op.
   *
   * @throws ResourceError after both removals were attempted if either failed,
   * including when the fifo had already disappeared.
   */
  virtual void close(NamedChannel& channel) = 0;

  /**
   * @brief Opens the write end, blocking until a reader has the channel open.
   *
   * @param still_waiting  polled while no reader is present; returning false gives up
   *                       with a TransportError.
   *
   * The process must ignore SIGPIPE, otherwise a reader closing early kills it instead
   * of failing the write with a TransportError.
   */
  virtual std::unique_ptr<ChannelWriter> openWriter(
      const NamedChannel& channel,
      const std::function<bool()>& still_waiting) = 0;
};

class FifoChannelManager : public ChannelManager {
 public:
  FifoChannelManager(const boost::filesystem::path& temp_root,
                     const logger::LogSource& log,
                     const std::chrono::milliseconds poll_interval =
                         std::chrono::milliseconds(10));

  NamedChannel open(const std::string& table_name) override;
  void close(NamedChannel& channel) override;
  std::unique_ptr<ChannelWriter> openWriter(
      const NamedChannel& channel,
      const std::function<bool()>& still_waiting) override;

 private:
  const boost::filesystem::path temp_root_;
  const std::chrono::milliseconds poll_interval_;
  logger::LogSource log_;
};

// Owns an open channel for the duration of one import. The destructor closes the
// channel if close() has not been called, logging instead of throwing.
class ScopedChannel {
 public:
  ScopedChannel(ChannelManager& manager,
                const std::string& table_name,
                const logger::LogSource& log);
  ~ScopedChannel();

  ScopedChannel(const ScopedChannel&) = delete;
  ScopedChannel& operator=(const ScopedChannel&) = delete;

  const NamedChannel& get() const { return channel_; }
  void close();

 private:
  ChannelManager& manager_;
  NamedChannel channel_;
  logger::LogSource log_;
};

}  // namespace csv2db

#endif  // CSV2DB_IMPORT_NAMEDCHANNEL_H
