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

#include "Import/NamedChannel.h"

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <thread>

#include <boost/filesystem.hpp>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>

#include "Import/ImportErrors.h"

namespace csv2db {

namespace {

// fifo names keep the table name readable and stay unique across concurrent jobs
std::string make_channel_name(const std::string& table_name) {
  std::string name = table_name;
  std::replace_if(
      name.begin(),
      name.end(),
      [](const char c) {
        return !std::isalnum(static_cast<unsigned char>(c)) && c != '_';
      },
      '_');
  std::string suffix = boost::uuids::to_string(boost::uuids::random_generator()());
  suffix.erase(std::remove(suffix.begin(), suffix.end(), '-'), suffix.end());
  // 64 random bits
  return name + "_" + suffix.substr(0, 16);
}

class FifoChannelWriter : public ChannelWriter {
 public:
  FifoChannelWriter(const int fd, const boost::filesystem::path& path)
      : fd_(fd), path_(path) {}

  ~FifoChannelWriter() override { close(); }

  void write(const char* data, const size_t size) override {
    size_t written = 0;
    while (written < size) {
      const auto n = ::write(fd_, data + written, size - written);
      if (n < 0) {
        if (EINTR == errno) {
          continue;
        }
        if (EPIPE == errno) {
          throw TransportError("reader closed channel '" + path_.string() + "' after " +
                               std::to_string(written) + " of " + std::to_string(size) +
                               " bytes");
        }
        throw ResourceError("failed to write to channel '" + path_.string() +
                            "': " + strerror(errno));
      }
      written += n;
    }
  }

  // writes go straight to the pipe; there is nothing buffered on this side
  void flush() override {
    if (fd_ < 0) {
      throw TransportError("channel '" + path_.string() + "' is not open for writing");
    }
  }

  void close() override {
    if (fd_ >= 0) {
      ::close(fd_);
      fd_ = -1;
    }
  }

 private:
  int fd_;
  const boost::filesystem::path path_;
};

}  // namespace

FifoChannelManager::FifoChannelManager(const boost::filesystem::path& temp_root,
                                       const logger::LogSource& log,
                                       const std::chrono::milliseconds poll_interval)
    : temp_root_(temp_root.empty() ? boost::filesystem::temp_directory_path()
                                   : temp_root)
    , poll_interval_(poll_interval)
    , log_(log.tag("Component", "channel")) {}

NamedChannel FifoChannelManager::open(const std::string& table_name) {
  NamedChannel channel;
  channel.table_name = table_name;
  channel.directory =
      temp_root_ / boost::filesystem::unique_path("csv2db-%%%%-%%%%-%%%%");

  boost::system::error_code ec;
  if (!boost::filesystem::create_directory(channel.directory, ec)) {
    throw ResourceError("failed to create channel directory '" +
                        channel.directory.string() + "': " +
                        (ec ? ec.message() : std::string("already exists")));
  }
  boost::filesystem::permissions(channel.directory, boost::filesystem::owner_all, ec);
  if (ec) {
    LOG(log_, WARNING) << "could not restrict permissions of " << channel.directory
                       << ": " << ec.message();
  }

  channel.path = channel.directory / make_channel_name(table_name);
  if (mkfifo(channel.path.c_str(), 0600) < 0) {
    const std::string error = strerror(errno);
    boost::filesystem::remove(channel.directory, ec);
    if (ec) {
      LOG(log_, ERROR) << "failed to remove channel directory " << channel.directory
                       << ": " << ec.message();
    }
    throw ResourceError("failed to create named pipe '" + channel.path.string() +
                        "': " + error);
  }
  LOG(log_, DEBUG1) << "mkfifo " << channel.path;
  return channel;
}

void FifoChannelManager::close(NamedChannel& channel) {
  if (channel.closed) {
    return;
  }
  channel.closed = true;

  std::string errors;
  boost::system::error_code ec;
  LOG(log_, DEBUG1) << "rm " << channel.path;
  if (!boost::filesystem::remove(channel.path, ec)) {
    errors = "failed to remove named pipe '" + channel.path.string() +
             "': " + (ec ? ec.message() : std::string("no such file"));
  }
  LOG(log_, DEBUG1) << "rmdir " << channel.directory;
  if (!boost::filesystem::remove(channel.directory, ec)) {
    errors += (errors.empty() ? "" : "; ") + std::string("failed to remove directory '") +
              channel.directory.string() +
              "': " + (ec ? ec.message() : std::string("no such directory"));
  }
  if (!errors.empty()) {
    throw ResourceError(errors);
  }
}

std::unique_ptr<ChannelWriter> FifoChannelManager::openWriter(
    const NamedChannel& channel,
    const std::function<bool()>& still_waiting) {
  // O_NONBLOCK fails with ENXIO while nobody reads, which lets us notice a loader
  // that exited before opening its end.
  int fd;
  while ((fd = ::open(channel.path.c_str(), O_WRONLY | O_NONBLOCK | O_CLOEXEC)) < 0) {
    if (EINTR == errno) {
      continue;
    }
    if (ENXIO != errno) {
      throw ResourceError("failed to open named pipe '" + channel.path.string() +
                          "' for writing: " + strerror(errno));
    }
    if (!still_waiting()) {
      throw TransportError("no reader opened named pipe '" + channel.path.string() + "'");
    }
    std::this_thread::sleep_for(poll_interval_);
  }

  const int flags = fcntl(fd, F_GETFL);
  if (flags < 0 || fcntl(fd, F_SETFL, flags & ~O_NONBLOCK) < 0) {
    const std::string error = strerror(errno);
    ::close(fd);
    throw ResourceError("failed to make named pipe '" + channel.path.string() +
                        "' blocking: " + error);
  }
  LOG(log_, DEBUG1) << "open fifo for write: " << channel.path;
  return std::make_unique<FifoChannelWriter>(fd, channel.path);
}

ScopedChannel::ScopedChannel(ChannelManager& manager,
                             const std::string& table_name,
                             const logger::LogSource& log)
    : manager_(manager), channel_(manager.open(table_name)), log_(log) {}

ScopedChannel::~ScopedChannel() {
  if (!channel_.closed) {
    try {
      manager_.close(channel_);
    } catch (const ResourceError& e) {
      LOG(log_, ERROR) << e.what();
    }
  }
}

void ScopedChannel::close() {
  manager_.close(channel_);
}

}  // namespace csv2db
