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
 * @file TransferSession.h
 * @brief Pushes a source stream through a channel, halving the chunk size every time
 * the reader closes its end early.
 */

#ifndef CSV2DB_IMPORT_TRANSFERSESSION_H
#define CSV2DB_IMPORT_TRANSFERSESSION_H

#include <functional>
#include <memory>
#include <vector>

#include "Import/NamedChannel.h"
#include "Import/SourceStream.h"
#include "Logger/Logger.h"

namespace csv2db {

// 2^24 bytes, 16 MiB chunks.
constexpr int kDefaultStartExponent = 24;
constexpr int kMaxStartExponent = 62;

// @throws ConfigurationError unless 1 <= start_exponent <= kMaxStartExponent
void validate_start_exponent(const int start_exponent);

struct TransferAttempt {
  int exponent;
  size_t chunk_size;
  size_t bytes_written;
  bool succeeded;
};

struct TransferResult {
  size_t bytes_transferred{0};
  int exponent{0};  // of the successful attempt
  std::vector<TransferAttempt> attempts;

  size_t failedAttempts() const {
    return attempts.empty() ? 0 : attempts.size() - (attempts.back().succeeded ? 1 : 0);
  }
};

class TransferSession {
 public:
  // Opens the write end of the channel, blocking until the reader is there.
  using WriterOpener = std::function<std::unique_ptr<ChannelWriter>()>;
  // Runs after a failed attempt, right before the next one starts. Exceptions it throws
  // end the session and propagate out of run().
  using RetryHook = std::function<void(const TransferAttempt& failed_attempt)>;

  TransferSession(SourceStream& source,
                  WriterOpener open_writer,
                  const logger::LogSource& log,
                  const int start_exponent = kDefaultStartExponent);

  void setRetryHook(RetryHook retry_hook) { retry_hook_ = std::move(retry_hook); }

  /**
   * @brief Transfers source.length() bytes, rewinding the source before every attempt.
   *
   * Attempts run at exponents start_exponent down to 1. An attempt that hits a
   * TransportError while opening, writing or flushing is abandoned and the next one
   * uses half the chunk size.
   *
   * @throws TransferExhaustedError if the attempt at exponent 1 failed too
   * @throws SourceError if the source fails or ends early; this is not retried
   */
  TransferResult run();

 private:
  size_t readChunk(char* buffer, const size_t size);

  SourceStream& source_;
  WriterOpener open_writer_;
  RetryHook retry_hook_;
  logger::LogSource log_;
  const int start_exponent_;
};

}  // namespace csv2db

#endif  // CSV2DB_IMPORT_TRANSFERSESSION_H
