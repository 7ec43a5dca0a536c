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

#include "Import/TransferSession.h"

#include <algorithm>

#include "Import/ImportErrors.h"

namespace csv2db {

void validate_start_exponent(const int start_exponent) {
  if (start_exponent <= 0 || start_exponent > kMaxStartExponent) {
    throw ConfigurationError("chunk exponent must be between 1 and " +
                             std::to_string(kMaxStartExponent) + ", got " +
                             std::to_string(start_exponent));
  }
}

TransferSession::TransferSession(SourceStream& source,
                                 WriterOpener open_writer,
                                 const logger::LogSource& log,
                                 const int start_exponent)
    : source_(source)
    , open_writer_(std::move(open_writer))
    , log_(log.tag("Component", "transfer"))
    , start_exponent_(start_exponent) {
  validate_start_exponent(start_exponent_);
}

size_t TransferSession::readChunk(char* buffer, const size_t size) {
  size_t got = 0;
  while (got < size) {
    const auto nread = source_.read(buffer + got, size - got);
    if (0 == nread) {
      break;
    }
    got += nread;
  }
  return got;
}

TransferResult TransferSession::run() {
  const size_t total = source_.length();
  TransferResult result;
  std::vector<char> buffer;

  for (int p = start_exponent_; p > 0; --p) {
    if (!result.attempts.empty() && retry_hook_) {
      retry_hook_(result.attempts.back());
    }
    TransferAttempt attempt{p, size_t(1) << p, 0, false};
    try {
      auto writer = open_writer_();
      source_.rewind();
      LOG(log_, DEBUG1) << "source rewound, chunk size " << attempt.chunk_size;
      buffer.resize(std::min(attempt.chunk_size, total));

      size_t left = total;
      while (left > 0) {
        const auto can_do = std::min(left, attempt.chunk_size);
        const auto got = readChunk(buffer.data(), can_do);
        if (got < can_do) {
          throw SourceError("source ended after " + std::to_string(total - left + got) +
                            " of " + std::to_string(total) + " bytes");
        }
        writer->write(buffer.data(), can_do);
        writer->flush();
        left -= can_do;
        attempt.bytes_written += can_do;
        LOG(log_, DEBUG2) << "wrote " << can_do << " bytes to channel, left: " << left;
      }
      writer->close();
    } catch (const TransportError& e) {
      result.attempts.push_back(attempt);
      LOG(log_, WARNING) << "chunk exponent that failed: " << p << " after "
                         << attempt.bytes_written << " bytes (" << e.what()
                         << "); backing off by 1";
      continue;
    }
    attempt.succeeded = true;
    result.attempts.push_back(attempt);
    result.bytes_transferred = attempt.bytes_written;
    result.exponent = p;
    LOG(log_, INFO) << "chunk exponent that worked: " << p << ", " << total
                    << " bytes in " << result.attempts.size() << " attempt(s)";
    return result;
  }

  throw TransferExhaustedError("transfer failed at every chunk exponent from " +
                                   std::to_string(start_exponent_) + " down to 1",
                               start_exponent_);
}

}  // namespace csv2db
