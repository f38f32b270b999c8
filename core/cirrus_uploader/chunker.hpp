// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef CIRRUS_CHUNKER_HPP
#define CIRRUS_CHUNKER_HPP

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "uploader_interfaces.hpp"

namespace cirrus {
namespace uploader {

/**
 * Reads a byte source through a reusable buffer into a part accumulator
 *
 * A read never asks for more than the bytes still missing from the current
 * part, so every full part is exactly part_size_threshold bytes. Not
 * thread-safe; owned by the thread driving the upload.
 */
class Chunker {
public:
  enum class FillStatus {
    PART_READY,     // Accumulator holds part_size_threshold bytes
    END_OF_STREAM,  // Source exhausted, accumulator holds the remainder (maybe empty)
    READ_ERROR      // Source failed, see lastError()
  };

  Chunker(IByteSource& source, size_t read_buffer_size, size_t part_size_threshold);

  Chunker(const Chunker&) = delete;
  Chunker& operator=(const Chunker&) = delete;

  /**
   * Read until the accumulator is full, the source ends or a read fails
   */
  FillStatus fill();

  /**
   * Hand over the accumulated bytes and start a new, empty part
   */
  std::vector<char> takePart();

  size_t partSize() const { return part_.size(); }

  uint64_t totalBytesRead() const { return total_bytes_read_; }

  const std::string& lastError() const { return last_error_; }

  size_t readBufferSize() const { return buffer_.size(); }

  size_t partSizeThreshold() const { return part_size_threshold_; }

private:
  IByteSource& source_;
  std::vector<char> buffer_;
  std::vector<char> part_;
  size_t part_size_threshold_;
  uint64_t total_bytes_read_ = 0;
  bool end_of_stream_ = false;
  std::string last_error_;
};

}  // namespace uploader
}  // namespace cirrus

#endif  // CIRRUS_CHUNKER_HPP
