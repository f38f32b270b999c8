// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "chunker.hpp"

#include <algorithm>
#include <cstddef>
#include <string>

#define CIRRUS_LOG_COMPONENT "chunker"
#include <cirrus_log_macros.hpp>

namespace cirrus {
namespace uploader {

using cirrus::logging::kv;

Chunker::Chunker(IByteSource& source, size_t read_buffer_size, size_t part_size_threshold)
    : source_(source)
    , buffer_(read_buffer_size)
    , part_size_threshold_(part_size_threshold) {}

Chunker::FillStatus Chunker::fill() {
  if (!last_error_.empty()) {
    return FillStatus::READ_ERROR;
  }

  while (part_.size() < part_size_threshold_) {
    if (end_of_stream_) {
      return FillStatus::END_OF_STREAM;
    }

    size_t wanted = std::min(buffer_.size(), part_size_threshold_ - part_.size());
    ReadResult result = source_.read(buffer_.data(), wanted);

    if (!result.ok) {
      last_error_ = result.error_message.empty() ? "read failed" : result.error_message;
      CIRRUS_LOG_ERROR("Source read failed" << kv("after_bytes", total_bytes_read_)
                                            << kv("error", last_error_));
      return FillStatus::READ_ERROR;
    }

    if (result.bytes == 0) {
      end_of_stream_ = true;
      CIRRUS_LOG_DEBUG("End of stream" << kv("total_bytes", total_bytes_read_));
      return FillStatus::END_OF_STREAM;
    }

    if (result.bytes > wanted) {
      last_error_ = "source reported " + std::to_string(result.bytes) + " bytes for a " +
                    std::to_string(wanted) + " byte read";
      CIRRUS_LOG_ERROR("Source read overran the buffer" << kv("after_bytes", total_bytes_read_)
                                                        << kv("error", last_error_));
      return FillStatus::READ_ERROR;
    }

    part_.insert(
      part_.end(), buffer_.begin(), buffer_.begin() + static_cast<std::ptrdiff_t>(result.bytes)
    );
    total_bytes_read_ += result.bytes;
  }

  return FillStatus::PART_READY;
}

std::vector<char> Chunker::takePart() {
  std::vector<char> part;
  part.swap(part_);
  return part;
}

}  // namespace uploader
}  // namespace cirrus
