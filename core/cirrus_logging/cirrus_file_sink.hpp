// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef CIRRUS_FILE_SINK_HPP
#define CIRRUS_FILE_SINK_HPP

#include <boost/log/sinks/async_frontend.hpp>
#include <boost/log/sinks/bounded_fifo_queue.hpp>
#include <boost/log/sinks/drop_on_overflow.hpp>
#include <boost/log/sinks/text_file_backend.hpp>
#include <boost/smart_ptr/shared_ptr.hpp>

#include <cstdint>
#include <string>

#include "cirrus_log_severity.hpp"

namespace cirrus {
namespace logging {

// Larger queue than the console: a multipart upload logs a burst per part
typedef boost::log::sinks::asynchronous_sink<
  boost::log::sinks::text_file_backend,
  boost::log::sinks::bounded_fifo_queue<5000, boost::log::sinks::drop_on_overflow>>
  async_file_sink_t;

struct FileSinkConfig {
  std::string directory = "/var/log/cirrus";
  std::string file_pattern = "cirrus_%Y%m%d_%H%M%S.log";
  uint64_t rotation_size_mb = 100;
  bool rotate_at_midnight = true;
  int max_files = 10;
  bool format_json = true;  // JSON lines carrying upload_id/key/part_number as fields
};

/**
 * Directory the sink will actually write to: the configured one, created if
 * missing, or /tmp when it cannot be created.
 */
std::string resolve_log_directory(const std::string& directory);

/**
 * Rotating file sink (size and optionally midnight), JSON or text lines.
 */
boost::shared_ptr<async_file_sink_t> create_file_sink(
  const FileSinkConfig& config, severity_level min_level = severity_level::debug
);

}  // namespace logging
}  // namespace cirrus

#endif  // CIRRUS_FILE_SINK_HPP
