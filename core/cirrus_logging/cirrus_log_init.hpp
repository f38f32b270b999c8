// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef CIRRUS_LOG_INIT_HPP
#define CIRRUS_LOG_INIT_HPP

#include "cirrus_console_sink.hpp"
#include "cirrus_file_sink.hpp"
#include "cirrus_log_severity.hpp"

namespace cirrus {
namespace logging {

struct LoggingConfig {
  bool console_enabled = true;
  bool console_colors = true;
  severity_level console_level = severity_level::info;

  bool file_enabled = false;
  FileSinkConfig file_config;
  severity_level file_level = severity_level::debug;
};

/**
 * Apply CIRRUS_LOG_* environment variables on top of a config:
 *   CIRRUS_LOG_LEVEL           both sinks
 *   CIRRUS_LOG_CONSOLE_LEVEL   console sink (wins over CIRRUS_LOG_LEVEL)
 *   CIRRUS_LOG_FILE_LEVEL      file sink (wins over CIRRUS_LOG_LEVEL)
 *   CIRRUS_LOG_CONSOLE_ENABLED true/false/1/0/yes/no/on/off
 *   CIRRUS_LOG_FILE_ENABLED    same
 *   CIRRUS_LOG_FILE_DIR        log directory
 *   CIRRUS_LOG_FORMAT          "json" or "text"
 * Empty or unparsable values are ignored.
 */
void apply_env_overrides(LoggingConfig& config);

/**
 * Attach the configured sinks to the Boost.Log core.
 *
 * @return false if logging was already initialized (config is ignored)
 */
bool init_logging(const LoggingConfig& config);

/**
 * Drain and detach the sinks. Safe to call when not initialized.
 */
void shutdown_logging();

}  // namespace logging
}  // namespace cirrus

#endif  // CIRRUS_LOG_INIT_HPP
