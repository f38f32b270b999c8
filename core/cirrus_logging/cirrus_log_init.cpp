// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "cirrus_log_init.hpp"

#include <boost/log/core.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <mutex>
#include <optional>

#include "cirrus_log_macros.hpp"

namespace cirrus {
namespace logging {

namespace {

const char* const kSeverityNames[] = {"DEBUG", "INFO", "WARN", "ERROR", "FATAL"};

std::string to_lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return s;
}

const char* env_value(const char* name) {
  const char* value = std::getenv(name);
  return (value && value[0] != '\0') ? value : nullptr;
}

void override_level(const char* name, severity_level& level) {
  if (const char* value = env_value(name)) {
    if (auto parsed = parse_severity_level(value)) {
      level = *parsed;
    }
  }
}

void override_flag(const char* name, bool& flag) {
  const char* value = env_value(name);
  if (!value) {
    return;
  }
  std::string lower = to_lower(value);
  if (lower == "true" || lower == "1" || lower == "yes" || lower == "on") {
    flag = true;
  } else if (lower == "false" || lower == "0" || lower == "no" || lower == "off") {
    flag = false;
  }
}

/**
 * Sinks owned by the process. Guarded by mutex; the logger itself is
 * independent of them and usable before init and after shutdown.
 */
struct ActiveSinks {
  std::mutex mutex;
  bool initialized = false;
  boost::shared_ptr<async_console_sink_t> console;
  boost::shared_ptr<async_file_sink_t> file;
};

ActiveSinks& active_sinks() {
  static ActiveSinks sinks;
  return sinks;
}

template <typename Sink>
void detach(boost::shared_ptr<Sink>& sink) {
  if (!sink) {
    return;
  }
  boost::log::core::get()->remove_sink(sink);
  // Stopping the feeding thread drains what the part tasks queued
  sink->stop();
  sink->flush();
  sink.reset();
}

}  // namespace

const char* severity_name(severity_level level) {
  auto index = static_cast<size_t>(level);
  if (index < sizeof(kSeverityNames) / sizeof(*kSeverityNames)) {
    return kSeverityNames[index];
  }
  return nullptr;
}

std::optional<severity_level> parse_severity_level(const std::string& level_str) {
  std::string lower = to_lower(level_str);
  if (lower == "warning") {
    return severity_level::warn;
  }
  for (size_t i = 0; i < sizeof(kSeverityNames) / sizeof(*kSeverityNames); ++i) {
    if (lower == to_lower(kSeverityNames[i])) {
      return static_cast<severity_level>(i);
    }
  }
  return std::nullopt;
}

void apply_env_overrides(LoggingConfig& config) {
  override_level("CIRRUS_LOG_LEVEL", config.console_level);
  override_level("CIRRUS_LOG_LEVEL", config.file_level);
  override_level("CIRRUS_LOG_CONSOLE_LEVEL", config.console_level);
  override_level("CIRRUS_LOG_FILE_LEVEL", config.file_level);

  override_flag("CIRRUS_LOG_CONSOLE_ENABLED", config.console_enabled);
  override_flag("CIRRUS_LOG_FILE_ENABLED", config.file_enabled);

  if (const char* dir = env_value("CIRRUS_LOG_FILE_DIR")) {
    config.file_config.directory = dir;
  }
  if (const char* format = env_value("CIRRUS_LOG_FORMAT")) {
    config.file_config.format_json = (to_lower(format) == "json");
  }
}

logger_type& get_logger() {
  static logger_type instance;
  return instance;
}

bool init_logging(const LoggingConfig& config) {
  ActiveSinks& sinks = active_sinks();
  std::lock_guard<std::mutex> lock(sinks.mutex);
  if (sinks.initialized) {
    return false;
  }

  auto core = boost::log::core::get();
  // TimeStamp and ThreadID feed both formatters
  boost::log::add_common_attributes();

  if (config.console_enabled) {
    sinks.console = create_console_sink(config.console_level, config.console_colors);
    core->add_sink(sinks.console);
  }
  if (config.file_enabled) {
    sinks.file = create_file_sink(config.file_config, config.file_level);
    core->add_sink(sinks.file);
  }

  sinks.initialized = true;
  return true;
}

void shutdown_logging() {
  ActiveSinks& sinks = active_sinks();
  std::lock_guard<std::mutex> lock(sinks.mutex);
  if (!sinks.initialized) {
    return;
  }
  detach(sinks.console);
  detach(sinks.file);
  sinks.initialized = false;
}

}  // namespace logging
}  // namespace cirrus
