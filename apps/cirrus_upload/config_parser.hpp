// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef CIRRUS_UPLOAD_CONFIG_PARSER_HPP
#define CIRRUS_UPLOAD_CONFIG_PARSER_HPP

#include <yaml-cpp/yaml.h>

#include <cstddef>
#include <cstdint>
#include <string>

#include <engine_config.hpp>
#include <s3_client.hpp>

namespace cirrus {
namespace logging {
struct LoggingConfig;
}
}  // namespace cirrus

namespace cirrus {
namespace upload_app {

/**
 * Logging section as written in YAML (levels and format as strings)
 */
struct LoggingConfig {
  bool console_enabled = true;
  bool console_colors = true;
  std::string console_level = "info";

  bool file_enabled = false;
  std::string file_level = "debug";
  std::string file_directory = "/var/log/cirrus";
  std::string file_pattern = "cirrus_%Y%m%d_%H%M%S.log";
  std::string file_format = "json";
  size_t rotation_size_mb = 100;
  size_t max_files = 10;
  bool rotate_at_midnight = true;
};

/**
 * Everything the cirrus_upload tool needs
 */
struct CirrusConfig {
  uploader::S3Config s3;
  std::string bucket;
  uploader::EngineConfig engine;
  LoggingConfig logging;
  uint64_t presign_expiry_sec = 3600;
};

/**
 * Convert LoggingConfig to cirrus::logging::LoggingConfig.
 * Unknown level names keep the library defaults.
 */
void convert_logging_config(
  const LoggingConfig& yaml_config, ::cirrus::logging::LoggingConfig& log_config
);

/**
 * Parse a whole decimal command line value. Signs, blanks, trailing
 * characters and values beyond uint64_t are rejected.
 */
bool parse_unsigned(const std::string& text, uint64_t& value);

/**
 * YAML configuration loader
 *
 * Sections: s3, engine, logging. Missing keys keep their defaults; engine
 * values are clamped by the engine, never rejected here.
 */
class ConfigParser {
public:
  ConfigParser() = default;

  /**
   * Load configuration from YAML file
   */
  bool load_from_file(const std::string& path, CirrusConfig& config);

  /**
   * Load configuration from YAML string
   */
  bool load_from_string(const std::string& yaml_content, CirrusConfig& config);

  /**
   * Validate configuration: bucket required, endpoint must be http(s)
   */
  static bool validate(const CirrusConfig& config, std::string& error_msg);

  /**
   * Get last error message
   */
  std::string get_last_error() const {
    return last_error_;
  }

private:
  bool parse_s3(const YAML::Node& node, CirrusConfig& config);
  bool parse_engine(const YAML::Node& node, uploader::EngineConfig& engine);
  bool parse_logging(const YAML::Node& node, LoggingConfig& logging);

  // Last error message
  mutable std::string last_error_;
};

}  // namespace upload_app
}  // namespace cirrus

#endif  // CIRRUS_UPLOAD_CONFIG_PARSER_HPP
