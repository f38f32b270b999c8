// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "config_parser.hpp"

#include <cctype>
#include <cerrno>
#include <cstdlib>
#include <fstream>

#include <cirrus_log_init.hpp>

namespace cirrus {
namespace upload_app {

bool parse_unsigned(const std::string& text, uint64_t& value) {
  // strtoull accepts leading blanks and a minus sign, which wraps around
  if (text.empty() || !std::isdigit(static_cast<unsigned char>(text.front()))) {
    return false;
  }
  errno = 0;
  char* end = nullptr;
  unsigned long long parsed = std::strtoull(text.c_str(), &end, 10);
  if (errno == ERANGE || end != text.c_str() + text.size()) {
    return false;
  }
  value = static_cast<uint64_t>(parsed);
  return true;
}

bool ConfigParser::load_from_file(const std::string& path, CirrusConfig& config) {
  std::ifstream file(path);
  if (!file.good()) {
    last_error_ = "Config file not found or not readable: " + path;
    return false;
  }

  try {
    YAML::Node yaml = YAML::LoadFile(path);
    return load_from_string(YAML::Dump(yaml), config);
  } catch (const YAML::Exception& e) {
    last_error_ = "Failed to parse YAML file: " + std::string(e.what());
    return false;
  }
}

bool ConfigParser::load_from_string(const std::string& yaml_content, CirrusConfig& config) {
  try {
    YAML::Node node = YAML::Load(yaml_content);

    if (node["s3"]) {
      parse_s3(node["s3"], config);
    }

    if (node["engine"]) {
      parse_engine(node["engine"], config.engine);
    }

    if (node["logging"]) {
      parse_logging(node["logging"], config.logging);
    }

    return true;
  } catch (const YAML::Exception& e) {
    last_error_ = "Failed to parse YAML content: " + std::string(e.what());
    return false;
  }
}

bool ConfigParser::parse_s3(const YAML::Node& node, CirrusConfig& config) {
  auto& s3 = config.s3;
  if (node["endpoint_url"]) {
    s3.endpoint_url = node["endpoint_url"].as<std::string>();
  }
  if (node["bucket"]) {
    config.bucket = node["bucket"].as<std::string>();
  }
  if (node["region"]) {
    s3.region = node["region"].as<std::string>();
  }
  if (node["use_ssl"]) {
    s3.use_ssl = node["use_ssl"].as<bool>();
  }
  if (node["verify_ssl"]) {
    s3.verify_ssl = node["verify_ssl"].as<bool>();
  }
  if (node["access_key"]) {
    s3.access_key = node["access_key"].as<std::string>();
  }
  if (node["secret_key"]) {
    s3.secret_key = node["secret_key"].as<std::string>();
  }
  if (node["connect_timeout_ms"]) {
    s3.connect_timeout_ms = node["connect_timeout_ms"].as<int>();
  }
  if (node["request_timeout_ms"]) {
    s3.request_timeout_ms = node["request_timeout_ms"].as<int>();
  }
  if (node["max_sdk_retries"]) {
    s3.max_sdk_retries = node["max_sdk_retries"].as<int>();
  }
  if (node["presign_expiry_sec"]) {
    config.presign_expiry_sec = node["presign_expiry_sec"].as<uint64_t>();
  }
  return true;
}

bool ConfigParser::parse_engine(const YAML::Node& node, uploader::EngineConfig& engine) {
  if (node["read_buffer_size"]) {
    engine.read_buffer_size = node["read_buffer_size"].as<size_t>();
  }
  if (node["part_size_threshold"]) {
    engine.part_size_threshold = node["part_size_threshold"].as<size_t>();
  }
  if (node["max_concurrent_parts"]) {
    engine.max_concurrent_parts = node["max_concurrent_parts"].as<size_t>();
  }
  return true;
}

bool ConfigParser::parse_logging(const YAML::Node& node, LoggingConfig& logging) {
  // Parse console section
  if (node["console"]) {
    const auto& console = node["console"];
    if (console["enabled"]) {
      logging.console_enabled = console["enabled"].as<bool>();
    }
    if (console["colors"]) {
      logging.console_colors = console["colors"].as<bool>();
    }
    if (console["level"]) {
      logging.console_level = console["level"].as<std::string>();
    }
  }

  // Parse file section
  if (node["file"]) {
    const auto& file = node["file"];
    if (file["enabled"]) {
      logging.file_enabled = file["enabled"].as<bool>();
    }
    if (file["level"]) {
      logging.file_level = file["level"].as<std::string>();
    }
    if (file["directory"]) {
      logging.file_directory = file["directory"].as<std::string>();
    }
    if (file["pattern"]) {
      logging.file_pattern = file["pattern"].as<std::string>();
    }
    if (file["format"]) {
      logging.file_format = file["format"].as<std::string>();
    }
    if (file["rotation_size_mb"]) {
      logging.rotation_size_mb = file["rotation_size_mb"].as<size_t>();
    }
    if (file["max_files"]) {
      logging.max_files = file["max_files"].as<size_t>();
    }
    if (file["rotate_at_midnight"]) {
      logging.rotate_at_midnight = file["rotate_at_midnight"].as<bool>();
    }
  }

  return true;
}

bool ConfigParser::validate(const CirrusConfig& config, std::string& error_msg) {
  if (config.bucket.empty()) {
    error_msg = "s3.bucket is not configured";
    return false;
  }

  // Basic URL validation - should start with http:// or https://
  if (!config.s3.endpoint_url.empty()) {
    if (config.s3.endpoint_url.find("http://") != 0 &&
        config.s3.endpoint_url.find("https://") != 0) {
      error_msg = "Invalid s3.endpoint_url - must start with http:// or https://";
      return false;
    }
  }

  if (config.s3.connect_timeout_ms <= 0 || config.s3.request_timeout_ms <= 0) {
    error_msg = "Invalid s3 timeouts - must be > 0";
    return false;
  }

  if (config.s3.max_sdk_retries < 0) {
    error_msg = "Invalid s3.max_sdk_retries - must be >= 0";
    return false;
  }

  return true;
}

void convert_logging_config(
  const LoggingConfig& yaml_config, ::cirrus::logging::LoggingConfig& log_config
) {
  // Console settings
  log_config.console_enabled = yaml_config.console_enabled;
  log_config.console_colors = yaml_config.console_colors;

  if (auto level = ::cirrus::logging::parse_severity_level(yaml_config.console_level)) {
    log_config.console_level = *level;
  }

  // File settings
  log_config.file_enabled = yaml_config.file_enabled;

  if (auto level = ::cirrus::logging::parse_severity_level(yaml_config.file_level)) {
    log_config.file_level = *level;
  }

  // File sink config
  log_config.file_config.directory = yaml_config.file_directory;
  log_config.file_config.file_pattern = yaml_config.file_pattern;
  log_config.file_config.format_json = (yaml_config.file_format == "json");
  log_config.file_config.rotation_size_mb = yaml_config.rotation_size_mb;
  log_config.file_config.max_files = static_cast<int>(yaml_config.max_files);
  log_config.file_config.rotate_at_midnight = yaml_config.rotate_at_midnight;
}

}  // namespace upload_app
}  // namespace cirrus
