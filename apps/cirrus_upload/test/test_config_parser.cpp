// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

/**
 * @file test_config_parser.cpp
 * @brief Unit tests for ConfigParser and CirrusConfig
 *
 * Tests YAML parsing, validation and the logging config conversion.
 */

#include <gtest/gtest.h>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <string>

#include "../config_parser.hpp"

#include <cirrus_log_init.hpp>

namespace fs = std::filesystem;

using namespace cirrus::upload_app;

// ============================================================================
// Test Fixtures
// ============================================================================

class ConfigParserTest : public ::testing::Test {
protected:
  void SetUp() override {
    test_dir_ = fs::temp_directory_path() /
                ("cirrus_config_test_" +
                 std::to_string(std::chrono::steady_clock::now().time_since_epoch().count()));
    fs::create_directories(test_dir_);
  }

  void TearDown() override {
    if (fs::exists(test_dir_)) {
      fs::remove_all(test_dir_);
    }
  }

  std::string write_test_file(const std::string& filename, const std::string& content) {
    auto path = test_dir_ / filename;
    std::ofstream file(path);
    file << content;
    return path.string();
  }

  fs::path test_dir_;
};

// ============================================================================
// Parsing
// ============================================================================

TEST_F(ConfigParserTest, EmptyConfigKeepsDefaults) {
  ConfigParser parser;
  CirrusConfig config;
  EXPECT_TRUE(parser.load_from_string("", config));

  EXPECT_TRUE(config.bucket.empty());
  EXPECT_TRUE(config.s3.endpoint_url.empty());
  EXPECT_EQ(config.s3.region, "us-east-1");
  EXPECT_EQ(config.s3.max_sdk_retries, 0);
  EXPECT_EQ(config.engine.read_buffer_size, 100000u);
  EXPECT_EQ(config.engine.part_size_threshold, cirrus::uploader::MIN_PART_SIZE);
  EXPECT_EQ(config.engine.max_concurrent_parts, 4u);
  EXPECT_EQ(config.presign_expiry_sec, 3600u);
  EXPECT_TRUE(config.logging.console_enabled);
  EXPECT_FALSE(config.logging.file_enabled);
}

TEST_F(ConfigParserTest, ParseFullConfig) {
  const std::string yaml = R"(
s3:
  endpoint_url: http://minio:9000
  bucket: media
  region: eu-west-1
  use_ssl: false
  verify_ssl: false
  access_key: minioadmin
  secret_key: miniosecret
  connect_timeout_ms: 2000
  request_timeout_ms: 60000
  max_sdk_retries: 2
  presign_expiry_sec: 900

engine:
  read_buffer_size: 65536
  part_size_threshold: 16777216
  max_concurrent_parts: 8

logging:
  console:
    enabled: true
    colors: false
    level: debug
  file:
    enabled: true
    level: warn
    directory: /tmp/cirrus-logs
    pattern: upload_%Y%m%d.log
    format: text
    rotation_size_mb: 20
    max_files: 3
    rotate_at_midnight: false
)";

  ConfigParser parser;
  CirrusConfig config;
  ASSERT_TRUE(parser.load_from_string(yaml, config)) << parser.get_last_error();

  EXPECT_EQ(config.s3.endpoint_url, "http://minio:9000");
  EXPECT_EQ(config.bucket, "media");
  EXPECT_EQ(config.s3.region, "eu-west-1");
  EXPECT_FALSE(config.s3.use_ssl);
  EXPECT_FALSE(config.s3.verify_ssl);
  EXPECT_EQ(config.s3.access_key, "minioadmin");
  EXPECT_EQ(config.s3.secret_key, "miniosecret");
  EXPECT_EQ(config.s3.connect_timeout_ms, 2000);
  EXPECT_EQ(config.s3.request_timeout_ms, 60000);
  EXPECT_EQ(config.s3.max_sdk_retries, 2);
  EXPECT_EQ(config.presign_expiry_sec, 900u);

  EXPECT_EQ(config.engine.read_buffer_size, 65536u);
  EXPECT_EQ(config.engine.part_size_threshold, 16777216u);
  EXPECT_EQ(config.engine.max_concurrent_parts, 8u);

  EXPECT_FALSE(config.logging.console_colors);
  EXPECT_EQ(config.logging.console_level, "debug");
  EXPECT_TRUE(config.logging.file_enabled);
  EXPECT_EQ(config.logging.file_level, "warn");
  EXPECT_EQ(config.logging.file_directory, "/tmp/cirrus-logs");
  EXPECT_EQ(config.logging.file_pattern, "upload_%Y%m%d.log");
  EXPECT_EQ(config.logging.file_format, "text");
  EXPECT_EQ(config.logging.rotation_size_mb, 20u);
  EXPECT_EQ(config.logging.max_files, 3u);
  EXPECT_FALSE(config.logging.rotate_at_midnight);
}

TEST_F(ConfigParserTest, EngineValuesBelowMinimumAreNotRejected) {
  const std::string yaml = R"(
s3:
  bucket: media
engine:
  read_buffer_size: 1
  part_size_threshold: 1024
  max_concurrent_parts: 0
)";

  ConfigParser parser;
  CirrusConfig config;
  ASSERT_TRUE(parser.load_from_string(yaml, config));
  EXPECT_EQ(config.engine.part_size_threshold, 1024u);

  std::string error;
  EXPECT_TRUE(ConfigParser::validate(config, error)) << error;

  auto clamped = cirrus::uploader::clampEngineConfig(config.engine);
  EXPECT_EQ(clamped.read_buffer_size, cirrus::uploader::MIN_READ_BUFFER_SIZE);
  EXPECT_EQ(clamped.part_size_threshold, cirrus::uploader::MIN_PART_SIZE);
  EXPECT_EQ(clamped.max_concurrent_parts, cirrus::uploader::MIN_CONCURRENT_PARTS);
}

TEST_F(ConfigParserTest, LoadFromFile) {
  auto path = write_test_file("cirrus.yaml", R"(
s3:
  bucket: from-file
engine:
  max_concurrent_parts: 2
)");

  ConfigParser parser;
  CirrusConfig config;
  ASSERT_TRUE(parser.load_from_file(path, config)) << parser.get_last_error();
  EXPECT_EQ(config.bucket, "from-file");
  EXPECT_EQ(config.engine.max_concurrent_parts, 2u);
}

TEST_F(ConfigParserTest, LoadFromMissingFileFails) {
  ConfigParser parser;
  CirrusConfig config;
  EXPECT_FALSE(parser.load_from_file((test_dir_ / "absent.yaml").string(), config));
  EXPECT_NE(parser.get_last_error().find("not found"), std::string::npos);
}

// ============================================================================
// Edge Cases and Error Handling
// ============================================================================

TEST_F(ConfigParserTest, MalformedYamlHandling) {
  const std::string yaml = R"(
s3:
  bucket: [unterminated
engine:
  broken
)";

  ConfigParser parser;
  CirrusConfig config;
  EXPECT_FALSE(parser.load_from_string(yaml, config));
  EXPECT_FALSE(parser.get_last_error().empty());
}

TEST_F(ConfigParserTest, WrongValueTypeFails) {
  const std::string yaml = R"(
engine:
  max_concurrent_parts: many
)";

  ConfigParser parser;
  CirrusConfig config;
  EXPECT_FALSE(parser.load_from_string(yaml, config));
  EXPECT_FALSE(parser.get_last_error().empty());
}

TEST_F(ConfigParserTest, UnknownSectionsAreIgnored) {
  const std::string yaml = R"(
s3:
  bucket: media
metrics:
  enabled: true
)";

  ConfigParser parser;
  CirrusConfig config;
  EXPECT_TRUE(parser.load_from_string(yaml, config));
  EXPECT_EQ(config.bucket, "media");
}

// ============================================================================
// Validation
// ============================================================================

TEST_F(ConfigParserTest, ValidatePassesWithBucketOnly) {
  CirrusConfig config;
  config.bucket = "media";

  std::string error;
  EXPECT_TRUE(ConfigParser::validate(config, error));
  EXPECT_TRUE(error.empty());
}

TEST_F(ConfigParserTest, ValidateFailsWithMissingBucket) {
  CirrusConfig config;

  std::string error;
  EXPECT_FALSE(ConfigParser::validate(config, error));
  EXPECT_NE(error.find("bucket"), std::string::npos);
}

TEST_F(ConfigParserTest, ValidateFailsWithMalformedEndpoint) {
  CirrusConfig config;
  config.bucket = "media";
  config.s3.endpoint_url = "minio:9000";

  std::string error;
  EXPECT_FALSE(ConfigParser::validate(config, error));
  EXPECT_NE(error.find("endpoint_url"), std::string::npos);
}

TEST_F(ConfigParserTest, ValidateAcceptsHttpsEndpoint) {
  CirrusConfig config;
  config.bucket = "media";
  config.s3.endpoint_url = "https://s3.example.com";

  std::string error;
  EXPECT_TRUE(ConfigParser::validate(config, error)) << error;
}

TEST_F(ConfigParserTest, ValidateFailsWithNonPositiveTimeout) {
  CirrusConfig config;
  config.bucket = "media";
  config.s3.request_timeout_ms = 0;

  std::string error;
  EXPECT_FALSE(ConfigParser::validate(config, error));
}

TEST_F(ConfigParserTest, ValidateFailsWithNegativeRetries) {
  CirrusConfig config;
  config.bucket = "media";
  config.s3.max_sdk_retries = -1;

  std::string error;
  EXPECT_FALSE(ConfigParser::validate(config, error));
}

// ============================================================================
// Logging Conversion
// ============================================================================

TEST_F(ConfigParserTest, ConvertLoggingConfig) {
  LoggingConfig yaml_config;
  yaml_config.console_colors = false;
  yaml_config.console_level = "warn";
  yaml_config.file_enabled = true;
  yaml_config.file_level = "error";
  yaml_config.file_directory = "/tmp/cirrus";
  yaml_config.file_format = "text";
  yaml_config.rotation_size_mb = 7;
  yaml_config.max_files = 2;

  cirrus::logging::LoggingConfig log_config;
  convert_logging_config(yaml_config, log_config);

  EXPECT_FALSE(log_config.console_colors);
  EXPECT_EQ(log_config.console_level, cirrus::logging::severity_level::warn);
  EXPECT_TRUE(log_config.file_enabled);
  EXPECT_EQ(log_config.file_level, cirrus::logging::severity_level::error);
  EXPECT_EQ(log_config.file_config.directory, "/tmp/cirrus");
  EXPECT_FALSE(log_config.file_config.format_json);
  EXPECT_EQ(log_config.file_config.rotation_size_mb, 7u);
  EXPECT_EQ(log_config.file_config.max_files, 2);
}

TEST_F(ConfigParserTest, ConvertLoggingConfigKeepsDefaultForUnknownLevel) {
  LoggingConfig yaml_config;
  yaml_config.console_level = "chatty";

  cirrus::logging::LoggingConfig log_config;
  convert_logging_config(yaml_config, log_config);

  EXPECT_EQ(log_config.console_level, cirrus::logging::severity_level::info);
  EXPECT_TRUE(log_config.file_config.format_json);
}

// ============================================================================
// Command line numbers
// ============================================================================

TEST(ParseUnsignedTest, AcceptsPlainDecimal) {
  uint64_t value = 7;
  EXPECT_TRUE(parse_unsigned("0", value));
  EXPECT_EQ(value, 0u);
  EXPECT_TRUE(parse_unsigned("8388608", value));
  EXPECT_EQ(value, 8388608u);
  EXPECT_TRUE(parse_unsigned("18446744073709551615", value));
  EXPECT_EQ(value, UINT64_MAX);
}

TEST(ParseUnsignedTest, RejectsSignedAndMalformedInput) {
  uint64_t value = 42;
  EXPECT_FALSE(parse_unsigned("-1", value));
  EXPECT_FALSE(parse_unsigned("+4", value));
  EXPECT_FALSE(parse_unsigned(" 4", value));
  EXPECT_FALSE(parse_unsigned("", value));
  EXPECT_FALSE(parse_unsigned("four", value));
  EXPECT_FALSE(parse_unsigned("4k", value));
  EXPECT_FALSE(parse_unsigned("18446744073709551616", value));
  EXPECT_EQ(value, 42u);
}
