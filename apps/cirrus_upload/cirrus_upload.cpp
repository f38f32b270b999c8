// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include <nlohmann/json.hpp>

#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <memory>
#include <string>

#include "config_parser.hpp"

#include <cirrus_log_init.hpp>
#include <s3_client.hpp>
#include <upload_client.hpp>
#include <uploader_impl.hpp>

namespace cirrus {
namespace upload_app {

namespace {

void print_usage(const char* program_name) {
  std::cout
    << "Usage: " << program_name << " [OPTIONS] FILE|-\n"
    << "\n"
    << "Cirrus Upload - Streaming multipart upload to S3-compatible storage\n"
    << "\n"
    << "Options:\n"
    << "  --config PATH         Path to YAML configuration file\n"
    << "  --endpoint URL        S3 endpoint (empty selects AWS S3)\n"
    << "  --region REGION       S3 region (default: us-east-1)\n"
    << "  --bucket NAME         Target bucket\n"
    << "  --key KEY             Target object key (default: file name)\n"
    << "  --buffer-size BYTES   Read buffer size (default: 100000)\n"
    << "  --part-size BYTES     Part size threshold (default: 5242880, minimum)\n"
    << "  --concurrency N       Maximum parts in flight (default: 4)\n"
    << "  --presign SECONDS     Print a presigned PUT request as JSON instead of\n"
    << "                        uploading\n"
    << "  --help                Show this help message\n"
    << "\n"
    << "  FILE                  Local file to upload, or - to read standard input\n"
    << "\n"
    << "Credentials:\n"
    << "  Taken from s3.access_key/s3.secret_key in the config file, otherwise\n"
    << "  from AWS_ACCESS_KEY_ID and AWS_SECRET_ACCESS_KEY.\n"
    << "\n"
    << "Configuration File:\n"
    << "  Command-line arguments OVERRIDE config file values.\n"
    << "  Example config file structure:\n"
    << "  s3:\n"
    << "    endpoint_url: http://localhost:9000\n"
    << "    bucket: uploads\n"
    << "    region: us-east-1\n"
    << "  engine:\n"
    << "    read_buffer_size: 100000\n"
    << "    part_size_threshold: 8388608\n"
    << "    max_concurrent_parts: 4\n"
    << "  logging:\n"
    << "    console:\n"
    << "      level: info\n"
    << "\n"
    << "Examples:\n"
    << "  # Upload a file with settings from a config file\n"
    << "  " << program_name << " --config config/default_config.yaml video.mp4\n"
    << "\n"
    << "  # Stream standard input to a MinIO bucket\n"
    << "  tar c data/ | " << program_name << " --endpoint http://localhost:9000 \\\n"
    << "    --bucket backups --key data.tar --part-size 16777216 -\n"
    << "\n"
    << "  # Hand out a one-hour upload URL\n"
    << "  " << program_name << " --bucket uploads --key report.pdf --presign 3600\n"
    << std::endl;
}

std::string base_name(const std::string& path) {
  auto pos = path.find_last_of('/');
  if (pos == std::string::npos) {
    return path;
  }
  return path.substr(pos + 1);
}

void print_error(const uploader::OperationError& error, const std::string& abort_error) {
  std::cerr << "Error: " << error.describe() << std::endl;
  if (!abort_error.empty()) {
    std::cerr << "Error: cleanup abort failed, session may be orphaned: " << abort_error
              << std::endl;
  }
}

}  // namespace

}  // namespace upload_app
}  // namespace cirrus

int main(int argc, char* argv[]) {
  using namespace cirrus::upload_app;
  namespace uploader = cirrus::uploader;

  // Check for help flag
  for (int i = 1; i < argc; ++i) {
    if (strcmp(argv[i], "--help") == 0 || strcmp(argv[i], "-h") == 0) {
      print_usage(argv[0]);
      return 0;
    }
  }

  // Step 1: Parse command line arguments
  std::string config_file;
  std::string cli_endpoint;
  std::string cli_region;
  std::string cli_bucket;
  std::string cli_key;
  size_t cli_buffer_size = 0;
  size_t cli_part_size = 0;
  size_t cli_concurrency = 0;
  uint64_t cli_presign_sec = 0;
  bool presign_mode = false;
  std::string input_path;

  for (int i = 1; i < argc; ++i) {
    if (strcmp(argv[i], "--config") == 0) {
      if (i + 1 < argc) {
        config_file = argv[++i];
      } else {
        std::cerr << "Error: --config requires a file argument" << std::endl;
        return 1;
      }
    } else if (strcmp(argv[i], "--endpoint") == 0) {
      if (i + 1 < argc) {
        cli_endpoint = argv[++i];
      } else {
        std::cerr << "Error: --endpoint requires a URL argument" << std::endl;
        return 1;
      }
    } else if (strcmp(argv[i], "--region") == 0) {
      if (i + 1 < argc) {
        cli_region = argv[++i];
      } else {
        std::cerr << "Error: --region requires a region argument" << std::endl;
        return 1;
      }
    } else if (strcmp(argv[i], "--bucket") == 0) {
      if (i + 1 < argc) {
        cli_bucket = argv[++i];
      } else {
        std::cerr << "Error: --bucket requires a name argument" << std::endl;
        return 1;
      }
    } else if (strcmp(argv[i], "--key") == 0) {
      if (i + 1 < argc) {
        cli_key = argv[++i];
      } else {
        std::cerr << "Error: --key requires a key argument" << std::endl;
        return 1;
      }
    } else if (strcmp(argv[i], "--buffer-size") == 0) {
      uint64_t value = 0;
      if (i + 1 < argc && parse_unsigned(argv[++i], value)) {
        cli_buffer_size = static_cast<size_t>(value);
      } else {
        std::cerr << "Error: --buffer-size requires a non-negative integer" << std::endl;
        return 1;
      }
    } else if (strcmp(argv[i], "--part-size") == 0) {
      uint64_t value = 0;
      if (i + 1 < argc && parse_unsigned(argv[++i], value)) {
        cli_part_size = static_cast<size_t>(value);
      } else {
        std::cerr << "Error: --part-size requires a non-negative integer" << std::endl;
        return 1;
      }
    } else if (strcmp(argv[i], "--concurrency") == 0) {
      uint64_t value = 0;
      if (i + 1 < argc && parse_unsigned(argv[++i], value)) {
        cli_concurrency = static_cast<size_t>(value);
      } else {
        std::cerr << "Error: --concurrency requires a non-negative integer" << std::endl;
        return 1;
      }
    } else if (strcmp(argv[i], "--presign") == 0) {
      if (i + 1 < argc && parse_unsigned(argv[++i], cli_presign_sec)) {
        presign_mode = true;
      } else {
        std::cerr << "Error: --presign requires a number of seconds" << std::endl;
        return 1;
      }
    } else if (strcmp(argv[i], "-") == 0 || strncmp(argv[i], "--", 2) != 0) {
      if (!input_path.empty()) {
        std::cerr << "Error: Only one input may be given" << std::endl;
        return 1;
      }
      input_path = argv[i];
    } else {
      std::cerr << "Error: Unknown argument: " << argv[i] << std::endl;
      print_usage(argv[0]);
      return 1;
    }
  }

  // Step 2: Load configuration file if specified
  CirrusConfig config;
  if (!config_file.empty()) {
    ConfigParser parser;
    if (!parser.load_from_file(config_file, config)) {
      std::cerr << "Error: Failed to load config file '" << config_file
                << "': " << parser.get_last_error() << std::endl;
      return 1;
    }
  }

  // Step 3: Apply CLI argument overrides (CLI takes precedence over config file)
  if (!cli_endpoint.empty()) {
    config.s3.endpoint_url = cli_endpoint;
  }
  if (!cli_region.empty()) {
    config.s3.region = cli_region;
  }
  if (!cli_bucket.empty()) {
    config.bucket = cli_bucket;
  }
  if (cli_buffer_size > 0) {
    config.engine.read_buffer_size = cli_buffer_size;
  }
  if (cli_part_size > 0) {
    config.engine.part_size_threshold = cli_part_size;
  }
  if (cli_concurrency > 0) {
    config.engine.max_concurrent_parts = cli_concurrency;
  }
  if (presign_mode) {
    config.presign_expiry_sec = cli_presign_sec;
  }

  std::string error_msg;
  if (!ConfigParser::validate(config, error_msg)) {
    std::cerr << "Error: " << error_msg << " (use --bucket or the config file)" << std::endl;
    return 1;
  }

  std::string key = cli_key;
  if (key.empty() && !input_path.empty() && input_path != "-") {
    key = base_name(input_path);
  }
  if (key.empty()) {
    std::cerr << "Error: --key is required when reading standard input or presigning"
              << std::endl;
    print_usage(argv[0]);
    return 1;
  }
  if (!presign_mode && input_path.empty()) {
    std::cerr << "Error: FILE (or - for standard input) is required" << std::endl;
    print_usage(argv[0]);
    return 1;
  }

  // Step 4: Initialize logging (environment overrides the config file)
  cirrus::logging::LoggingConfig log_config;
  convert_logging_config(config.logging, log_config);
  cirrus::logging::apply_env_overrides(log_config);
  cirrus::logging::init_logging(log_config);

  int exit_code = 0;
  {
    auto store = std::make_shared<uploader::S3Client>(config.s3);
    uploader::UploadClient client(store, config.engine);
    uploader::UploadTarget target{config.bucket, key};

    if (presign_mode) {
      auto result = client.presignObjectUpload(target, config.presign_expiry_sec);
      if (result.success) {
        nlohmann::json out;
        out["method"] = result.request.method;
        out["url"] = result.request.url;
        out["headers"] = result.request.headers;
        out["expires_in_sec"] = result.request.expires_in_sec;
        std::cout << out.dump(2) << std::endl;
      } else {
        print_error(result.error, "");
        exit_code = 1;
      }
    } else {
      auto progress = [](uint64_t bytes_uploaded, uint64_t bytes_read) {
        std::cerr << "\rUploaded: " << bytes_uploaded << " of " << bytes_read << " bytes read   "
                  << std::flush;
      };

      uploader::UploadOutcome outcome;
      if (input_path == "-") {
        uploader::StreamByteSource source(std::cin);
        outcome = client.uploadStream(target, source, progress);
      } else {
        outcome = client.uploadFile(input_path, target, progress);
      }
      std::cerr << std::endl;

      if (outcome.success) {
        nlohmann::json out;
        out["bucket"] = target.bucket;
        out["key"] = target.key;
        out["bytes"] = outcome.bytes_uploaded;
        out["multipart"] = !outcome.upload_id.empty();
        if (!outcome.upload_id.empty()) {
          out["upload_id"] = outcome.upload_id;
        }
        std::cout << out.dump(2) << std::endl;
      } else {
        print_error(outcome.error, outcome.abort_error);
        exit_code = 1;
      }
    }
  }

  cirrus::logging::shutdown_logging();
  return exit_code;
}
