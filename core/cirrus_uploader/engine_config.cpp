// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "engine_config.hpp"

#define CIRRUS_LOG_COMPONENT "engine_config"
#include <cirrus_log_macros.hpp>

namespace cirrus {
namespace uploader {

using cirrus::logging::kv;

EngineConfig clampEngineConfig(const EngineConfig& config) {
  EngineConfig clamped = config;

  if (clamped.read_buffer_size < MIN_READ_BUFFER_SIZE) {
    CIRRUS_LOG_WARN(
      "read_buffer_size below minimum, clamping" << kv("requested", config.read_buffer_size)
                                                 << kv("used", MIN_READ_BUFFER_SIZE)
    );
    clamped.read_buffer_size = MIN_READ_BUFFER_SIZE;
  }

  if (clamped.part_size_threshold < MIN_PART_SIZE) {
    CIRRUS_LOG_WARN(
      "part_size_threshold below S3 minimum (5MB), clamping"
      << kv("requested", config.part_size_threshold) << kv("used", MIN_PART_SIZE)
    );
    clamped.part_size_threshold = MIN_PART_SIZE;
  }

  if (clamped.max_concurrent_parts < MIN_CONCURRENT_PARTS) {
    CIRRUS_LOG_WARN(
      "max_concurrent_parts below minimum, clamping"
      << kv("requested", config.max_concurrent_parts) << kv("used", MIN_CONCURRENT_PARTS)
    );
    clamped.max_concurrent_parts = MIN_CONCURRENT_PARTS;
  }

  return clamped;
}

}  // namespace uploader
}  // namespace cirrus
