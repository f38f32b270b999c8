// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef CIRRUS_ENGINE_CONFIG_HPP
#define CIRRUS_ENGINE_CONFIG_HPP

#include <cstddef>

namespace cirrus {
namespace uploader {

constexpr size_t MIN_READ_BUFFER_SIZE = 4096;
constexpr size_t MIN_PART_SIZE = 5 * 1024 * 1024;  // S3 minimum for every part but the last
constexpr size_t MIN_CONCURRENT_PARTS = 1;

/**
 * Tuning knobs of the streaming upload engine
 */
struct EngineConfig {
  size_t read_buffer_size = 100000;         // Bytes requested per source read
  size_t part_size_threshold = MIN_PART_SIZE;  // Accumulated bytes that make one part
  size_t max_concurrent_parts = 4;          // Part uploads in flight at once
};

/**
 * Raise every value below its floor to the floor, logging a warning for each.
 * Invalid values are never rejected. Applying it twice changes nothing.
 */
EngineConfig clampEngineConfig(const EngineConfig& config);

}  // namespace uploader
}  // namespace cirrus

#endif  // CIRRUS_ENGINE_CONFIG_HPP
