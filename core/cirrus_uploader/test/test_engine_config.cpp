// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

/**
 * Unit tests for EngineConfig defaults and clamping
 */

#include <gtest/gtest.h>

#include "engine_config.hpp"

using namespace cirrus::uploader;

TEST(EngineConfigTest, Defaults) {
  EngineConfig config;

  EXPECT_EQ(config.read_buffer_size, 100000u);
  EXPECT_EQ(config.part_size_threshold, 5242880u);
  EXPECT_EQ(config.max_concurrent_parts, 4u);
}

TEST(EngineConfigTest, DefaultsAreUnchangedByClamping) {
  EngineConfig clamped = clampEngineConfig(EngineConfig{});

  EXPECT_EQ(clamped.read_buffer_size, 100000u);
  EXPECT_EQ(clamped.part_size_threshold, 5242880u);
  EXPECT_EQ(clamped.max_concurrent_parts, 4u);
}

TEST(EngineConfigTest, ValuesBelowFloorAreRaised) {
  EngineConfig config;
  config.read_buffer_size = 100;
  config.part_size_threshold = 0;
  config.max_concurrent_parts = 0;

  EngineConfig clamped = clampEngineConfig(config);

  EXPECT_EQ(clamped.read_buffer_size, 4096u);
  EXPECT_EQ(clamped.part_size_threshold, 5242880u);
  EXPECT_EQ(clamped.max_concurrent_parts, 1u);
}

TEST(EngineConfigTest, ValuesAtFloorAreKept) {
  EngineConfig config;
  config.read_buffer_size = MIN_READ_BUFFER_SIZE;
  config.part_size_threshold = MIN_PART_SIZE;
  config.max_concurrent_parts = 1;

  EngineConfig clamped = clampEngineConfig(config);

  EXPECT_EQ(clamped.read_buffer_size, MIN_READ_BUFFER_SIZE);
  EXPECT_EQ(clamped.part_size_threshold, MIN_PART_SIZE);
  EXPECT_EQ(clamped.max_concurrent_parts, 1u);
}

TEST(EngineConfigTest, LargeValuesAreKept) {
  EngineConfig config;
  config.read_buffer_size = 1 << 20;
  config.part_size_threshold = 64 * 1024 * 1024;
  config.max_concurrent_parts = 32;

  EngineConfig clamped = clampEngineConfig(config);

  EXPECT_EQ(clamped.read_buffer_size, static_cast<size_t>(1 << 20));
  EXPECT_EQ(clamped.part_size_threshold, static_cast<size_t>(64 * 1024 * 1024));
  EXPECT_EQ(clamped.max_concurrent_parts, 32u);
}

TEST(EngineConfigTest, ClampingIsIdempotent) {
  EngineConfig config;
  config.read_buffer_size = 1;
  config.part_size_threshold = 1024;
  config.max_concurrent_parts = 0;

  EngineConfig once = clampEngineConfig(config);
  EngineConfig twice = clampEngineConfig(once);

  EXPECT_EQ(once.read_buffer_size, twice.read_buffer_size);
  EXPECT_EQ(once.part_size_threshold, twice.part_size_threshold);
  EXPECT_EQ(once.max_concurrent_parts, twice.max_concurrent_parts);
}
