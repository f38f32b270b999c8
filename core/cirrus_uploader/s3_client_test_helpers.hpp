// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef CIRRUS_S3_CLIENT_TEST_HELPERS_HPP
#define CIRRUS_S3_CLIENT_TEST_HELPERS_HPP

// This header is for testing only - exposes internal implementations

#include <cstdint>
#include <string>

#include "s3_client.hpp"

namespace cirrus {
namespace uploader {

// Defined in s3_client.cpp

/**
 * Clamp a presign expiry into [1, MAX_PRESIGN_EXPIRY_SEC]
 */
uint64_t clampPresignExpiryImpl(uint64_t expires_in_sec);

}  // namespace uploader
}  // namespace cirrus

#endif  // CIRRUS_S3_CLIENT_TEST_HELPERS_HPP
