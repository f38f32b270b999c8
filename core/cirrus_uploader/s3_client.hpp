// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef CIRRUS_S3_CLIENT_HPP
#define CIRRUS_S3_CLIENT_HPP

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "uploader_interfaces.hpp"

namespace cirrus {
namespace uploader {

/**
 * S3 configuration options
 */
struct S3Config {
  std::string endpoint_url;  // e.g., "http://localhost:9000"; empty selects AWS S3
  std::string region = "us-east-1";
  bool use_ssl = true;
  bool verify_ssl = true;

  // Credentials (if not using environment variables)
  // If empty, will read from AWS_ACCESS_KEY_ID and AWS_SECRET_ACCESS_KEY
  std::string access_key;
  std::string secret_key;

  // Timeouts (in milliseconds)
  int connect_timeout_ms = 10000;
  int request_timeout_ms = 300000;  // 5 minutes for a 5GB part on a slow link

  // AWS SDK internal retry configuration
  // Disabled by default (0): every engine call is a single attempt.
  int max_sdk_retries = 0;
};

constexpr uint64_t MAX_PRESIGN_EXPIRY_SEC = 7 * 24 * 3600;  // SigV4 limit

/**
 * S3 client wrapper around AWS SDK for C++
 *
 * Implements IObjectStore for AWS S3 and S3-compatible storage (MinIO, ...):
 * - PutObject and the multipart calls (Create, UploadPart, Complete, Abort)
 * - SigV4 query-string presigning of PutObject and UploadPart
 * - Credential auto-detection from environment variables
 * - Path-style addressing when a custom endpoint is configured
 *
 * Thread-safe: the SDK client may be shared by concurrent part uploads.
 */
class S3Client : public IObjectStore {
public:
  /**
   * Create S3 client with configuration
   *
   * @param config S3 configuration (endpoint, credentials, timeouts, etc.)
   */
  explicit S3Client(const S3Config& config);
  ~S3Client() override;

  // Non-copyable, non-movable
  S3Client(const S3Client&) = delete;
  S3Client& operator=(const S3Client&) = delete;
  S3Client(S3Client&&) = delete;
  S3Client& operator=(S3Client&&) = delete;

  StoreResult putObject(const UploadTarget& target, const std::vector<char>& body) override;

  StoreResult createMultipartUpload(const UploadTarget& target) override;

  StoreResult uploadPart(
    const UploadTarget& target, const std::string& upload_id, int part_number,
    const std::vector<char>& body
  ) override;

  StoreResult completeMultipartUpload(
    const UploadTarget& target, const std::string& upload_id, const std::vector<PartResult>& parts
  ) override;

  StoreResult abortMultipartUpload(
    const UploadTarget& target, const std::string& upload_id
  ) override;

  /**
   * Presigned requests are valid between 1 second and 7 days; other
   * expiries are clamped into that range.
   */
  PresignResult presignPutObject(const UploadTarget& target, uint64_t expires_in_sec) override;

  PresignResult presignUploadPart(
    const UploadTarget& target, const std::string& upload_id, int part_number,
    uint64_t expires_in_sec
  ) override;

  /**
   * Check if an error code is retryable
   *
   * @param error_code S3 error code
   * @return true if the error is transient (reported as a hint only)
   */
  static bool isRetryableError(const std::string& error_code);

  /**
   * Get the endpoint URL
   */
  const std::string& endpoint() const;

  const std::string& region() const;

private:
  class Impl;
  std::unique_ptr<Impl> impl_;
};

}  // namespace uploader
}  // namespace cirrus

#endif  // CIRRUS_S3_CLIENT_HPP
