// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef CIRRUS_UPLOAD_CLIENT_HPP
#define CIRRUS_UPLOAD_CLIENT_HPP

#include <cstdint>
#include <memory>
#include <string>

#include "engine_config.hpp"
#include "manual_upload_manager.hpp"
#include "upload_types.hpp"
#include "uploader_interfaces.hpp"

namespace cirrus {
namespace uploader {

/**
 * Entry point for uploads to one object store
 *
 * Holds the backend and the default engine settings. Streaming uploads run
 * on the calling thread plus a per-upload pool of part workers; independent
 * uploads may run concurrently.
 */
class UploadClient {
public:
  UploadClient(std::shared_ptr<IObjectStore> store, const EngineConfig& config = EngineConfig{});

  /**
   * Upload everything source yields, single PUT or multipart by size
   */
  UploadOutcome uploadStream(
    const UploadTarget& target, IByteSource& source, ProgressCallback progress_cb = nullptr
  );

  /**
   * Same as uploadStream() with per-call engine settings
   */
  UploadOutcome uploadStream(
    const UploadTarget& target, IByteSource& source, const EngineConfig& config,
    ProgressCallback progress_cb = nullptr
  );

  /**
   * Upload a local file; a file that cannot be opened is an IO error
   */
  UploadOutcome uploadFile(
    const std::string& local_path, const UploadTarget& target,
    ProgressCallback progress_cb = nullptr
  );

  UploadOutcome uploadFile(
    const std::string& local_path, const UploadTarget& target, const EngineConfig& config,
    ProgressCallback progress_cb = nullptr
  );

  /**
   * Start a caller-driven multipart session
   */
  StoreResult openManualSession(
    const UploadTarget& target, std::unique_ptr<ManualUploadManager>& manager
  );

  /**
   * Start a caller-driven session handing out signed UploadPart requests
   */
  StoreResult openPresignedManualSession(
    const UploadTarget& target, uint64_t default_expiry_sec,
    std::unique_ptr<PresignedManualUploadManager>& manager
  );

  /**
   * Sign a single PUT of the whole object
   */
  PresignResult presignObjectUpload(const UploadTarget& target, uint64_t expires_in_sec);

  const EngineConfig& config() const { return config_; }

private:
  std::shared_ptr<IObjectStore> store_;
  EngineConfig config_;
};

}  // namespace uploader
}  // namespace cirrus

#endif  // CIRRUS_UPLOAD_CLIENT_HPP
