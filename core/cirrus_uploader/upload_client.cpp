// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "upload_client.hpp"

#include <utility>

#include "stream_uploader.hpp"
#include "uploader_impl.hpp"

#define CIRRUS_LOG_COMPONENT "upload_client"
#include <cirrus_log_macros.hpp>

namespace cirrus {
namespace uploader {

using cirrus::logging::kv;

UploadClient::UploadClient(std::shared_ptr<IObjectStore> store, const EngineConfig& config)
    : store_(std::move(store))
    , config_(clampEngineConfig(config)) {}

UploadOutcome UploadClient::uploadStream(
  const UploadTarget& target, IByteSource& source, ProgressCallback progress_cb
) {
  return uploadStream(target, source, config_, std::move(progress_cb));
}

UploadOutcome UploadClient::uploadStream(
  const UploadTarget& target, IByteSource& source, const EngineConfig& config,
  ProgressCallback progress_cb
) {
  StreamUploader uploader(*store_, config);
  return uploader.upload(target, source, std::move(progress_cb));
}

UploadOutcome UploadClient::uploadFile(
  const std::string& local_path, const UploadTarget& target, ProgressCallback progress_cb
) {
  return uploadFile(local_path, target, config_, std::move(progress_cb));
}

UploadOutcome UploadClient::uploadFile(
  const std::string& local_path, const UploadTarget& target, const EngineConfig& config,
  ProgressCallback progress_cb
) {
  FileByteSource source(local_path);
  if (!source.isOpen()) {
    CIRRUS_LOG_ERROR("Cannot open local file" << kv("path", local_path));
    return UploadOutcome::Failure(OperationError::make(
      ErrorKind::IO, UploadStage::READ, "Cannot open local file: " + local_path
    ));
  }
  CIRRUS_LOG_INFO("Uploading file" << kv("path", local_path) << kv("bucket", target.bucket)
                                   << kv("key", target.key));
  return uploadStream(target, source, config, std::move(progress_cb));
}

StoreResult UploadClient::openManualSession(
  const UploadTarget& target, std::unique_ptr<ManualUploadManager>& manager
) {
  return ManualUploadManager::open(store_, target, manager);
}

StoreResult UploadClient::openPresignedManualSession(
  const UploadTarget& target, uint64_t default_expiry_sec,
  std::unique_ptr<PresignedManualUploadManager>& manager
) {
  return PresignedManualUploadManager::open(store_, target, default_expiry_sec, manager);
}

PresignResult UploadClient::presignObjectUpload(const UploadTarget& target, uint64_t expires_in_sec) {
  if (!target.valid()) {
    return PresignResult::Failure(OperationError::make(
      ErrorKind::INVALID_TARGET, UploadStage::PRESIGN, "bucket and key must be non-empty"
    ));
  }

  PresignResult result = store_->presignPutObject(target, expires_in_sec);
  if (!result.success) {
    result.error.stage = UploadStage::PRESIGN;
    CIRRUS_LOG_ERROR("Presigning PutObject failed" << kv("key", target.key)
                                                   << kv("error", result.error.message));
  }
  return result;
}

}  // namespace uploader
}  // namespace cirrus
