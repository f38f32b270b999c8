// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "manual_upload_manager.hpp"

#define CIRRUS_LOG_COMPONENT "manual_upload"
#include <cirrus_log_macros.hpp>

namespace cirrus {
namespace uploader {

using cirrus::logging::kv;

namespace {

StoreResult missingStore() {
  return StoreResult::Failure(OperationError::make(
    ErrorKind::SESSION_STATE, UploadStage::SESSION_START, "no object store configured"
  ));
}

}  // namespace

StoreResult ManualUploadManager::open(
  std::shared_ptr<IObjectStore> store, const UploadTarget& target,
  std::unique_ptr<ManualUploadManager>& manager
) {
  if (!store) {
    return missingStore();
  }

  std::unique_ptr<MultipartSession> session;
  StoreResult started = MultipartSession::start(*store, target, session);
  if (!started.success) {
    return started;
  }

  manager =
    std::make_unique<ManualUploadManager>(OpenTag{}, std::move(store), std::move(session));
  return started;
}

PartUploadResult ManualUploadManager::uploadPart(const std::vector<char>& bytes) {
  int part_number = session_->nextPartNumber();
  return session_->uploadPart(part_number, bytes);
}

StoreResult PresignedManualUploadManager::open(
  std::shared_ptr<IObjectStore> store, const UploadTarget& target, uint64_t default_expiry_sec,
  std::unique_ptr<PresignedManualUploadManager>& manager
) {
  if (!store) {
    return missingStore();
  }

  std::unique_ptr<MultipartSession> session;
  StoreResult started = MultipartSession::start(*store, target, session);
  if (!started.success) {
    return started;
  }

  manager = std::make_unique<PresignedManualUploadManager>(
    OpenTag{}, std::move(store), std::move(session), default_expiry_sec
  );
  return started;
}

PresignedPartResult PresignedManualUploadManager::nextPart(std::optional<uint64_t> expires_in_sec) {
  int part_number = session_->nextPartNumber();
  uint64_t expiry = expires_in_sec.value_or(default_expiry_sec_);

  PresignResult signed_request = session_->presignPart(part_number, expiry);
  if (!signed_request.success) {
    CIRRUS_LOG_ERROR("Presigning UploadPart failed" << kv("upload_id", session_->sessionId())
                                                    << kv("part_number", part_number)
                                                    << kv("error", signed_request.error.message));
    return PresignedPartResult::Failure(signed_request.error);
  }

  CIRRUS_LOG_DEBUG("Presigned UploadPart" << kv("upload_id", session_->sessionId())
                                          << kv("part_number", part_number)
                                          << kv("expires_in", expiry));
  return PresignedPartResult::Success(part_number, signed_request.request);
}

}  // namespace uploader
}  // namespace cirrus
