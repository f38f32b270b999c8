// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "multipart_session.hpp"

#define CIRRUS_LOG_COMPONENT "multipart_session"
#include <cirrus_log_macros.hpp>

namespace cirrus {
namespace uploader {

using cirrus::logging::kv;

StoreResult MultipartSession::start(
  IObjectStore& store, const UploadTarget& target, std::unique_ptr<MultipartSession>& session
) {
  if (!target.valid()) {
    return StoreResult::Failure(OperationError::make(
      ErrorKind::INVALID_TARGET, UploadStage::SESSION_START, "bucket and key must be non-empty"
    ));
  }

  StoreResult result = store.createMultipartUpload(target);
  if (!result.success) {
    result.error.stage = UploadStage::SESSION_START;
    CIRRUS_LOG_ERROR("CreateMultipartUpload failed" << kv("bucket", target.bucket)
                                                    << kv("key", target.key)
                                                    << kv("error", result.error.message)
                                                    << kv("code", result.error.code));
    return result;
  }

  if (result.value.empty()) {
    return StoreResult::Failure(OperationError::make(
      ErrorKind::TRANSPORT, UploadStage::SESSION_START, "store returned an empty upload id"
    ));
  }

  session = std::make_unique<MultipartSession>(store, target, result.value);
  CIRRUS_LOG_INFO("Multipart session started" << kv("bucket", target.bucket)
                                              << kv("key", target.key)
                                              << kv("upload_id", result.value));
  return result;
}

MultipartSession::MultipartSession(
  IObjectStore& store, const UploadTarget& target, const std::string& session_id
)
    : store_(store)
    , target_(target)
    , session_id_(session_id) {}

OperationError MultipartSession::notActive(UploadStage stage) const {
  return OperationError::make(
    ErrorKind::SESSION_STATE, stage,
    "session " + session_id_ + " is " + sessionStateToString(state_.load())
  );
}

PartUploadResult MultipartSession::uploadPart(int part_number, const std::vector<char>& bytes) {
  if (state_.load() != SessionState::ACTIVE) {
    OperationError error = notActive(UploadStage::PART_UPLOAD);
    error.part_number = part_number;
    return PartUploadResult::Failure(error);
  }

  StoreResult result = store_.uploadPart(target_, session_id_, part_number, bytes);
  if (!result.success) {
    result.error.stage = UploadStage::PART_UPLOAD;
    result.error.part_number = part_number;
    CIRRUS_LOG_ERROR("UploadPart failed" << kv("part_number", part_number)
                                         << kv("bytes", bytes.size())
                                         << kv("error", result.error.message)
                                         << kv("code", result.error.code));
    return PartUploadResult::Failure(result.error);
  }

  // Complete needs every part's ETag; a part without one cannot be assembled
  if (result.value.empty()) {
    OperationError error = OperationError::make(
      ErrorKind::TRANSPORT, UploadStage::PART_UPLOAD, "store returned no ETag for the part"
    );
    error.part_number = part_number;
    CIRRUS_LOG_ERROR("UploadPart returned no ETag" << kv("part_number", part_number));
    return PartUploadResult::Failure(error);
  }

  CIRRUS_LOG_DEBUG("Part uploaded" << kv("part_number", part_number) << kv("bytes", bytes.size()));
  return PartUploadResult::Success(part_number, result.value);
}

PresignResult MultipartSession::presignPart(int part_number, uint64_t expires_in_sec) {
  if (state_.load() != SessionState::ACTIVE) {
    OperationError error = notActive(UploadStage::PRESIGN);
    error.part_number = part_number;
    return PresignResult::Failure(error);
  }

  PresignResult result =
    store_.presignUploadPart(target_, session_id_, part_number, expires_in_sec);
  if (!result.success) {
    result.error.stage = UploadStage::PRESIGN;
    result.error.part_number = part_number;
  }
  return result;
}

StoreResult MultipartSession::complete(const std::vector<PartResult>& parts) {
  if (state_.load() != SessionState::ACTIVE) {
    return StoreResult::Failure(notActive(UploadStage::COMPLETE));
  }
  if (parts.empty()) {
    return StoreResult::Failure(OperationError::make(
      ErrorKind::SESSION_STATE, UploadStage::COMPLETE, "cannot complete a session without parts"
    ));
  }

  StoreResult result = store_.completeMultipartUpload(target_, session_id_, parts);
  if (!result.success) {
    result.error.stage = UploadStage::COMPLETE;
    CIRRUS_LOG_ERROR("CompleteMultipartUpload failed" << kv("upload_id", session_id_)
                                                      << kv("parts", parts.size())
                                                      << kv("error", result.error.message)
                                                      << kv("code", result.error.code));
    return result;
  }

  state_.store(SessionState::COMPLETED);
  CIRRUS_LOG_INFO("Multipart session completed" << kv("upload_id", session_id_)
                                                << kv("parts", parts.size()));
  return result;
}

StoreResult MultipartSession::abort() {
  if (state_.load() != SessionState::ACTIVE) {
    return StoreResult::Failure(notActive(UploadStage::ABORT));
  }

  StoreResult result = store_.abortMultipartUpload(target_, session_id_);
  if (!result.success) {
    result.error.stage = UploadStage::ABORT;
    CIRRUS_LOG_WARN("AbortMultipartUpload failed, parts may linger until lifecycle cleanup"
                    << kv("upload_id", session_id_) << kv("error", result.error.message));
    return result;
  }

  state_.store(SessionState::ABORTED);
  CIRRUS_LOG_INFO("Multipart session aborted" << kv("upload_id", session_id_));
  return result;
}

}  // namespace uploader
}  // namespace cirrus
