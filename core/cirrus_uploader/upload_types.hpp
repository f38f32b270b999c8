// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef CIRRUS_UPLOAD_TYPES_HPP
#define CIRRUS_UPLOAD_TYPES_HPP

#include <cstdint>
#include <functional>
#include <map>
#include <string>

namespace cirrus {
namespace uploader {

/**
 * Destination of an upload. Both fields must be non-empty; existence of the
 * bucket is left to the object store.
 */
struct UploadTarget {
  std::string bucket;
  std::string key;

  bool valid() const { return !bucket.empty() && !key.empty(); }
};

/**
 * One uploaded part as reported to CompleteMultipartUpload
 */
struct PartResult {
  int part_number = 0;        // 1-based
  std::string integrity_tag;  // ETag returned by the store, passed back verbatim
};

/**
 * Signed request the caller executes itself
 */
struct PresignedRequest {
  std::string method;  // "PUT"
  std::string url;
  std::map<std::string, std::string> headers;
  uint64_t expires_in_sec = 0;
};

/**
 * Error classification
 */
enum class ErrorKind {
  NONE,
  TRANSPORT,       // Backend call failed (never retried)
  SESSION_STATE,   // Operation on a session that cannot accept it
  CONCURRENCY,     // A part task could not be joined
  IO,              // Reading the source failed
  INVALID_TARGET   // Empty bucket or key
};

inline std::string errorKindToString(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::NONE:
      return "none";
    case ErrorKind::TRANSPORT:
      return "transport";
    case ErrorKind::SESSION_STATE:
      return "session_state";
    case ErrorKind::CONCURRENCY:
      return "concurrency";
    case ErrorKind::IO:
      return "io";
    case ErrorKind::INVALID_TARGET:
      return "invalid_target";
    default:
      return "unknown";
  }
}

/**
 * Step of an upload at which an error occurred
 */
enum class UploadStage {
  NONE,
  READ,
  SINGLE_PUT,
  SESSION_START,
  PART_UPLOAD,
  COMPLETE,
  ABORT,
  DISPATCH,
  JOIN,
  PRESIGN
};

inline std::string uploadStageToString(UploadStage stage) {
  switch (stage) {
    case UploadStage::NONE:
      return "none";
    case UploadStage::READ:
      return "read";
    case UploadStage::SINGLE_PUT:
      return "single_put";
    case UploadStage::SESSION_START:
      return "session_start";
    case UploadStage::PART_UPLOAD:
      return "part_upload";
    case UploadStage::COMPLETE:
      return "complete";
    case UploadStage::ABORT:
      return "abort";
    case UploadStage::DISPATCH:
      return "dispatch";
    case UploadStage::JOIN:
      return "join";
    case UploadStage::PRESIGN:
      return "presign";
    default:
      return "unknown";
  }
}

/**
 * Error details carried by every failed result
 */
struct OperationError {
  ErrorKind kind = ErrorKind::NONE;
  UploadStage stage = UploadStage::NONE;
  std::string message;
  std::string code;           // Backend error code (SDK exception name)
  bool is_retryable = false;  // Informational only, the engine never retries
  int part_number = 0;        // Set for PART_UPLOAD errors

  static OperationError make(
    ErrorKind kind, UploadStage stage, const std::string& message, const std::string& code = "",
    bool retryable = false
  ) {
    OperationError error;
    error.kind = kind;
    error.stage = stage;
    error.message = message;
    error.code = code;
    error.is_retryable = retryable;
    return error;
  }

  std::string describe() const {
    std::string text = uploadStageToString(stage) + " failed (" + errorKindToString(kind) + ")";
    if (part_number > 0) {
      text += " part " + std::to_string(part_number);
    }
    text += ": " + message;
    if (!code.empty()) {
      text += " [" + code + "]";
    }
    return text;
  }
};

/**
 * Result of a single object store call.
 * value holds the ETag (PutObject, UploadPart), the upload id
 * (CreateMultipartUpload) or is empty.
 */
struct StoreResult {
  bool success = false;
  std::string value;
  OperationError error;

  static StoreResult Success(const std::string& value = "") {
    StoreResult result;
    result.success = true;
    result.value = value;
    return result;
  }

  /**
   * Backend failure. The stage is filled in by the caller that knows it.
   */
  static StoreResult Failure(
    const std::string& message, const std::string& code = "", bool retryable = false
  ) {
    StoreResult result;
    result.error = OperationError::make(
      ErrorKind::TRANSPORT, UploadStage::NONE, message, code, retryable
    );
    return result;
  }

  static StoreResult Failure(const OperationError& error) {
    StoreResult result;
    result.error = error;
    return result;
  }
};

/**
 * Result of a presign call
 */
struct PresignResult {
  bool success = false;
  PresignedRequest request;
  OperationError error;

  static PresignResult Success(const PresignedRequest& request) {
    PresignResult result;
    result.success = true;
    result.request = request;
    return result;
  }

  static PresignResult Failure(const OperationError& error) {
    PresignResult result;
    result.error = error;
    return result;
  }
};

/**
 * Result of uploading one part through a session
 */
struct PartUploadResult {
  bool success = false;
  PartResult part;
  OperationError error;

  static PartUploadResult Success(int part_number, const std::string& integrity_tag) {
    PartUploadResult result;
    result.success = true;
    result.part.part_number = part_number;
    result.part.integrity_tag = integrity_tag;
    return result;
  }

  static PartUploadResult Failure(const OperationError& error) {
    PartUploadResult result;
    result.part.part_number = error.part_number;
    result.error = error;
    return result;
  }
};

/**
 * Result of PresignedManualUploadManager::nextPart
 */
struct PresignedPartResult {
  bool success = false;
  int part_number = 0;
  PresignedRequest request;
  OperationError error;

  static PresignedPartResult Success(int part_number, const PresignedRequest& request) {
    PresignedPartResult result;
    result.success = true;
    result.part_number = part_number;
    result.request = request;
    return result;
  }

  static PresignedPartResult Failure(const OperationError& error) {
    PresignedPartResult result;
    result.part_number = error.part_number;
    result.error = error;
    return result;
  }
};

/**
 * Terminal result of a streaming upload
 */
struct UploadOutcome {
  bool success = false;
  uint64_t bytes_uploaded = 0;  // Total bytes read from the source
  std::string upload_id;        // Multipart session id, empty for single PUT
  OperationError error;         // First failure
  std::string abort_error;      // Set when the cleanup abort itself failed

  static UploadOutcome Success(uint64_t bytes, const std::string& upload_id = "") {
    UploadOutcome outcome;
    outcome.success = true;
    outcome.bytes_uploaded = bytes;
    outcome.upload_id = upload_id;
    return outcome;
  }

  static UploadOutcome Failure(
    const OperationError& error, uint64_t bytes_read = 0, const std::string& upload_id = "",
    const std::string& abort_error = ""
  ) {
    UploadOutcome outcome;
    outcome.bytes_uploaded = bytes_read;
    outcome.upload_id = upload_id;
    outcome.error = error;
    outcome.abort_error = abort_error;
    return outcome;
  }
};

/**
 * Progress callback type
 *
 * Invoked from part upload threads after every finished part, and once after
 * a single PUT. Calls are serialized.
 *
 * @param bytes_uploaded Bytes persisted by the store so far
 * @param bytes_read Bytes read from the source so far (the final size is
 *                   unknown until the source ends)
 */
using ProgressCallback = std::function<void(uint64_t bytes_uploaded, uint64_t bytes_read)>;

}  // namespace uploader
}  // namespace cirrus

#endif  // CIRRUS_UPLOAD_TYPES_HPP
