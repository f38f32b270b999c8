// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef CIRRUS_MULTIPART_SESSION_HPP
#define CIRRUS_MULTIPART_SESSION_HPP

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "part_counter.hpp"
#include "upload_types.hpp"
#include "uploader_interfaces.hpp"

namespace cirrus {
namespace uploader {

enum class SessionState {
  ACTIVE,     // Accepting parts
  COMPLETED,  // Object assembled
  ABORTED     // Discarded
};

inline std::string sessionStateToString(SessionState state) {
  switch (state) {
    case SessionState::ACTIVE:
      return "active";
    case SessionState::COMPLETED:
      return "completed";
    case SessionState::ABORTED:
      return "aborted";
    default:
      return "unknown";
  }
}

/**
 * One multipart upload session on the object store
 *
 * Owns the session id and the part number counter. uploadPart(),
 * presignPart() and nextPartNumber() may be called from several threads;
 * complete() and abort() are called once by the owner after all part work
 * has been joined. Backend failures are returned with the stage set, no call
 * is retried.
 */
class MultipartSession {
public:
  /**
   * Create a session on the store
   *
   * @param store Backend, must outlive the session
   * @param target Destination object
   * @param session Receives the new session on success
   * @return Upload id on success; SESSION_START transport error otherwise
   */
  static StoreResult start(
    IObjectStore& store, const UploadTarget& target, std::unique_ptr<MultipartSession>& session
  );

  MultipartSession(IObjectStore& store, const UploadTarget& target, const std::string& session_id);

  MultipartSession(const MultipartSession&) = delete;
  MultipartSession& operator=(const MultipartSession&) = delete;

  /**
   * Take the next part number (1, 2, 3, ...)
   */
  int nextPartNumber() { return counter_.next(); }

  /**
   * Upload bytes as the given part
   */
  PartUploadResult uploadPart(int part_number, const std::vector<char>& bytes);

  /**
   * Sign an UploadPart request for the given part
   */
  PresignResult presignPart(int part_number, uint64_t expires_in_sec);

  /**
   * Assemble the object. parts must be non-empty and ordered by part number;
   * contiguity is left to the store to judge.
   */
  StoreResult complete(const std::vector<PartResult>& parts);

  /**
   * Discard the session. Best effort: the caller reports a failure as a
   * secondary error.
   */
  StoreResult abort();

  SessionState state() const { return state_.load(); }
  const std::string& sessionId() const { return session_id_; }
  const UploadTarget& target() const { return target_; }
  int partsIssued() const { return counter_.peek() - 1; }

private:
  OperationError notActive(UploadStage stage) const;

  IObjectStore& store_;
  UploadTarget target_;
  std::string session_id_;
  PartCounter counter_;
  std::atomic<SessionState> state_{SessionState::ACTIVE};
};

}  // namespace uploader
}  // namespace cirrus

#endif  // CIRRUS_MULTIPART_SESSION_HPP
