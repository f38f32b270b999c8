// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef CIRRUS_MANUAL_UPLOAD_MANAGER_HPP
#define CIRRUS_MANUAL_UPLOAD_MANAGER_HPP

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "multipart_session.hpp"
#include "upload_types.hpp"
#include "uploader_interfaces.hpp"

namespace cirrus {
namespace uploader {

/**
 * Caller-driven multipart session
 *
 * The caller decides when to send parts and when to finish. Part numbers
 * come from the session counter; the caller keeps the returned PartResults
 * and passes them to complete() in part number order. Nothing is buffered
 * or reordered here.
 */
class ManualSessionBase {
public:
  virtual ~ManualSessionBase() = default;

  ManualSessionBase(const ManualSessionBase&) = delete;
  ManualSessionBase& operator=(const ManualSessionBase&) = delete;

  StoreResult complete(const std::vector<PartResult>& parts) { return session_->complete(parts); }

  StoreResult abort() { return session_->abort(); }

  const std::string& sessionId() const { return session_->sessionId(); }
  const UploadTarget& target() const { return session_->target(); }
  SessionState state() const { return session_->state(); }

protected:
  ManualSessionBase(std::shared_ptr<IObjectStore> store, std::unique_ptr<MultipartSession> session)
      : store_(std::move(store))
      , session_(std::move(session)) {}

  std::shared_ptr<IObjectStore> store_;  // Keeps the backend alive for the session
  std::unique_ptr<MultipartSession> session_;
};

/**
 * Manual session that transfers the part bytes itself
 *
 * Usage:
 * @code
 *   std::unique_ptr<ManualUploadManager> manager;
 *   if (ManualUploadManager::open(store, target, manager).success) {
 *     auto part = manager->uploadPart(bytes);
 *     manager->complete({part.part});
 *   }
 * @endcode
 */
class ManualUploadManager : public ManualSessionBase {
  // Restricts construction to open() while keeping std::make_unique usable
  struct OpenTag {
    explicit OpenTag() = default;
  };

public:
  ManualUploadManager(
    OpenTag, std::shared_ptr<IObjectStore> store, std::unique_ptr<MultipartSession> session
  )
      : ManualSessionBase(std::move(store), std::move(session)) {}

  /**
   * Start a session on the store
   * @return Upload id on success, SESSION_START error otherwise
   */
  static StoreResult open(
    std::shared_ptr<IObjectStore> store, const UploadTarget& target,
    std::unique_ptr<ManualUploadManager>& manager
  );

  /**
   * Take the next part number and upload bytes as that part
   */
  PartUploadResult uploadPart(const std::vector<char>& bytes);
};

/**
 * Manual session that hands out signed UploadPart requests
 *
 * The caller performs each HTTP PUT, collects the ETag from the response and
 * passes the PartResults to complete().
 */
class PresignedManualUploadManager : public ManualSessionBase {
  struct OpenTag {
    explicit OpenTag() = default;
  };

public:
  PresignedManualUploadManager(
    OpenTag, std::shared_ptr<IObjectStore> store, std::unique_ptr<MultipartSession> session,
    uint64_t default_expiry_sec
  )
      : ManualSessionBase(std::move(store), std::move(session))
      , default_expiry_sec_(default_expiry_sec) {}

  /**
   * Start a session on the store
   * @param default_expiry_sec Validity of requests when nextPart() gets no expiry
   */
  static StoreResult open(
    std::shared_ptr<IObjectStore> store, const UploadTarget& target, uint64_t default_expiry_sec,
    std::unique_ptr<PresignedManualUploadManager>& manager
  );

  /**
   * Take the next part number and sign an UploadPart request for it
   */
  PresignedPartResult nextPart(std::optional<uint64_t> expires_in_sec = std::nullopt);

  uint64_t defaultExpirySec() const { return default_expiry_sec_; }

private:
  uint64_t default_expiry_sec_;
};

}  // namespace uploader
}  // namespace cirrus

#endif  // CIRRUS_MANUAL_UPLOAD_MANAGER_HPP
