// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef CIRRUS_UPLOADER_INTERFACES_HPP
#define CIRRUS_UPLOADER_INTERFACES_HPP

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "upload_types.hpp"

namespace cirrus {
namespace uploader {

/**
 * Result of one read from a byte source.
 * ok with bytes == 0 signals end of stream.
 */
struct ReadResult {
  bool ok;
  size_t bytes;
  std::string error_message;

  static ReadResult Data(size_t bytes) { return {true, bytes, ""}; }

  static ReadResult Error(const std::string& message) { return {false, 0, message}; }
};

/**
 * Interface for the stream being uploaded
 * Allows mocking read failures in tests
 */
class IByteSource {
public:
  virtual ~IByteSource() = default;

  /**
   * Read up to size bytes into buffer
   * @param buffer Destination, at least size bytes long
   * @param size Maximum number of bytes to read
   * @return Bytes read (0 at end of stream) or an error
   */
  virtual ReadResult read(char* buffer, size_t size) = 0;
};

/**
 * Interface for the object store backend
 *
 * Every call is a single attempt. Failures come back as StoreResult /
 * PresignResult with ErrorKind::TRANSPORT and the backend error code; the
 * engine fills in the stage. Implementations must be safe to call from
 * several threads at once.
 */
class IObjectStore {
public:
  virtual ~IObjectStore() = default;

  /**
   * Upload a whole object in one request
   * @return ETag on success
   */
  virtual StoreResult putObject(const UploadTarget& target, const std::vector<char>& body) = 0;

  /**
   * Start a multipart upload session
   * @return Upload id on success
   */
  virtual StoreResult createMultipartUpload(const UploadTarget& target) = 0;

  /**
   * Upload one part of a session
   * @return ETag of the part on success
   */
  virtual StoreResult uploadPart(
    const UploadTarget& target, const std::string& upload_id, int part_number,
    const std::vector<char>& body
  ) = 0;

  /**
   * Assemble the object from the listed parts, ordered by part number
   */
  virtual StoreResult completeMultipartUpload(
    const UploadTarget& target, const std::string& upload_id, const std::vector<PartResult>& parts
  ) = 0;

  /**
   * Discard a session and the parts stored so far
   */
  virtual StoreResult abortMultipartUpload(
    const UploadTarget& target, const std::string& upload_id
  ) = 0;

  /**
   * Sign a single PUT of the whole object
   */
  virtual PresignResult presignPutObject(const UploadTarget& target, uint64_t expires_in_sec) = 0;

  /**
   * Sign an UploadPart request for one part of a session
   */
  virtual PresignResult presignUploadPart(
    const UploadTarget& target, const std::string& upload_id, int part_number,
    uint64_t expires_in_sec
  ) = 0;
};

}  // namespace uploader
}  // namespace cirrus

#endif  // CIRRUS_UPLOADER_INTERFACES_HPP
