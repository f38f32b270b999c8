// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef CIRRUS_STREAM_UPLOADER_HPP
#define CIRRUS_STREAM_UPLOADER_HPP

#include <boost/asio/thread_pool.hpp>

#include <cstddef>
#include <functional>
#include <memory>

#include "engine_config.hpp"
#include "upload_types.hpp"
#include "uploader_interfaces.hpp"

namespace cirrus {
namespace uploader {

/**
 * Uploads a byte stream of unknown length to one object
 *
 * Streams shorter than part_size_threshold go out as a single PUT and never
 * create a multipart session. Longer streams are cut into parts of exactly
 * part_size_threshold bytes (the last one may be shorter) which are uploaded
 * on a thread pool while the calling thread keeps reading. At most
 * max_concurrent_parts parts are in flight, which also bounds the number of
 * part buffers held in memory.
 *
 * When every part succeeds the session is completed with the parts sorted
 * by part number. Otherwise all dispatched parts are awaited, the session is
 * aborted exactly once, and the first failure is returned.
 *
 * Usage:
 * @code
 *   StreamUploader uploader(store, EngineConfig{});
 *   StreamByteSource source(std::cin);
 *   UploadOutcome outcome = uploader.upload({"bucket", "key"}, source);
 * @endcode
 */
class StreamUploader {
public:
  // Creates the part worker pool, one per multipart upload
  using WorkerPoolFactory =
    std::function<std::unique_ptr<boost::asio::thread_pool>(size_t num_threads)>;

  /**
   * @param store Backend, must outlive the uploader
   * @param config Engine settings, clamped to their floors
   */
  StreamUploader(IObjectStore& store, const EngineConfig& config);

  /**
   * Same, with a custom pool factory. A factory that throws fails the
   * upload before any multipart session is created.
   */
  StreamUploader(IObjectStore& store, const EngineConfig& config, WorkerPoolFactory pool_factory);

  StreamUploader(const StreamUploader&) = delete;
  StreamUploader& operator=(const StreamUploader&) = delete;

  /**
   * Upload everything source yields until end of stream
   *
   * Blocks until the upload reached a terminal state. Independent calls may
   * run concurrently on the same uploader.
   */
  UploadOutcome upload(
    const UploadTarget& target, IByteSource& source, ProgressCallback progress_cb = nullptr
  );

  const EngineConfig& config() const { return config_; }

private:
  IObjectStore& store_;
  EngineConfig config_;
  WorkerPoolFactory pool_factory_;
};

}  // namespace uploader
}  // namespace cirrus

#endif  // CIRRUS_STREAM_UPLOADER_HPP
