// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "stream_uploader.hpp"

#include <boost/asio/post.hpp>

#include <algorithm>
#include <atomic>
#include <exception>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

#include "admission_gate.hpp"
#include "chunker.hpp"
#include "multipart_session.hpp"

#define CIRRUS_LOG_COMPONENT "stream_uploader"
#include <cirrus_log_macros.hpp>

namespace cirrus {
namespace uploader {

using cirrus::logging::kv;

namespace {

struct PartTaskResult {
  bool success = false;
  PartResult part;
  OperationError error;
};

/**
 * Serializes progress callbacks coming from part tasks
 */
class ProgressReporter {
public:
  explicit ProgressReporter(ProgressCallback callback)
      : callback_(std::move(callback)) {}

  void setBytesRead(uint64_t bytes) { bytes_read_.store(bytes); }

  void partDone(uint64_t bytes) {
    if (!callback_) {
      return;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    bytes_uploaded_ += bytes;
    callback_(bytes_uploaded_, bytes_read_.load());
  }

private:
  ProgressCallback callback_;
  std::mutex mutex_;
  uint64_t bytes_uploaded_ = 0;
  std::atomic<uint64_t> bytes_read_{0};
};

/**
 * Post one part upload onto the pool. The part number is taken when the
 * task starts running; the permit is released when the task body returns.
 */
std::future<PartTaskResult> dispatchPart(
  boost::asio::thread_pool& pool, MultipartSession& session, AdmissionGate::Permit permit,
  std::vector<char> bytes, std::atomic<bool>& part_failed, ProgressReporter& progress
) {
  auto task = std::make_shared<std::packaged_task<PartTaskResult()>>(
    [&session, &part_failed, &progress, permit = std::move(permit),
     bytes = std::move(bytes)]() mutable {
      AdmissionGate::Permit held = std::move(permit);
      std::vector<char> part = std::move(bytes);

      CIRRUS_LOG_SCOPED_CONTEXT(session.sessionId(), session.target().key);

      int part_number = session.nextPartNumber();
      CIRRUS_LOG_SCOPED_PART(part_number);
      PartUploadResult uploaded = session.uploadPart(part_number, part);

      PartTaskResult result;
      if (!uploaded.success) {
        part_failed.store(true);
        result.error = uploaded.error;
        return result;
      }

      progress.partDone(part.size());
      result.success = true;
      result.part = uploaded.part;
      return result;
    }
  );

  std::future<PartTaskResult> future = task->get_future();
  boost::asio::post(pool, [task]() { (*task)(); });
  return future;
}

}  // namespace

StreamUploader::StreamUploader(IObjectStore& store, const EngineConfig& config)
    : StreamUploader(store, config, [](size_t num_threads) {
      return std::make_unique<boost::asio::thread_pool>(num_threads);
    }) {}

StreamUploader::StreamUploader(
  IObjectStore& store, const EngineConfig& config, WorkerPoolFactory pool_factory
)
    : store_(store)
    , config_(clampEngineConfig(config))
    , pool_factory_(std::move(pool_factory)) {}

UploadOutcome StreamUploader::upload(
  const UploadTarget& target, IByteSource& source, ProgressCallback progress_cb
) {
  if (!target.valid()) {
    CIRRUS_LOG_ERROR("Rejecting upload with empty bucket or key" << kv("bucket", target.bucket)
                                                                 << kv("key", target.key));
    return UploadOutcome::Failure(OperationError::make(
      ErrorKind::INVALID_TARGET, UploadStage::NONE, "bucket and key must be non-empty"
    ));
  }

  CIRRUS_LOG_DEBUG("Upload starting" << kv("bucket", target.bucket) << kv("key", target.key)
                                     << kv("part_size", config_.part_size_threshold)
                                     << kv("concurrency", config_.max_concurrent_parts));

  // Declaration order matters: the pool is joined before the gate, session
  // and reporter its tasks refer to are destroyed.
  Chunker chunker(source, config_.read_buffer_size, config_.part_size_threshold);
  ProgressReporter progress(std::move(progress_cb));
  AdmissionGate gate(config_.max_concurrent_parts);
  std::atomic<bool> part_failed{false};
  std::unique_ptr<MultipartSession> session;
  std::unique_ptr<boost::asio::thread_pool> pool;
  std::vector<std::future<PartTaskResult>> pending;

  bool read_failed = false;
  OperationError read_error;
  bool dispatch_failed = false;
  OperationError dispatch_error;

  for (;;) {
    Chunker::FillStatus status = chunker.fill();
    progress.setBytesRead(chunker.totalBytesRead());

    if (status == Chunker::FillStatus::READ_ERROR) {
      read_error = OperationError::make(ErrorKind::IO, UploadStage::READ, chunker.lastError());
      if (!session) {
        return UploadOutcome::Failure(read_error, chunker.totalBytesRead());
      }
      read_failed = true;
      break;
    }

    if (status == Chunker::FillStatus::END_OF_STREAM && !session) {
      std::vector<char> body = chunker.takePart();
      StoreResult put = store_.putObject(target, body);
      if (!put.success) {
        put.error.stage = UploadStage::SINGLE_PUT;
        CIRRUS_LOG_ERROR("PutObject failed" << kv("key", target.key) << kv("bytes", body.size())
                                            << kv("error", put.error.message)
                                            << kv("code", put.error.code));
        return UploadOutcome::Failure(put.error, chunker.totalBytesRead());
      }
      progress.partDone(body.size());
      CIRRUS_LOG_INFO("Object uploaded with a single PUT" << kv("key", target.key)
                                                          << kv("bytes", body.size()));
      return UploadOutcome::Success(chunker.totalBytesRead());
    }

    if (status == Chunker::FillStatus::PART_READY && !session) {
      // Workers first: once the session exists every exit must go through abort
      try {
        pool = pool_factory_(config_.max_concurrent_parts);
      } catch (const std::exception& e) {
        CIRRUS_LOG_ERROR("Cannot create part workers" << kv("threads", config_.max_concurrent_parts)
                                                      << kv("error", e.what()));
        return UploadOutcome::Failure(
          OperationError::make(
            ErrorKind::CONCURRENCY, UploadStage::DISPATCH,
            std::string("cannot create part workers: ") + e.what()
          ),
          chunker.totalBytesRead()
        );
      }
      if (!pool) {
        return UploadOutcome::Failure(
          OperationError::make(
            ErrorKind::CONCURRENCY, UploadStage::DISPATCH, "no part workers available"
          ),
          chunker.totalBytesRead()
        );
      }

      StoreResult started = MultipartSession::start(store_, target, session);
      if (!started.success) {
        return UploadOutcome::Failure(started.error, chunker.totalBytesRead());
      }
    }

    // An empty remainder at end of stream is not uploaded
    if (chunker.partSize() > 0) {
      try {
        AdmissionGate::Permit permit = gate.acquire();
        pending.push_back(dispatchPart(
          *pool, *session, std::move(permit), chunker.takePart(), part_failed, progress
        ));
      } catch (const std::exception& e) {
        CIRRUS_LOG_ERROR("Part could not be dispatched" << kv("error", e.what()));
        dispatch_error = OperationError::make(
          ErrorKind::CONCURRENCY, UploadStage::DISPATCH,
          std::string("part could not be dispatched: ") + e.what()
        );
        dispatch_failed = true;
        break;
      }
    }

    if (status == Chunker::FillStatus::END_OF_STREAM) {
      break;
    }
    if (part_failed.load()) {
      CIRRUS_LOG_WARN("Part upload failed, stop reading" << kv("dispatched", pending.size()));
      break;
    }
  }

  CIRRUS_LOG_SCOPED_CONTEXT(session->sessionId(), target.key);

  // Await every dispatched part, failed or not, before touching the session
  bool failed = read_failed || dispatch_failed;
  OperationError first_error = read_failed ? read_error : dispatch_error;
  std::vector<PartResult> parts;
  parts.reserve(pending.size());

  for (auto& future : pending) {
    try {
      PartTaskResult result = future.get();
      if (result.success) {
        parts.push_back(result.part);
      } else if (!failed) {
        first_error = result.error;
        failed = true;
      }
    } catch (const std::exception& e) {
      CIRRUS_LOG_ERROR("Part task could not be joined" << kv("error", e.what()));
      if (!failed) {
        first_error = OperationError::make(
          ErrorKind::CONCURRENCY, UploadStage::JOIN, std::string("part task failed: ") + e.what()
        );
        failed = true;
      }
    } catch (...) {
      CIRRUS_LOG_ERROR("Part task could not be joined: unknown exception");
      if (!failed) {
        first_error = OperationError::make(
          ErrorKind::CONCURRENCY, UploadStage::JOIN, "part task failed with an unknown exception"
        );
        failed = true;
      }
    }
  }
  pool->join();

  const std::string upload_id = session->sessionId();

  if (failed) {
    StoreResult aborted = session->abort();
    CIRRUS_LOG_ERROR("Multipart upload failed" << kv("error", first_error.describe())
                                               << kv("bytes_read", chunker.totalBytesRead()));
    return UploadOutcome::Failure(
      first_error, chunker.totalBytesRead(), upload_id,
      aborted.success ? "" : aborted.error.describe()
    );
  }

  std::sort(parts.begin(), parts.end(), [](const PartResult& a, const PartResult& b) {
    return a.part_number < b.part_number;
  });

  StoreResult completed = session->complete(parts);
  if (!completed.success) {
    StoreResult aborted = session->abort();
    return UploadOutcome::Failure(
      completed.error, chunker.totalBytesRead(), upload_id,
      aborted.success ? "" : aborted.error.describe()
    );
  }

  CIRRUS_LOG_INFO("Multipart upload finished" << kv("key", target.key) << kv("parts", parts.size())
                                              << kv("bytes", chunker.totalBytesRead()));
  return UploadOutcome::Success(chunker.totalBytesRead(), upload_id);
}

}  // namespace uploader
}  // namespace cirrus
