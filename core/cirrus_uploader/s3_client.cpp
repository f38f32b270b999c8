// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "s3_client.hpp"

#include <aws/core/Aws.h>
#include <aws/core/auth/AWSAuthSigner.h>
#include <aws/core/auth/AWSCredentials.h>
#include <aws/core/auth/AWSCredentialsProvider.h>
#include <aws/core/client/ClientConfiguration.h>
#include <aws/core/client/RetryStrategy.h>
#include <aws/core/http/HttpRequest.h>
#include <aws/core/http/HttpTypes.h>
#include <aws/core/utils/memory/stl/AWSStringStream.h>
#include <aws/s3/S3Client.h>
#include <aws/s3/S3Errors.h>
#include <aws/s3/model/AbortMultipartUploadRequest.h>
#include <aws/s3/model/CompleteMultipartUploadRequest.h>
#include <aws/s3/model/CompletedMultipartUpload.h>
#include <aws/s3/model/CompletedPart.h>
#include <aws/s3/model/CreateMultipartUploadRequest.h>
#include <aws/s3/model/PutObjectRequest.h>
#include <aws/s3/model/UploadPartRequest.h>

#include <cstdlib>
#include <mutex>
#include <set>

#include "s3_client_test_helpers.hpp"

#define CIRRUS_LOG_COMPONENT "s3_client"
#include <cirrus_log_macros.hpp>

namespace cirrus {
namespace uploader {

using cirrus::logging::kv;

// =============================================================================
// AWS SDK Lifecycle Management
// =============================================================================
// The AWS SDK requires InitAPI/ShutdownAPI to be called exactly once per process.
// We use a reference-counted singleton to manage this lifecycle.
// =============================================================================

class AwsSdkManager {
public:
  static AwsSdkManager& instance() {
    static AwsSdkManager instance;
    return instance;
  }

  void addRef() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!initialized_) {
      Aws::SDKOptions options;
      // SDK logging stays off; cirrus logs the outcome of every call itself
      options.loggingOptions.logLevel = Aws::Utils::Logging::LogLevel::Off;
      Aws::InitAPI(options);
      options_ = options;
      initialized_ = true;
    }
    ++ref_count_;
  }

  void release() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (ref_count_ > 0) {
      --ref_count_;
      if (ref_count_ == 0 && initialized_) {
        Aws::ShutdownAPI(options_);
        initialized_ = false;
      }
    }
  }

private:
  AwsSdkManager() = default;
  ~AwsSdkManager() = default;

  std::mutex mutex_;
  bool initialized_ = false;
  int ref_count_ = 0;
  Aws::SDKOptions options_;
};

// =============================================================================
// Helpers
// =============================================================================

uint64_t clampPresignExpiryImpl(uint64_t expires_in_sec) {
  if (expires_in_sec == 0) {
    CIRRUS_LOG_WARN("presign expiry of 0s is invalid, using 1s");
    return 1;
  }
  if (expires_in_sec > MAX_PRESIGN_EXPIRY_SEC) {
    CIRRUS_LOG_WARN(
      "presign expiry exceeds SigV4 maximum (7 days), clamping" << kv("requested", expires_in_sec)
    );
    return MAX_PRESIGN_EXPIRY_SEC;
  }
  return expires_in_sec;
}

namespace {

template <typename Outcome>
StoreResult failureFromOutcome(const Outcome& outcome) {
  const auto& error = outcome.GetError();
  std::string code = error.GetExceptionName();
  if (code.empty()) {
    code = "HttpStatus" + std::to_string(static_cast<int>(error.GetResponseCode()));
  }
  std::string message = error.GetMessage();
  if (message.empty()) {
    message = "request failed with " + code;
  }
  bool retryable = S3Client::isRetryableError(code) || error.ShouldRetry();
  return StoreResult::Failure(message, code, retryable);
}

}  // namespace

// =============================================================================
// S3Client Implementation
// =============================================================================

class S3Client::Impl {
public:
  S3Config config;
  std::shared_ptr<Aws::Auth::AWSCredentialsProvider> credentials_provider;
  std::shared_ptr<Aws::S3::S3Client> client;

  Impl() { AwsSdkManager::instance().addRef(); }

  ~Impl() {
    // All SDK objects must be destroyed before release(), which may call
    // Aws::ShutdownAPI() when the reference count reaches zero.
    client.reset();
    credentials_provider.reset();
    AwsSdkManager::instance().release();
  }

  void initClient() {
    Aws::Client::ClientConfiguration client_config;

    client_config.region = config.region;

    // The endpoint should NOT include the bucket name
    if (!config.endpoint_url.empty()) {
      std::string endpoint = config.endpoint_url;
      while (!endpoint.empty() && endpoint.back() == '/') {
        endpoint.pop_back();
      }
      client_config.endpointOverride = endpoint;
    }

    client_config.verifySSL = config.verify_ssl;
    if (config.use_ssl) {
      client_config.scheme = Aws::Http::Scheme::HTTPS;
    } else {
      client_config.scheme = Aws::Http::Scheme::HTTP;
    }

    client_config.connectTimeoutMs = config.connect_timeout_ms;
    client_config.requestTimeoutMs = config.request_timeout_ms;

    client_config.retryStrategy = Aws::MakeShared<Aws::Client::DefaultRetryStrategy>(
      "CirrusS3Client", static_cast<long>(config.max_sdk_retries)
    );

    Aws::Auth::AWSCredentials credentials(config.access_key, config.secret_key);
    credentials_provider = Aws::MakeShared<Aws::Auth::SimpleAWSCredentialsProvider>(
      "CirrusS3Client", credentials
    );

    // 4th parameter is useVirtualAddressing:
    // - true  = virtual-hosted style (bucket.s3.amazonaws.com/key) for AWS S3
    // - false = path style (host/bucket/key), required for MinIO and other
    //           custom endpoints
    bool use_virtual_addressing = config.endpoint_url.empty();

    client = std::make_shared<Aws::S3::S3Client>(
      credentials,
      client_config,
      Aws::Client::AWSAuthV4Signer::PayloadSigningPolicy::Never,
      use_virtual_addressing
    );
  }

  // The SDK builds the object URL the way it sends requests, key escaping included
  PresignResult presign(
    const UploadTarget& target, uint64_t expires_in_sec,
    const std::shared_ptr<Aws::Http::ServiceSpecificParameters>& query = nullptr
  ) {
    uint64_t expiry = clampPresignExpiryImpl(expires_in_sec);

    Aws::String url = client->GeneratePresignedUrl(
      target.bucket, target.key, Aws::Http::HttpMethod::HTTP_PUT,
      Aws::Http::HeaderValueCollection{}, expiry, query
    );
    if (url.empty()) {
      CIRRUS_LOG_ERROR("SigV4 presigning failed" << kv("bucket", target.bucket)
                                                 << kv("key", target.key));
      return PresignResult::Failure(OperationError::make(
        ErrorKind::TRANSPORT, UploadStage::PRESIGN, "SigV4 presigning failed", "PresignFailed"
      ));
    }

    PresignedRequest presigned;
    presigned.method = "PUT";
    presigned.url = url;
    presigned.expires_in_sec = expiry;
    return PresignResult::Success(presigned);
  }
};

S3Client::S3Client(const S3Config& config)
    : impl_(std::make_unique<Impl>()) {
  impl_->config = config;

  // Load credentials from environment if not provided
  if (impl_->config.access_key.empty()) {
    if (const char* key = std::getenv("AWS_ACCESS_KEY_ID")) {
      impl_->config.access_key = key;
    }
  }
  if (impl_->config.secret_key.empty()) {
    if (const char* key = std::getenv("AWS_SECRET_ACCESS_KEY")) {
      impl_->config.secret_key = key;
    }
  }

  impl_->initClient();
}

S3Client::~S3Client() = default;

StoreResult S3Client::putObject(const UploadTarget& target, const std::vector<char>& body) {
  Aws::S3::Model::PutObjectRequest request;
  request.SetBucket(target.bucket);
  request.SetKey(target.key);

  auto stream = Aws::MakeShared<Aws::StringStream>("CirrusPutObject");
  stream->write(body.data(), static_cast<std::streamsize>(body.size()));
  request.SetBody(stream);
  request.SetContentLength(static_cast<long long>(body.size()));

  auto outcome = impl_->client->PutObject(request);
  if (!outcome.IsSuccess()) {
    return failureFromOutcome(outcome);
  }
  return StoreResult::Success(outcome.GetResult().GetETag());
}

StoreResult S3Client::createMultipartUpload(const UploadTarget& target) {
  Aws::S3::Model::CreateMultipartUploadRequest request;
  request.SetBucket(target.bucket);
  request.SetKey(target.key);

  auto outcome = impl_->client->CreateMultipartUpload(request);
  if (!outcome.IsSuccess()) {
    return failureFromOutcome(outcome);
  }
  return StoreResult::Success(outcome.GetResult().GetUploadId());
}

StoreResult S3Client::uploadPart(
  const UploadTarget& target, const std::string& upload_id, int part_number,
  const std::vector<char>& body
) {
  Aws::S3::Model::UploadPartRequest request;
  request.SetBucket(target.bucket);
  request.SetKey(target.key);
  request.SetUploadId(upload_id);
  request.SetPartNumber(part_number);

  auto stream = Aws::MakeShared<Aws::StringStream>("CirrusUploadPart");
  stream->write(body.data(), static_cast<std::streamsize>(body.size()));
  request.SetBody(stream);
  request.SetContentLength(static_cast<long long>(body.size()));

  auto outcome = impl_->client->UploadPart(request);
  if (!outcome.IsSuccess()) {
    return failureFromOutcome(outcome);
  }
  return StoreResult::Success(outcome.GetResult().GetETag());
}

StoreResult S3Client::completeMultipartUpload(
  const UploadTarget& target, const std::string& upload_id, const std::vector<PartResult>& parts
) {
  Aws::S3::Model::CompletedMultipartUpload completed_upload;
  for (const auto& part : parts) {
    Aws::S3::Model::CompletedPart completed_part;
    completed_part.SetPartNumber(part.part_number);
    completed_part.SetETag(part.integrity_tag);
    completed_upload.AddParts(completed_part);
  }

  Aws::S3::Model::CompleteMultipartUploadRequest request;
  request.SetBucket(target.bucket);
  request.SetKey(target.key);
  request.SetUploadId(upload_id);
  request.SetMultipartUpload(completed_upload);

  auto outcome = impl_->client->CompleteMultipartUpload(request);
  if (!outcome.IsSuccess()) {
    return failureFromOutcome(outcome);
  }
  return StoreResult::Success(outcome.GetResult().GetETag());
}

StoreResult S3Client::abortMultipartUpload(
  const UploadTarget& target, const std::string& upload_id
) {
  Aws::S3::Model::AbortMultipartUploadRequest request;
  request.SetBucket(target.bucket);
  request.SetKey(target.key);
  request.SetUploadId(upload_id);

  auto outcome = impl_->client->AbortMultipartUpload(request);
  if (!outcome.IsSuccess()) {
    return failureFromOutcome(outcome);
  }
  return StoreResult::Success();
}

PresignResult S3Client::presignPutObject(const UploadTarget& target, uint64_t expires_in_sec) {
  return impl_->presign(target, expires_in_sec);
}

PresignResult S3Client::presignUploadPart(
  const UploadTarget& target, const std::string& upload_id, int part_number,
  uint64_t expires_in_sec
) {
  auto query = Aws::MakeShared<Aws::Http::ServiceSpecificParameters>("CirrusS3Client");
  query->parameterMap.emplace("partNumber", std::to_string(part_number));
  query->parameterMap.emplace("uploadId", upload_id);
  return impl_->presign(target, expires_in_sec, query);
}

bool S3Client::isRetryableError(const std::string& error_code) {
  static const std::set<std::string> retryable = {// S3/HTTP errors
                                                  "RequestTimeout",
                                                  "ServiceUnavailable",
                                                  "InternalError",
                                                  "SlowDown",
                                                  "RequestTimeTooSkewed",
                                                  "OperationAborted",

                                                  // Network errors
                                                  "ConnectionReset",
                                                  "ConnectionTimeout",
                                                  "ConnectionRefused",
                                                  "NetworkingError",

                                                  // MinIO-specific
                                                  "XMinioServerNotInitialized",

                                                  // Generic
                                                  "Throttling",
                                                  "ThrottlingException",
                                                  "TransientError"};
  return retryable.count(error_code) > 0;
}

const std::string& S3Client::endpoint() const { return impl_->config.endpoint_url; }

const std::string& S3Client::region() const { return impl_->config.region; }

}  // namespace uploader
}  // namespace cirrus
