// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

/**
 * Integration tests against a live S3-compatible endpoint (MinIO)
 *
 * Skipped unless AWS_ACCESS_KEY_ID, AWS_SECRET_ACCESS_KEY and
 * CIRRUS_TEST_S3_ENDPOINT are set. The bucket comes from
 * CIRRUS_TEST_S3_BUCKET (default "cirrus-test") and must exist.
 */

#include <gtest/gtest.h>

#include <chrono>
#include <cstdlib>
#include <memory>
#include <string>

#include "../test_helpers.hpp"
#include "s3_client.hpp"
#include "upload_client.hpp"

using namespace cirrus::uploader;
using namespace cirrus::uploader::test;

class S3IntegrationTest : public ::testing::Test {
protected:
  void SetUp() override {
    if (!isMinIOAvailable()) {
      GTEST_SKIP() << "S3 endpoint not configured, skipping integration tests";
    }

    S3Config config;
    config.endpoint_url = std::getenv("CIRRUS_TEST_S3_ENDPOINT");
    config.use_ssl = config.endpoint_url.rfind("https://", 0) == 0;
    store_ = std::make_shared<S3Client>(config);

    const char* bucket = std::getenv("CIRRUS_TEST_S3_BUCKET");
    bucket_ = bucket ? bucket : "cirrus-test";
  }

  UploadTarget uniqueTarget(const std::string& name) const {
    return UploadTarget{
      bucket_,
      "integration/" + std::to_string(std::chrono::steady_clock::now().time_since_epoch().count()) +
        "/" + name};
  }

  std::shared_ptr<S3Client> store_;
  std::string bucket_;
};

TEST_F(S3IntegrationTest, SmallStreamSinglePut) {
  UploadClient client(store_);
  MemoryByteSource source(makePayload(10 * 1024));

  UploadOutcome outcome = client.uploadStream(uniqueTarget("small.bin"), source);

  ASSERT_TRUE(outcome.success) << outcome.error.describe();
  EXPECT_EQ(outcome.bytes_uploaded, 10240u);
  EXPECT_TRUE(outcome.upload_id.empty());
}

TEST_F(S3IntegrationTest, MultipartStream) {
  UploadClient client(store_);
  MemoryByteSource source(makePayload(12 * MiB));

  UploadOutcome outcome = client.uploadStream(uniqueTarget("multipart.bin"), source);

  ASSERT_TRUE(outcome.success) << outcome.error.describe();
  EXPECT_EQ(outcome.bytes_uploaded, 12582912u);
  EXPECT_FALSE(outcome.upload_id.empty());
}

TEST_F(S3IntegrationTest, ManualSession) {
  UploadClient client(store_);
  std::unique_ptr<ManualUploadManager> manager;
  ASSERT_TRUE(client.openManualSession(uniqueTarget("manual.bin"), manager).success);

  PartUploadResult first = manager->uploadPart(makePayload(5 * MiB));
  PartUploadResult last = manager->uploadPart(makePayload(1024));
  ASSERT_TRUE(first.success) << first.error.describe();
  ASSERT_TRUE(last.success) << last.error.describe();

  StoreResult completed = manager->complete({first.part, last.part});
  EXPECT_TRUE(completed.success) << completed.error.describe();
}

TEST_F(S3IntegrationTest, AbortAfterPart) {
  UploadClient client(store_);
  std::unique_ptr<ManualUploadManager> manager;
  ASSERT_TRUE(client.openManualSession(uniqueTarget("aborted.bin"), manager).success);
  ASSERT_TRUE(manager->uploadPart(makePayload(1024)).success);

  EXPECT_TRUE(manager->abort().success);
}

TEST_F(S3IntegrationTest, MissingBucketFailsAtSessionStart) {
  UploadClient client(store_);
  MemoryByteSource source(makePayload(6 * MiB));

  UploadOutcome outcome =
    client.uploadStream(UploadTarget{"cirrus-no-such-bucket-0d1e", "k.bin"}, source);

  EXPECT_FALSE(outcome.success);
  EXPECT_EQ(outcome.error.stage, UploadStage::SESSION_START);
  EXPECT_EQ(outcome.error.kind, ErrorKind::TRANSPORT);
}

int main(int argc, char** argv) {
  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
