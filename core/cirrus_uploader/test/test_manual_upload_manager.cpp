// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

/**
 * Unit tests for ManualUploadManager, PresignedManualUploadManager and
 * the UploadClient entry points
 */

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <memory>
#include <string>
#include <vector>

#include "manual_upload_manager.hpp"
#include "test_helpers.hpp"
#include "upload_client.hpp"
#include "uploader_mocks.hpp"

using namespace cirrus::uploader;
using namespace cirrus::uploader::test;
using ::testing::_;
using ::testing::ElementsAre;
using ::testing::HasSubstr;
using ::testing::Return;

class ManualUploadManagerTest : public ::testing::Test {
protected:
  std::shared_ptr<FakeObjectStore> store_ = std::make_shared<FakeObjectStore>();
  UploadTarget target_{"archive", "2026/10/backup.tar"};
};

// =============================================================================
// ManualUploadManager
// =============================================================================

TEST_F(ManualUploadManagerTest, UploadPartsAndComplete) {
  std::unique_ptr<ManualUploadManager> manager;
  StoreResult opened = ManualUploadManager::open(store_, target_, manager);
  ASSERT_TRUE(opened.success);
  ASSERT_NE(manager, nullptr);
  EXPECT_EQ(manager->sessionId(), opened.value);

  auto first_bytes = makePayload(5 * MiB);
  auto second_bytes = makePayload(1000);

  PartUploadResult first = manager->uploadPart(first_bytes);
  PartUploadResult second = manager->uploadPart(second_bytes);
  ASSERT_TRUE(first.success);
  ASSERT_TRUE(second.success);
  EXPECT_EQ(first.part.part_number, 1);
  EXPECT_EQ(second.part.part_number, 2);

  EXPECT_TRUE(manager->complete({first.part, second.part}).success);
  EXPECT_EQ(manager->state(), SessionState::COMPLETED);
  EXPECT_THAT(store_->completedPartNumbers(), ElementsAre(1, 2));

  std::vector<char> expected(first_bytes);
  expected.insert(expected.end(), second_bytes.begin(), second_bytes.end());
  EXPECT_EQ(store_->object(target_.key), expected);
}

TEST_F(ManualUploadManagerTest, FailedPartStillConsumesNumber) {
  store_->failPart(1, "InternalError");
  std::unique_ptr<ManualUploadManager> manager;
  ASSERT_TRUE(ManualUploadManager::open(store_, target_, manager).success);

  PartUploadResult failed = manager->uploadPart(makePayload(10));
  PartUploadResult next = manager->uploadPart(makePayload(10));

  EXPECT_FALSE(failed.success);
  EXPECT_EQ(failed.error.part_number, 1);
  EXPECT_EQ(failed.error.stage, UploadStage::PART_UPLOAD);
  ASSERT_TRUE(next.success);
  EXPECT_EQ(next.part.part_number, 2);
}

TEST_F(ManualUploadManagerTest, AbortDiscardsSession) {
  std::unique_ptr<ManualUploadManager> manager;
  ASSERT_TRUE(ManualUploadManager::open(store_, target_, manager).success);
  manager->uploadPart(makePayload(10));

  EXPECT_TRUE(manager->abort().success);
  EXPECT_EQ(store_->abortCount(), 1);

  PartUploadResult late = manager->uploadPart(makePayload(10));
  EXPECT_FALSE(late.success);
  EXPECT_EQ(late.error.kind, ErrorKind::SESSION_STATE);
}

TEST_F(ManualUploadManagerTest, OpenFailureLeavesManagerEmpty) {
  store_->failCreate("NoSuchBucket");
  std::unique_ptr<ManualUploadManager> manager;

  StoreResult opened = ManualUploadManager::open(store_, target_, manager);

  EXPECT_FALSE(opened.success);
  EXPECT_EQ(opened.error.stage, UploadStage::SESSION_START);
  EXPECT_EQ(manager, nullptr);
}

TEST_F(ManualUploadManagerTest, OpenWithoutStore) {
  std::unique_ptr<ManualUploadManager> manager;

  StoreResult opened = ManualUploadManager::open(nullptr, target_, manager);

  EXPECT_FALSE(opened.success);
  EXPECT_EQ(manager, nullptr);
}

TEST_F(ManualUploadManagerTest, ManagerKeepsStoreAlive) {
  std::unique_ptr<ManualUploadManager> manager;
  {
    auto store = std::make_shared<FakeObjectStore>();
    ASSERT_TRUE(ManualUploadManager::open(store, target_, manager).success);
  }
  PartUploadResult part = manager->uploadPart(makePayload(10));
  EXPECT_TRUE(part.success);
}

// =============================================================================
// PresignedManualUploadManager
// =============================================================================

TEST_F(ManualUploadManagerTest, PresignedPartsUseSessionCounter) {
  std::unique_ptr<PresignedManualUploadManager> manager;
  ASSERT_TRUE(PresignedManualUploadManager::open(store_, target_, 900, manager).success);
  EXPECT_EQ(manager->defaultExpirySec(), 900u);

  PresignedPartResult first = manager->nextPart();
  PresignedPartResult second = manager->nextPart(60);

  ASSERT_TRUE(first.success);
  ASSERT_TRUE(second.success);
  EXPECT_EQ(first.part_number, 1);
  EXPECT_EQ(second.part_number, 2);
  EXPECT_EQ(first.request.method, "PUT");
  EXPECT_EQ(first.request.expires_in_sec, 900u);
  EXPECT_EQ(second.request.expires_in_sec, 60u);
  EXPECT_THAT(first.request.url, HasSubstr("partNumber=1"));
  EXPECT_THAT(second.request.url, HasSubstr("uploadId=" + manager->sessionId()));
  EXPECT_EQ(store_->partCount(), 0);
}

TEST_F(ManualUploadManagerTest, PresignedCompleteWithCallerCollectedTags) {
  std::unique_ptr<PresignedManualUploadManager> manager;
  ASSERT_TRUE(PresignedManualUploadManager::open(store_, target_, 300, manager).success);
  manager->nextPart();
  manager->nextPart();

  StoreResult completed = manager->complete({{1, "\"x1\""}, {2, "\"x2\""}});

  EXPECT_TRUE(completed.success);
  EXPECT_THAT(store_->completedPartNumbers(), ElementsAre(1, 2));
}

TEST(PresignedManualUploadManagerMockedTest, PresignFailureIsReported) {
  auto store = std::make_shared<MockObjectStore>();
  EXPECT_CALL(*store, createMultipartUpload(_)).WillOnce(Return(StoreResult::Success("up-7")));
  EXPECT_CALL(*store, presignUploadPart(_, "up-7", 1, 300u))
    .WillOnce(Return(PresignResult::Failure(
      OperationError::make(ErrorKind::TRANSPORT, UploadStage::NONE, "no credentials")
    )));

  std::unique_ptr<PresignedManualUploadManager> manager;
  ASSERT_TRUE(PresignedManualUploadManager::open(store, UploadTarget{"b", "k"}, 300, manager).success);

  PresignedPartResult result = manager->nextPart();

  EXPECT_FALSE(result.success);
  EXPECT_EQ(result.part_number, 1);
  EXPECT_EQ(result.error.stage, UploadStage::PRESIGN);
}

// =============================================================================
// UploadClient
// =============================================================================

TEST_F(ManualUploadManagerTest, ClientUploadStream) {
  UploadClient client(store_);
  auto payload = makePayload(6 * MiB);
  MemoryByteSource source(payload);

  UploadOutcome outcome = client.uploadStream(target_, source);

  ASSERT_TRUE(outcome.success);
  EXPECT_EQ(outcome.bytes_uploaded, 6 * MiB);
  EXPECT_EQ(store_->object(target_.key), payload);
}

TEST_F(ManualUploadManagerTest, ClientUploadFile) {
  std::string dir = createTempDir();
  auto payload = makePayload(4096);
  std::string path = writeTestFile(dir + "/small.bin", payload);
  ASSERT_FALSE(path.empty());

  UploadClient client(store_);
  UploadOutcome outcome = client.uploadFile(path, target_);

  ASSERT_TRUE(outcome.success);
  EXPECT_EQ(store_->putCount(), 1);
  EXPECT_EQ(store_->object(target_.key), payload);

  cleanupTempDir(dir);
}

TEST_F(ManualUploadManagerTest, ClientUploadFileWithPerCallConfig) {
  std::string dir = createTempDir();
  auto payload = makePayload(6 * MiB);
  std::string path = writeTestFile(dir + "/large.bin", payload);
  ASSERT_FALSE(path.empty());

  UploadClient client(store_);
  EngineConfig config;
  config.max_concurrent_parts = 1;
  UploadOutcome outcome = client.uploadFile(path, target_, config);

  ASSERT_TRUE(outcome.success);
  EXPECT_EQ(outcome.bytes_uploaded, 6 * MiB);
  EXPECT_EQ(store_->putCount(), 0);
  EXPECT_EQ(store_->partCount(), 2);
  EXPECT_EQ(store_->completeCount(), 1);
  EXPECT_EQ(store_->object(target_.key), payload);

  cleanupTempDir(dir);
}

TEST_F(ManualUploadManagerTest, ClientUploadMissingFileIsIoError) {
  UploadClient client(store_);

  UploadOutcome outcome = client.uploadFile("/nonexistent/cirrus.bin", target_);

  EXPECT_FALSE(outcome.success);
  EXPECT_EQ(outcome.error.kind, ErrorKind::IO);
  EXPECT_EQ(store_->putCount(), 0);
}

TEST_F(ManualUploadManagerTest, ClientOpensSessions) {
  UploadClient client(store_);

  std::unique_ptr<ManualUploadManager> manual;
  EXPECT_TRUE(client.openManualSession(target_, manual).success);
  std::unique_ptr<PresignedManualUploadManager> presigned;
  EXPECT_TRUE(client.openPresignedManualSession(target_, 600, presigned).success);

  EXPECT_NE(manual->sessionId(), presigned->sessionId());
  EXPECT_EQ(store_->createCount(), 2);
}

TEST_F(ManualUploadManagerTest, ClientPresignObjectUpload) {
  UploadClient client(store_);

  PresignResult result = client.presignObjectUpload(target_, 3600);

  ASSERT_TRUE(result.success);
  EXPECT_EQ(result.request.method, "PUT");
  EXPECT_EQ(result.request.expires_in_sec, 3600u);
  EXPECT_THAT(result.request.url, HasSubstr(target_.key));

  PresignResult rejected = client.presignObjectUpload(UploadTarget{"archive", ""}, 60);
  EXPECT_FALSE(rejected.success);
  EXPECT_EQ(rejected.error.kind, ErrorKind::INVALID_TARGET);
}
