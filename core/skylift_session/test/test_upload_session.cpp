// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

/**
 * Tests for UploadSession: pre-flight checks, onboarding order, single-shot
 * and chunked paths
 */

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <chrono>
#include <memory>
#include <set>
#include <string>
#include <thread>
#include <vector>

#include <agent_mocks.hpp>
#include <agent_test_helpers.hpp>
#include <content_hash.hpp>
#include <test_helpers.hpp>
#include <upload_errors.hpp>
#include <uploader_mocks.hpp>

#include "upload_session.hpp"

using namespace skylift::session;
using namespace skylift::uploader;
using namespace skylift::uploader::test;
using skylift::agent::Agent;
using skylift::agent::OnboardingManager;
using skylift::agent::OnboardingResponse;
using skylift::agent::test::MockOnboardingClient;
using skylift::agent::test::sharedSecretConfig;
using ::testing::_;
using ::testing::AllOf;
using ::testing::Field;
using ::testing::InSequence;
using ::testing::Return;
using ::testing::Throw;

namespace {
constexpr uint64_t MiB = 1024 * 1024;
}

class UploadSessionTest : public ::testing::Test {
protected:
  void SetUp() override {
    dir_ = createTempDir("skylift_session_");
    options_.retry_delay = std::chrono::milliseconds(1);
    options_.max_retry_delay = std::chrono::milliseconds(5);
    options_.backoff = BackoffStrategy::Fixed;
  }

  void TearDown() override {
    cleanupTempDir(dir_);
  }

  std::string makeFile(const std::string& name, size_t size) {
    return generateTestFile(dir_ + "/" + name, size);
  }

  UploadTarget assetTarget() const {
    UploadTarget target;
    target.asset_id = "asset-1";
    return target;
  }

  std::string dir_;
  UploadOptions options_;
  NullProgressSink progress_;
};

TEST_F(UploadSessionTest, MissingSourceFailsBeforeAnyNetworkCall) {
  MockTransportClient transport;
  EXPECT_CALL(transport, begin_multipart(_)).Times(0);
  EXPECT_CALL(transport, send(_, _, _)).Times(0);
  EXPECT_CALL(transport, complete_multipart(_, _)).Times(0);

  UploadSession session(transport, progress_);
  EXPECT_THROW(session.upload(dir_ + "/missing.bin", assetTarget(), options_), SourceNotFound);

  options_.chunked = true;
  EXPECT_THROW(session.upload(dir_ + "/missing.bin", assetTarget(), options_), SourceNotFound);
}

TEST_F(UploadSessionTest, MissingSourceFailsBeforeOnboarding) {
  RecordingTransport transport;
  MockOnboardingClient onboarding_client;
  EXPECT_CALL(onboarding_client, onboard(_, _)).Times(0);
  Agent agent(sharedSecretConfig());
  OnboardingManager onboarding(onboarding_client);

  UploadSession session(transport, progress_);
  session.enableAgentMode(agent, onboarding);

  EXPECT_THROW(session.upload(dir_ + "/missing.bin", UploadTarget{}, options_), SourceNotFound);
  EXPECT_EQ(transport.send_count(), 0u);
  EXPECT_FALSE(agent.is_onboarded());
}

TEST_F(UploadSessionTest, DirectoryIsNotASource) {
  RecordingTransport transport;
  UploadSession session(transport, progress_);

  EXPECT_THROW(session.upload(dir_, assetTarget(), options_), SourceNotFound);
}

TEST_F(UploadSessionTest, UnreadableSourceDetectedByProbe) {
  RecordingTransport transport;
  auto filesystem = std::make_shared<MockFileSystem>();
  auto streams = std::make_shared<MockFileStreamFactory>();
  EXPECT_CALL(*filesystem, exists("/data/locked.bin")).WillOnce(Return(true));
  EXPECT_CALL(*filesystem, is_regular_file("/data/locked.bin")).WillOnce(Return(true));
  EXPECT_CALL(*streams, create_file_stream("/data/locked.bin", _))
    .WillOnce(Return(::testing::ByMove(std::unique_ptr<IFileStream>())));

  UploadSession session(transport, progress_, filesystem, streams);
  EXPECT_THROW(session.upload("/data/locked.bin", assetTarget(), options_), SourceReadError);
  EXPECT_EQ(transport.send_count(), 0u);
}

TEST_F(UploadSessionTest, InvalidOptionsRejectedBeforeAnyIo) {
  RecordingTransport transport;
  std::string path = makeFile("a.bin", 100);
  UploadSession session(transport, progress_);

  UploadOptions bad = options_;
  bad.parallelism = 0;
  EXPECT_THROW(session.upload(path, assetTarget(), bad), ConfigError);

  bad = options_;
  bad.retry_attempts = 0;
  EXPECT_THROW(session.upload(path, assetTarget(), bad), ConfigError);

  bad = options_;
  bad.chunk_size = 0;
  EXPECT_THROW(session.upload(path, assetTarget(), bad), ConfigError);

  EXPECT_EQ(transport.send_count(), 0u);
}

TEST_F(UploadSessionTest, AssetIdRequiredWithoutAgent) {
  RecordingTransport transport;
  std::string path = makeFile("a.bin", 100);
  UploadSession session(transport, progress_);

  EXPECT_THROW(session.upload(path, UploadTarget{}, options_), ConfigError);
  EXPECT_EQ(transport.send_count(), 0u);
}

TEST_F(UploadSessionTest, TenMegabytesChunked) {
  RecordingTransport transport;
  std::string path = makeFile("ten.bin", 10 * MiB);
  options_.chunked = true;
  options_.chunk_size = 4 * MiB;
  options_.parallelism = 3;

  UploadSession session(transport, progress_);
  UploadOutcome outcome = session.upload(path, assetTarget(), options_);

  EXPECT_EQ(outcome.total_bytes, 10 * MiB);
  EXPECT_EQ(outcome.chunk_count, 3u);
  EXPECT_EQ(transport.sent_parts(), (std::set<size_t>{0, 1, 2}));
  EXPECT_EQ(transport.assembled(), patternBytes(10 * MiB));
}

TEST_F(UploadSessionTest, SingleShotAndChunkedHashesAgree) {
  std::string path = makeFile("same.bin", 3 * MiB + 17);

  RecordingTransport single_transport;
  UploadSession single(single_transport, progress_);
  UploadOutcome single_outcome = single.upload(path, assetTarget(), options_);

  RecordingTransport chunked_transport;
  UploadSession chunked(chunked_transport, progress_);
  options_.chunked = true;
  options_.parallelism = 4;
  options_.chunk_size = 256 * 1024;
  UploadOutcome chunked_outcome = chunked.upload(path, assetTarget(), options_);

  EXPECT_EQ(single_outcome.content_hash, chunked_outcome.content_hash);
  EXPECT_EQ(single_outcome.content_hash, md5_hex(patternBytes(3 * MiB + 17)));
  EXPECT_EQ(single_outcome.chunk_count, 1u);
  EXPECT_GT(chunked_outcome.chunk_count, 1u);
  EXPECT_EQ(single_transport.sends().size(), 1u);
  EXPECT_FALSE(single_transport.sends()[0].part_index.has_value());
}

TEST_F(UploadSessionTest, EmptyFileUploads) {
  RecordingTransport transport;
  std::string path = makeFile("empty.bin", 0);

  UploadSession session(transport, progress_);
  UploadOutcome outcome = session.upload(path, assetTarget(), options_);

  EXPECT_EQ(outcome.total_bytes, 0u);
  EXPECT_EQ(outcome.content_hash, "d41d8cd98f00b204e9800998ecf8427e");
}

TEST_F(UploadSessionTest, OnboardingHappensBeforeUploadAndSetsAsset) {
  std::string path = makeFile("agent.bin", 1000);
  MockTransportClient transport;
  MockOnboardingClient onboarding_client;
  Agent agent(sharedSecretConfig("edge-agent-1"));
  OnboardingManager onboarding(onboarding_client);

  {
    InSequence seq;
    OnboardingResponse issued;
    issued.client_id = "edge-agent-1";
    EXPECT_CALL(onboarding_client, onboard(_, _)).WillOnce(Return(issued));
    EXPECT_CALL(
      transport,
      send(
        AllOf(
          Field(&UploadTarget::asset_id, "edge-agent-1"),
          Field(&UploadTarget::file_path, "agent.bin"),
          Field(&UploadTarget::mime_type, "application/octet-stream")
        ),
        _, _
      )
    )
      .WillOnce(Return(TransportResult::Success()));
  }

  UploadSession session(transport, progress_);
  session.enableAgentMode(agent, onboarding);
  session.upload(path, UploadTarget{}, options_);

  EXPECT_TRUE(agent.is_onboarded());
}

TEST_F(UploadSessionTest, OnboardingFailureStopsUpload) {
  std::string path = makeFile("agent.bin", 1000);
  MockTransportClient transport;
  EXPECT_CALL(transport, send(_, _, _)).Times(0);
  MockOnboardingClient onboarding_client;
  EXPECT_CALL(onboarding_client, onboard(_, _))
    .WillOnce(Throw(OnboardingFailed("HTTP 401", false)));
  Agent agent(sharedSecretConfig());
  OnboardingManager onboarding(onboarding_client);

  UploadSession session(transport, progress_);
  session.enableAgentMode(agent, onboarding);

  try {
    session.upload(path, UploadTarget{}, options_);
    FAIL() << "expected OnboardingFailed";
  } catch (const OnboardingFailed& e) {
    EXPECT_EQ(e.stage(), ErrorStage::Onboarding);
  }
}

TEST_F(UploadSessionTest, SingleShotExhaustionNamesFailure) {
  std::string path = makeFile("flaky.bin", 1000);
  RecordingTransport transport;
  transport.fail_always(0);
  int callbacks = 0;
  options_.on_attempt_failure = [&callbacks](const std::string& label, int, const std::string&) {
    EXPECT_EQ(label, "upload");
    callbacks++;
  };

  UploadSession session(transport, progress_);
  EXPECT_THROW(session.upload(path, assetTarget(), options_), ChunkUploadFailed);
  EXPECT_EQ(transport.send_count(), 3u);
  EXPECT_EQ(callbacks, 2);
}

TEST_F(UploadSessionTest, TimeoutCancelsUpload) {
  std::string path = makeFile("slow.bin", 1000);
  RecordingTransport transport;
  transport.fail_always(0);
  transport.send_delay = std::chrono::milliseconds(100);
  options_.retry_attempts = 10;
  options_.retry_delay = std::chrono::milliseconds(1000);
  options_.max_retry_delay = std::chrono::milliseconds(1000);
  options_.timeout = std::chrono::milliseconds(150);

  UploadSession session(transport, progress_);
  auto start = std::chrono::steady_clock::now();
  EXPECT_THROW(session.upload(path, assetTarget(), options_), OperationCancelled);
  EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds(3));
}

TEST_F(UploadSessionTest, CancelAbortsUploadInProgress) {
  std::string path = makeFile("cancel.bin", 64 * 1024);
  RecordingTransport transport;
  transport.send_delay = std::chrono::milliseconds(50);
  options_.chunked = true;
  options_.chunk_size = 1024;
  options_.parallelism = 2;

  UploadSession session(transport, progress_);
  std::thread canceller([&session]() {
    std::this_thread::sleep_for(std::chrono::milliseconds(120));
    session.cancel("operator abort");
  });

  EXPECT_THROW(session.upload(path, assetTarget(), options_), OperationCancelled);
  canceller.join();
  EXPECT_LT(transport.send_count(), 64u);
  EXPECT_EQ(transport.complete_calls.load(), 0);
}

TEST_F(UploadSessionTest, ResolveTargetFillsDefaults) {
  RecordingTransport transport;
  UploadSession session(transport, progress_);

  UploadTarget resolved = session.resolveTarget(assetTarget(), "/var/log/run/data.csv");
  EXPECT_EQ(resolved.asset_id, "asset-1");
  EXPECT_EQ(resolved.file_path, "data.csv");
  EXPECT_EQ(resolved.mime_type, "application/octet-stream");
  EXPECT_EQ(resolved.description.rfind("File uploaded on ", 0), 0u);

  UploadTarget explicit_target{"asset-2", "x/y.bin", "text/plain", "mine"};
  resolved = session.resolveTarget(explicit_target, "/tmp/other.bin");
  EXPECT_EQ(resolved.file_path, "x/y.bin");
  EXPECT_EQ(resolved.mime_type, "text/plain");
  EXPECT_EQ(resolved.description, "mine");
}

TEST(UploadOptionsTest, DefaultsAndPolicy) {
  UploadOptions options;
  EXPECT_FALSE(options.chunked);
  EXPECT_EQ(options.parallelism, 3);
  EXPECT_EQ(options.retry_attempts, 3);
  EXPECT_NO_THROW(options.validate());

  options.retry_delay = std::chrono::milliseconds(60000);
  RetryPolicy policy = options.retry_policy();
  EXPECT_EQ(policy.max_attempts, 3);
  EXPECT_EQ(policy.max_delay, std::chrono::milliseconds(60000));
  EXPECT_NO_THROW(policy.validate());
}

TEST(DefaultDescriptionTest, UtcTimestamp) {
  auto epoch_plus = std::chrono::system_clock::time_point(std::chrono::seconds(1700000000));
  EXPECT_EQ(default_description(epoch_plus), "File uploaded on 2023-11-14T22:13:20Z using skylift");
}
