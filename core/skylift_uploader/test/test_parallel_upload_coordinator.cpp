// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

/**
 * Tests for ParallelUploadCoordinator against a recording fake transport
 */

#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <memory>
#include <set>
#include <string>
#include <system_error>
#include <thread>

#include "chunk_planner.hpp"
#include "content_hash.hpp"
#include "parallel_upload_coordinator.hpp"
#include "test_helpers.hpp"
#include "upload_errors.hpp"
#include "uploader_impl.hpp"
#include "uploader_mocks.hpp"

using namespace skylift::uploader;
using namespace skylift::uploader::test;

namespace {
constexpr uint64_t MiB = 1024 * 1024;
}

class ParallelUploadCoordinatorTest : public ::testing::Test {
protected:
  void SetUp() override {
    dir_ = createTempDir("skylift_coord_");
    target_ = UploadTarget{"asset-1", "data/file.bin", "application/octet-stream", "test"};
    policy_ = fastPolicy(3);
  }

  void TearDown() override {
    cleanupTempDir(dir_);
  }

  SourceFile makeSource(size_t size) {
    std::string path = generateTestFile(dir_ + "/file_" + std::to_string(size) + ".bin", size);
    return SourceFile{path, size};
  }

  std::string dir_;
  UploadTarget target_;
  RetryPolicy policy_;
  CancellationToken cancel_;
  RecordingTransport transport_;
  FileStreamFactoryImpl streams_;
  NullProgressSink progress_;
};

TEST_F(ParallelUploadCoordinatorTest, TenMegabytesThreeWorkers) {
  SourceFile source = makeSource(10 * MiB);
  ChunkPlan plan = plan_chunks(source.size, 4 * MiB);
  ASSERT_EQ(plan.size(), 3u);

  ParallelUploadCoordinator coordinator(transport_, streams_, policy_, cancel_, progress_);
  UploadOutcome outcome = coordinator.uploadChunked(target_, plan, 3, source);

  EXPECT_EQ(outcome.total_bytes, 10 * MiB);
  EXPECT_EQ(outcome.chunk_count, 3u);
  EXPECT_EQ(outcome.content_hash, md5_hex(patternBytes(10 * MiB)));
  EXPECT_EQ(transport_.begin_calls.load(), 1);
  EXPECT_EQ(transport_.complete_calls.load(), 1);
  EXPECT_EQ(transport_.completed_part_count.load(), 3u);
  EXPECT_EQ(transport_.assembled(), patternBytes(10 * MiB));

  auto results = coordinator.results();
  ASSERT_EQ(results.size(), 3u);
  EXPECT_EQ(results[2].bytes, 2 * MiB);
  EXPECT_EQ(coordinator.stats().chunks_completed.load(), 3u);
  EXPECT_EQ(coordinator.stats().bytes_uploaded.load(), 10 * MiB);
}

TEST_F(ParallelUploadCoordinatorTest, ConcurrencyNeverExceedsParallelism) {
  SourceFile source = makeSource(64 * 1024);
  ChunkPlan plan = plan_chunks(source.size, 4096);
  transport_.send_delay = std::chrono::milliseconds(5);

  ParallelUploadCoordinator coordinator(transport_, streams_, policy_, cancel_, progress_);
  coordinator.uploadChunked(target_, plan, 3, source);

  EXPECT_LE(transport_.max_in_flight.load(), 3);
  EXPECT_EQ(transport_.send_count(), plan.size());
}

TEST_F(ParallelUploadCoordinatorTest, TransientChunkFailuresRecover) {
  SourceFile source = makeSource(40000);
  ChunkPlan plan = plan_chunks(source.size, 10000);
  transport_.fail_times(1, 2);

  int callbacks = 0;
  policy_.on_attempt_failure = [&callbacks](const std::string& label, int, const std::string&) {
    EXPECT_EQ(label, "chunk-1");
    callbacks++;
  };

  ParallelUploadCoordinator coordinator(transport_, streams_, policy_, cancel_, progress_);
  UploadOutcome outcome = coordinator.uploadChunked(target_, plan, 2, source);

  EXPECT_EQ(outcome.total_bytes, 40000u);
  EXPECT_EQ(callbacks, 2);
  EXPECT_EQ(coordinator.stats().attempts.load(), 6u);
}

TEST_F(ParallelUploadCoordinatorTest, FailFastSequential) {
  SourceFile source = makeSource(50000);
  ChunkPlan plan = plan_chunks(source.size, 10000);
  ASSERT_EQ(plan.size(), 5u);
  transport_.fail_always(2);

  ParallelUploadCoordinator coordinator(transport_, streams_, policy_, cancel_, progress_);
  try {
    coordinator.uploadChunked(target_, plan, 1, source);
    FAIL() << "expected ChunkUploadFailed";
  } catch (const ChunkUploadFailed& e) {
    EXPECT_EQ(e.index(), 2u);
    EXPECT_EQ(e.stage(), ErrorStage::Chunk);
  }

  // Chunks 3 and 4 had not started when chunk 2 gave up
  auto parts = transport_.sent_parts();
  EXPECT_EQ(parts, (std::set<size_t>{0, 1, 2}));
  EXPECT_EQ(transport_.complete_calls.load(), 0);
  EXPECT_TRUE(cancel_.is_cancelled());
}

TEST_F(ParallelUploadCoordinatorTest, FailFastReportsUnstartedBytes) {
  SourceFile source = makeSource(50000);
  ChunkPlan plan = plan_chunks(source.size, 10000);
  transport_.fail_always(2);

  ::testing::NiceMock<MockProgressSink> progress;
  EXPECT_CALL(progress, report("fail-fast", "2 chunks (20000 bytes) not started")).Times(1);

  ParallelUploadCoordinator coordinator(transport_, streams_, policy_, cancel_, progress);
  EXPECT_THROW(coordinator.uploadChunked(target_, plan, 1, source), ChunkUploadFailed);
}

TEST_F(ParallelUploadCoordinatorTest, FailFastStopsUnstartedChunksInParallel) {
  SourceFile source = makeSource(40000);
  ChunkPlan plan = plan_chunks(source.size, 1000);
  ASSERT_EQ(plan.size(), 40u);
  transport_.fail_always(2);
  transport_.send_delay = std::chrono::milliseconds(30);

  ParallelUploadCoordinator coordinator(transport_, streams_, policy_, cancel_, progress_);
  try {
    coordinator.uploadChunked(target_, plan, 3, source);
    FAIL() << "expected ChunkUploadFailed";
  } catch (const ChunkUploadFailed& e) {
    EXPECT_EQ(e.index(), 2u);
  }

  auto sends = transport_.sends();
  std::chrono::steady_clock::time_point last_chunk2_start;
  int chunk2_attempts = 0;
  for (const auto& record : sends) {
    if (record.part_index && *record.part_index == 2) {
      last_chunk2_start = std::max(last_chunk2_start, record.at);
      chunk2_attempts++;
    }
  }
  EXPECT_EQ(chunk2_attempts, 3);

  // Cancellation is signalled when chunk 2's last attempt returns. Sends
  // already past their pre-attempt check may still land, but nothing new
  // may start after that.
  auto cancelled_at = last_chunk2_start + transport_.send_delay;
  for (const auto& record : sends) {
    EXPECT_LT(record.at, cancelled_at + std::chrono::milliseconds(25))
      << "part " << (record.part_index ? *record.part_index : 0) << " started after cancellation";
  }
  EXPECT_LT(transport_.sent_parts().size(), plan.size());
  EXPECT_EQ(transport_.complete_calls.load(), 0);

  for (const auto& result : coordinator.results()) {
    if (result.index != 2 && !result.ok()) {
      EXPECT_TRUE(result.cancelled);
    }
  }
}

TEST_F(ParallelUploadCoordinatorTest, ExternalCancellationSurfacesAsCancelled) {
  SourceFile source = makeSource(50000);
  ChunkPlan plan = plan_chunks(source.size, 10000);
  cancel_.cancel("caller abort");

  ParallelUploadCoordinator coordinator(transport_, streams_, policy_, cancel_, progress_);
  EXPECT_THROW(coordinator.uploadChunked(target_, plan, 2, source), OperationCancelled);
  EXPECT_EQ(transport_.send_count(), 0u);
}

TEST_F(ParallelUploadCoordinatorTest, ServerHashMismatchIsIntegrityError) {
  SourceFile source = makeSource(20000);
  transport_.complete_hash = "ffffffffffffffffffffffffffffffff";

  ParallelUploadCoordinator coordinator(transport_, streams_, policy_, cancel_, progress_);
  EXPECT_THROW(
    coordinator.uploadChunked(target_, plan_chunks(source.size, 8000), 2, source), IntegrityError
  );
}

TEST_F(ParallelUploadCoordinatorTest, MatchingServerHashAccepted) {
  SourceFile source = makeSource(20000);
  transport_.complete_hash = md5_hex(patternBytes(20000));

  ParallelUploadCoordinator coordinator(transport_, streams_, policy_, cancel_, progress_);
  auto outcome = coordinator.uploadChunked(target_, plan_chunks(source.size, 8000), 2, source);
  EXPECT_EQ(outcome.content_hash, transport_.complete_hash);
}

TEST_F(ParallelUploadCoordinatorTest, InvalidArgumentsRejectedBeforeNetwork) {
  SourceFile source = makeSource(1000);

  ParallelUploadCoordinator coordinator(transport_, streams_, policy_, cancel_, progress_);
  EXPECT_THROW(coordinator.uploadChunked(target_, plan_chunks(1000, 100), 0, source), ConfigError);
  EXPECT_THROW(coordinator.uploadChunked(target_, plan_chunks(999, 100), 2, source), ConfigError);
  EXPECT_EQ(transport_.begin_calls.load(), 0);
}

TEST_F(ParallelUploadCoordinatorTest, EmptyFileUploadsOneEmptyPart) {
  SourceFile source = makeSource(0);

  ParallelUploadCoordinator coordinator(transport_, streams_, policy_, cancel_, progress_);
  auto outcome = coordinator.uploadChunked(target_, plan_chunks(0, 4096), 4, source);

  EXPECT_EQ(outcome.total_bytes, 0u);
  EXPECT_EQ(outcome.content_hash, "d41d8cd98f00b204e9800998ecf8427e");
  EXPECT_EQ(transport_.send_count(), 1u);
}

// ============================================================================
// WorkerThreads
// ============================================================================

TEST(WorkerThreadsTest, JoinAllSkipsAbort) {
  bool aborted = false;
  std::atomic<int> ran{0};
  {
    WorkerThreads workers([&aborted]() { aborted = true; });
    for (int i = 0; i < 3; ++i) {
      workers.spawn([&ran]() { ran++; });
    }
    EXPECT_EQ(workers.size(), 3u);
    workers.join_all();
  }
  EXPECT_EQ(ran.load(), 3);
  EXPECT_FALSE(aborted);
}

TEST(WorkerThreadsTest, StartFailureStopsAndJoinsRunningWorkers) {
  CancellationToken cancel;
  std::atomic<bool> worker_exited{false};

  auto start_pool = [&]() {
    WorkerThreads workers([&cancel]() { cancel.cancel("worker pool failed to start"); });
    workers.spawn([&cancel, &worker_exited]() {
      while (!cancel.is_cancelled()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
      }
      worker_exited = true;
    });
    // Second thread can't be created
    throw std::system_error(std::make_error_code(std::errc::resource_unavailable_try_again));
  };

  EXPECT_THROW(start_pool(), std::system_error);
  EXPECT_TRUE(cancel.is_cancelled());
  EXPECT_EQ(cancel.reason(), "worker pool failed to start");
  EXPECT_TRUE(worker_exited.load());
}
