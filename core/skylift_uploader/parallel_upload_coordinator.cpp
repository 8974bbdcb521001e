// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "parallel_upload_coordinator.hpp"

#include <algorithm>
#include <chrono>
#include <functional>
#include <stdexcept>
#include <system_error>
#include <thread>
#include <utility>

#include "chunk_planner.hpp"
#include "content_hash.hpp"
#include "retry_executor.hpp"
#include "upload_errors.hpp"

#define SKYLIFT_LOG_COMPONENT "coordinator"
#include <skylift_log_macros.hpp>

namespace skylift {
namespace uploader {

namespace {

TransportResult check_transport(const std::string& label, const TransportResult& result) {
  if (!result.success) {
    throw TransportError(
      label + ": " + result.error_message, result.is_retryable, result.status_code,
      result.error_code
    );
  }
  return result;
}

}  // namespace

WorkerThreads::WorkerThreads(std::function<void()> on_abort)
    : on_abort_(std::move(on_abort)) {}

WorkerThreads::~WorkerThreads() {
  if (!joined_ && on_abort_) {
    on_abort_();
  }
  join_all();
}

void WorkerThreads::join_all() {
  for (auto& thread : threads_) {
    if (thread.joinable()) {
      thread.join();
    }
  }
  joined_ = true;
}

ParallelUploadCoordinator::ParallelUploadCoordinator(
  ITransportClient& transport, IFileStreamFactory& streams, const RetryPolicy& policy,
  CancellationToken& cancel, IProgressSink& progress
)
    : transport_(transport)
    , streams_(streams)
    , policy_(policy)
    , cancel_(cancel)
    , progress_(progress)
    , worker_(transport, streams, policy, cancel, progress) {}

UploadOutcome ParallelUploadCoordinator::uploadChunked(
  const UploadTarget& target, const ChunkPlan& plan, int parallelism, const SourceFile& source
) {
  if (parallelism < 1) {
    throw ConfigError("parallelism must be at least 1, got " + std::to_string(parallelism));
  }
  if (!is_valid_plan(plan, source.size)) {
    throw ConfigError("chunk plan does not cover " + source.path);
  }

  auto start_time = std::chrono::steady_clock::now();
  RetryExecutor executor(policy_, cancel_);

  executor.run("multipart-start", [&]() {
    return check_transport("multipart-start", transport_.begin_multipart(target));
  });
  progress_.report("multipart-start", target.asset_id + "/" + target.file_path);

  for (const auto& chunk : plan) {
    if (!queue_.enqueue(chunk)) {
      throw std::logic_error("ParallelUploadCoordinator is single-use");
    }
  }

  size_t num_workers = std::min(static_cast<size_t>(parallelism), plan.size());
  SKYLIFT_LOG_INFO(
    "Uploading " << plan.size() << " chunks of " << source.path << " with " << num_workers
                 << " workers" << logging::kv("bytes", source.size)
  );

  {
    WorkerThreads workers([this]() {
      cancel_.cancel("worker pool failed to start");
      queue_.shutdown();
    });
    try {
      for (size_t i = 0; i < num_workers; ++i) {
        workers.spawn(
          &ParallelUploadCoordinator::workerLoop, this, static_cast<int>(i), std::cref(target),
          std::cref(source)
        );
      }
    } catch (const std::system_error& e) {
      SKYLIFT_LOG_ERROR(
        "Can't start upload worker " << workers.size() << " of " << num_workers << ": "
                                     << e.what()
      );
      throw;
    }
    workers.join_all();
  }

  {
    std::lock_guard<std::mutex> lock(results_mutex_);
    if (first_failure_) {
      throw ChunkUploadFailed(first_failure_->index, first_failure_->error_message);
    }
  }
  cancel_.throw_if_cancelled("chunked upload of " + source.path);

  TransportResult completed = executor.run("multipart-complete", [&]() {
    return check_transport(
      "multipart-complete", transport_.complete_multipart(target, plan.size())
    );
  });
  progress_.report("multipart-complete", std::to_string(plan.size()) + " parts");

  UploadOutcome outcome;
  outcome.content_hash = compute_file_md5(source, streams_);
  if (!completed.server_hash.empty() && completed.server_hash != outcome.content_hash) {
    throw IntegrityError(
      "platform reported hash " + completed.server_hash + " for " + target.file_path +
      ", local hash is " + outcome.content_hash
    );
  }
  outcome.total_bytes = source.size;
  outcome.chunk_count = plan.size();
  outcome.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
    std::chrono::steady_clock::now() - start_time
  );

  SKYLIFT_LOG_INFO(
    "Chunked upload of " << source.path << " complete" << logging::kv("chunks", plan.size())
                         << logging::kv("attempts", stats_.attempts.load())
                         << logging::kv("elapsed_ms", outcome.elapsed.count())
  );
  return outcome;
}

const UploadStats& ParallelUploadCoordinator::stats() const {
  return stats_;
}

std::vector<ChunkResult> ParallelUploadCoordinator::results() const {
  std::lock_guard<std::mutex> lock(results_mutex_);
  std::vector<ChunkResult> sorted = results_;
  std::sort(sorted.begin(), sorted.end(), [](const ChunkResult& a, const ChunkResult& b) {
    return a.index < b.index;
  });
  return sorted;
}

void ParallelUploadCoordinator::workerLoop(
  int worker_id, const UploadTarget& target, const SourceFile& source
) {
  while (!cancel_.is_cancelled()) {
    auto chunk = queue_.dequeue();
    if (!chunk) {
      break;  // Drained or shut down
    }

    SKYLIFT_LOG_DEBUG("Worker " << worker_id << " took chunk " << chunk->index);
    ChunkResult result = worker_.uploadChunk(target, *chunk, source, true);
    recordResult(result);
  }
}

void ParallelUploadCoordinator::recordResult(const ChunkResult& result) {
  stats_.attempts += static_cast<uint64_t>(result.attempts);

  if (result.ok()) {
    uint64_t done = ++stats_.chunks_completed;
    stats_.bytes_uploaded += result.bytes;
    SKYLIFT_LOG_INFO_EVERY_N(
      16, "Chunks completed: " << done << logging::kv("bytes", stats_.bytes_uploaded.load())
    );
  } else if (!result.cancelled) {
    stats_.chunks_failed++;
  }

  bool trigger_fail_fast = false;
  {
    std::lock_guard<std::mutex> lock(results_mutex_);
    results_.push_back(result);
    if (!result.ok() && !result.cancelled && !first_failure_) {
      first_failure_ = result;
      trigger_fail_fast = true;
    }
  }

  if (trigger_fail_fast) {
    SKYLIFT_LOG_ERROR(
      "Chunk " << result.index << " failed, cancelling remaining chunks: "
               << result.error_message
    );
    cancel_.cancel("chunk " + std::to_string(result.index) + " failed");
    uint64_t unsent_bytes = queue_.pending_bytes();
    size_t dropped = queue_.shutdown();
    SKYLIFT_LOG_INFO(
      "Dropped " << dropped << " unstarted chunks" << logging::kv("bytes", unsent_bytes)
    );
    progress_.report(
      "fail-fast", std::to_string(dropped) + " chunks (" + std::to_string(unsent_bytes) +
                     " bytes) not started"
    );
  }
}

}  // namespace uploader
}  // namespace skylift
