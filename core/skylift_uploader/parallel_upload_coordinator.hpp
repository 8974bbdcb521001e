// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef SKYLIFT_PARALLEL_UPLOAD_COORDINATOR_HPP
#define SKYLIFT_PARALLEL_UPLOAD_COORDINATOR_HPP

#include <atomic>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "cancellation_token.hpp"
#include "chunk_queue.hpp"
#include "chunk_upload_worker.hpp"
#include "progress_sink.hpp"
#include "retry_policy.hpp"
#include "upload_types.hpp"
#include "uploader_interfaces.hpp"

namespace skylift {
namespace uploader {

/**
 * Counters of a chunked upload, readable while it runs
 */
struct UploadStats {
  std::atomic<uint64_t> chunks_completed{0};
  std::atomic<uint64_t> chunks_failed{0};
  std::atomic<uint64_t> attempts{0};
  std::atomic<uint64_t> bytes_uploaded{0};
};

/**
 * Threads of one worker pool. Every started thread is joined on destruction.
 * If the group goes away before join_all(), for instance because starting a
 * later thread threw, on_abort runs first so the running workers can stop.
 */
class WorkerThreads {
public:
  explicit WorkerThreads(std::function<void()> on_abort);
  ~WorkerThreads();

  WorkerThreads(const WorkerThreads&) = delete;
  WorkerThreads& operator=(const WorkerThreads&) = delete;

  template<typename F, typename... Args>
  void spawn(F&& f, Args&&... args) {
    threads_.emplace_back(std::forward<F>(f), std::forward<Args>(args)...);
  }

  void join_all();

  size_t size() const {
    return threads_.size();
  }

private:
  std::function<void()> on_abort_;
  std::vector<std::thread> threads_;
  bool joined_ = false;
};

/**
 * Runs a bounded pool of workers over a chunk plan.
 *
 * Workers pull the next unstarted chunk until the plan is drained. The first
 * chunk that exhausts its retries cancels the session token and shuts the
 * queue down: no unstarted chunk begins afterwards, and in-flight chunks stop
 * at their next attempt or sleep.
 *
 * One coordinator per upload; not reusable.
 */
class ParallelUploadCoordinator {
public:
  ParallelUploadCoordinator(
    ITransportClient& transport, IFileStreamFactory& streams, const RetryPolicy& policy,
    CancellationToken& cancel, IProgressSink& progress
  );

  // Non-copyable, non-movable (owns worker state)
  ParallelUploadCoordinator(const ParallelUploadCoordinator&) = delete;
  ParallelUploadCoordinator& operator=(const ParallelUploadCoordinator&) = delete;

  /**
   * Upload every chunk of plan with at most `parallelism` concurrent workers,
   * then complete the multipart upload and hash the source.
   *
   * @throws ConfigError for parallelism < 1 or a plan not covering source.size
   * @throws ChunkUploadFailed naming the first chunk that failed
   * @throws OperationCancelled if the session was cancelled from outside
   * @throws RetryExhausted / TransportError if starting or completing failed
   * @throws IntegrityError if the platform's hash differs from the local one
   */
  UploadOutcome uploadChunked(
    const UploadTarget& target, const ChunkPlan& plan, int parallelism, const SourceFile& source
  );

  const UploadStats& stats() const;

  /**
   * Results of every chunk that was started, ordered by index.
   */
  std::vector<ChunkResult> results() const;

private:
  void workerLoop(int worker_id, const UploadTarget& target, const SourceFile& source);
  void recordResult(const ChunkResult& result);

  ITransportClient& transport_;
  IFileStreamFactory& streams_;
  const RetryPolicy& policy_;
  CancellationToken& cancel_;
  IProgressSink& progress_;

  ChunkUploadWorker worker_;
  ChunkQueue queue_;
  UploadStats stats_;

  mutable std::mutex results_mutex_;
  std::vector<ChunkResult> results_;
  std::optional<ChunkResult> first_failure_;
};

}  // namespace uploader
}  // namespace skylift

#endif  // SKYLIFT_PARALLEL_UPLOAD_COORDINATOR_HPP
