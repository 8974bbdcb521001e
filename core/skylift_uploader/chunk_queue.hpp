// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef SKYLIFT_CHUNK_QUEUE_HPP
#define SKYLIFT_CHUNK_QUEUE_HPP

#include <atomic>
#include <cstdint>
#include <mutex>
#include <optional>
#include <queue>

#include "upload_types.hpp"

namespace skylift {
namespace uploader {

/**
 * Thread-safe queue of chunks not yet started
 *
 * Filled with a plan's chunks, drained by the upload workers. After shutdown()
 * no further chunk is handed out, which is how fail-fast keeps unstarted
 * chunks from beginning.
 */
class ChunkQueue {
public:
  ChunkQueue() = default;
  ~ChunkQueue() = default;

  // Non-copyable, non-movable
  ChunkQueue(const ChunkQueue&) = delete;
  ChunkQueue& operator=(const ChunkQueue&) = delete;
  ChunkQueue(ChunkQueue&&) = delete;
  ChunkQueue& operator=(ChunkQueue&&) = delete;

  /**
   * Add a chunk. Ignored after shutdown.
   *
   * @return true if enqueued
   */
  bool enqueue(const Chunk& chunk);

  /**
   * Remove the next chunk in plan order.
   *
   * @return Chunk, or std::nullopt when drained or shut down
   */
  std::optional<Chunk> dequeue();

  size_t size() const;

  bool empty() const;

  /**
   * Bytes of all chunks still waiting, reported when fail-fast drops them.
   */
  uint64_t pending_bytes() const;

  /**
   * Stop handing out chunks and drop everything still queued.
   *
   * @return Number of chunks dropped
   */
  size_t shutdown();

  bool is_shutdown() const;

private:
  mutable std::mutex mutex_;
  std::queue<Chunk> queue_;
  std::atomic<bool> shutdown_{false};
  std::atomic<uint64_t> pending_bytes_{0};
};

}  // namespace uploader
}  // namespace skylift

#endif  // SKYLIFT_CHUNK_QUEUE_HPP
