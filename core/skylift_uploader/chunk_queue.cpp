// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "chunk_queue.hpp"

namespace skylift {
namespace uploader {

bool ChunkQueue::enqueue(const Chunk& chunk) {
  std::lock_guard<std::mutex> lock(mutex_);

  if (shutdown_) {
    return false;
  }

  pending_bytes_ += chunk.length;
  queue_.push(chunk);
  return true;
}

std::optional<Chunk> ChunkQueue::dequeue() {
  std::lock_guard<std::mutex> lock(mutex_);

  if (shutdown_ || queue_.empty()) {
    return std::nullopt;
  }

  Chunk chunk = queue_.front();
  queue_.pop();
  pending_bytes_ -= chunk.length;
  return chunk;
}

size_t ChunkQueue::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return queue_.size();
}

bool ChunkQueue::empty() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return queue_.empty();
}

uint64_t ChunkQueue::pending_bytes() const {
  return pending_bytes_.load();
}

size_t ChunkQueue::shutdown() {
  std::lock_guard<std::mutex> lock(mutex_);

  shutdown_ = true;
  size_t dropped = queue_.size();
  std::queue<Chunk>().swap(queue_);
  pending_bytes_ = 0;
  return dropped;
}

bool ChunkQueue::is_shutdown() const {
  return shutdown_.load();
}

}  // namespace uploader
}  // namespace skylift
