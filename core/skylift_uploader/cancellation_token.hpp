// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef SKYLIFT_CANCELLATION_TOKEN_HPP
#define SKYLIFT_CANCELLATION_TOKEN_HPP

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <optional>
#include <string>

namespace skylift {
namespace uploader {

/**
 * Session-scoped cancellation signal.
 *
 * Set either explicitly (fail-fast, caller abort) or implicitly by an
 * optional deadline. Waiters in sleep_for() wake up as soon as cancel()
 * is called.
 *
 * Thread-safe.
 */
class CancellationToken {
public:
  using clock = std::chrono::steady_clock;

  CancellationToken() = default;

  CancellationToken(const CancellationToken&) = delete;
  CancellationToken& operator=(const CancellationToken&) = delete;

  /**
   * Signal cancellation. The first reason wins; later calls are ignored.
   */
  void cancel(const std::string& reason);

  /**
   * Cancel automatically once the deadline passes.
   */
  void set_deadline(clock::time_point deadline);

  bool is_cancelled() const;

  /**
   * Reason passed to the first cancel(), or "deadline exceeded".
   */
  std::string reason() const;

  /**
   * Sleep for the given duration unless cancelled first.
   *
   * @return true if the full duration elapsed, false if cancelled
   */
  bool sleep_for(std::chrono::milliseconds duration) const;

  /**
   * Throw OperationCancelled naming the operation if cancelled.
   */
  void throw_if_cancelled(const std::string& operation) const;

private:
  bool deadline_passed_locked(clock::time_point now) const;

  mutable std::mutex mutex_;
  mutable std::condition_variable cv_;
  std::atomic<bool> cancelled_{false};
  std::string reason_;
  std::optional<clock::time_point> deadline_;
};

}  // namespace uploader
}  // namespace skylift

#endif  // SKYLIFT_CANCELLATION_TOKEN_HPP
