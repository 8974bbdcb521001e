// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef SKYLIFT_RETRY_POLICY_HPP
#define SKYLIFT_RETRY_POLICY_HPP

#include <chrono>
#include <functional>
#include <string>

namespace skylift {
namespace uploader {

/**
 * How the pause between attempts grows.
 */
enum class BackoffStrategy {
  Fixed,   // base_delay after every failed attempt
  Linear,  // base_delay * attempt (1x, 2x, 3x, ...)
};

/**
 * Invoked after a failed attempt that will be retried.
 *
 * @param label Operation label ("onboard", "chunk-3", ...)
 * @param attempt 1-based number of the attempt that failed
 * @param error Message of the failure
 */
using AttemptFailureCallback =
  std::function<void(const std::string& label, int attempt, const std::string& error)>;

/**
 * Bounded retry configuration, shared read-only by every retrying operation
 * of a session.
 *
 * With N = max_attempts an always-failing operation runs N times and the
 * failure callback fires N-1 times (never after the final attempt).
 *
 * Delay after failed attempt k (1-based), before attempt k+1:
 *   Fixed:  base_delay
 *   Linear: base_delay * k
 * both capped at max_delay.
 */
struct RetryPolicy {
  int max_attempts = 3;
  std::chrono::milliseconds base_delay{300};
  std::chrono::milliseconds max_delay{30000};
  BackoffStrategy backoff = BackoffStrategy::Linear;
  AttemptFailureCallback on_attempt_failure;

  /**
   * Delay to wait after the given failed attempt (1-based).
   */
  std::chrono::milliseconds delay_after(int attempt) const;

  /**
   * Throws ConfigError for max_attempts < 1 or negative delays.
   */
  void validate() const;
};

/**
 * Parse "fixed" or "linear" (case-insensitive).
 *
 * @return false if the name is unknown
 */
bool parse_backoff_strategy(const std::string& name, BackoffStrategy& strategy);

const char* to_string(BackoffStrategy strategy);

/**
 * Invoke policy.on_attempt_failure (if set). An exception thrown by the
 * callback is logged and does not affect the retried operation.
 */
void notify_attempt_failure(
  const RetryPolicy& policy, const std::string& label, int attempt, const std::string& error
);

}  // namespace uploader
}  // namespace skylift

#endif  // SKYLIFT_RETRY_POLICY_HPP
