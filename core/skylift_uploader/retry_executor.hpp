// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef SKYLIFT_RETRY_EXECUTOR_HPP
#define SKYLIFT_RETRY_EXECUTOR_HPP

#include <exception>
#include <string>
#include <utility>

#include "cancellation_token.hpp"
#include "retry_policy.hpp"
#include "upload_errors.hpp"

namespace skylift {
namespace uploader {

/**
 * Runs an operation under a RetryPolicy.
 *
 * - Attempts run strictly one after another.
 * - Cancellation is checked before every attempt and before every sleep, and
 *   interrupts the sleep itself; it aborts with OperationCancelled no matter
 *   how many attempts remain.
 * - UploadErrors with retryable() == false propagate immediately.
 * - Any other std::exception counts as a failed attempt.
 * - After the last failed attempt RetryExhausted is thrown, carrying the last
 *   underlying error.
 */
class RetryExecutor {
public:
  RetryExecutor(const RetryPolicy& policy, const CancellationToken& cancel)
      : policy_(policy)
      , cancel_(cancel) {}

  /**
   * @param label Operation label used for the failure callback and errors
   * @param operation Callable returning T; failure is signalled by throwing
   * @return Whatever the first successful attempt returned
   */
  template<typename Operation>
  auto run(const std::string& label, Operation&& operation) -> decltype(operation()) {
    std::exception_ptr last_error;
    std::string last_message;

    for (int attempt = 1; attempt <= policy_.max_attempts; ++attempt) {
      cancel_.throw_if_cancelled(label);

      try {
        return operation();
      } catch (const OperationCancelled&) {
        throw;
      } catch (const UploadError& e) {
        if (!e.retryable()) {
          throw;
        }
        last_error = std::current_exception();
        last_message = e.what();
      } catch (const std::exception& e) {
        last_error = std::current_exception();
        last_message = e.what();
      }

      if (attempt == policy_.max_attempts) {
        break;
      }

      notify_attempt_failure(policy_, label, attempt, last_message);

      cancel_.throw_if_cancelled(label);
      if (!cancel_.sleep_for(policy_.delay_after(attempt))) {
        cancel_.throw_if_cancelled(label);
      }
    }

    throw RetryExhausted(label, policy_.max_attempts, last_message, last_error);
  }

  const RetryPolicy& policy() const {
    return policy_;
  }

private:
  const RetryPolicy& policy_;
  const CancellationToken& cancel_;
};

}  // namespace uploader
}  // namespace skylift

#endif  // SKYLIFT_RETRY_EXECUTOR_HPP
