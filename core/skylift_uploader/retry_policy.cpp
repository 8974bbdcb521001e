// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "retry_policy.hpp"

#include <algorithm>
#include <cctype>
#include <cstdint>

#include "upload_errors.hpp"

#define SKYLIFT_LOG_COMPONENT "retry"
#include <skylift_log_macros.hpp>

namespace skylift {
namespace uploader {

std::chrono::milliseconds RetryPolicy::delay_after(int attempt) const {
  if (attempt < 1) {
    attempt = 1;
  }

  int64_t delay_ms = base_delay.count();
  if (backoff == BackoffStrategy::Linear) {
    delay_ms *= attempt;
  }

  delay_ms = std::min<int64_t>(delay_ms, max_delay.count());
  return std::chrono::milliseconds(std::max<int64_t>(delay_ms, 0));
}

void RetryPolicy::validate() const {
  if (max_attempts < 1) {
    throw ConfigError(
      "retry attempts must be at least 1 (got " + std::to_string(max_attempts) + ")"
    );
  }
  if (base_delay.count() < 0) {
    throw ConfigError("retry delay must not be negative");
  }
  if (max_delay < base_delay) {
    throw ConfigError("maximum retry delay must not be below the base delay");
  }
}

bool parse_backoff_strategy(const std::string& name, BackoffStrategy& strategy) {
  std::string lower = name;
  std::transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char c) {
    return std::tolower(c);
  });

  if (lower == "fixed") {
    strategy = BackoffStrategy::Fixed;
    return true;
  }
  if (lower == "linear") {
    strategy = BackoffStrategy::Linear;
    return true;
  }
  return false;
}

const char* to_string(BackoffStrategy strategy) {
  return strategy == BackoffStrategy::Fixed ? "fixed" : "linear";
}

void notify_attempt_failure(
  const RetryPolicy& policy, const std::string& label, int attempt, const std::string& error
) {
  SKYLIFT_LOG_DEBUG(
    "Attempt failed" << logging::kv("op", label) << logging::kv("attempt", attempt)
                     << logging::kv("of", policy.max_attempts) << logging::kv("error", error)
  );

  if (!policy.on_attempt_failure) {
    return;
  }
  try {
    policy.on_attempt_failure(label, attempt, error);
  } catch (const std::exception& e) {
    SKYLIFT_LOG_WARN("Retry failure callback threw" << logging::kv("op", label) << ": " << e.what());
  }
}

}  // namespace uploader
}  // namespace skylift
