// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "cancellation_token.hpp"

#include "upload_errors.hpp"

namespace skylift {
namespace uploader {

void CancellationToken::cancel(const std::string& reason) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (cancelled_.load()) {
      return;
    }
    reason_ = reason;
    cancelled_.store(true);
  }
  cv_.notify_all();
}

void CancellationToken::set_deadline(clock::time_point deadline) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    deadline_ = deadline;
  }
  cv_.notify_all();
}

bool CancellationToken::deadline_passed_locked(clock::time_point now) const {
  return deadline_ && now >= *deadline_;
}

bool CancellationToken::is_cancelled() const {
  if (cancelled_.load()) {
    return true;
  }
  std::lock_guard<std::mutex> lock(mutex_);
  return deadline_passed_locked(clock::now());
}

std::string CancellationToken::reason() const {
  std::lock_guard<std::mutex> lock(mutex_);
  if (cancelled_.load()) {
    return reason_;
  }
  if (deadline_passed_locked(clock::now())) {
    return "deadline exceeded";
  }
  return "";
}

bool CancellationToken::sleep_for(std::chrono::milliseconds duration) const {
  std::unique_lock<std::mutex> lock(mutex_);
  auto wake_at = clock::now() + duration;

  while (true) {
    if (cancelled_.load()) {
      return false;
    }
    auto now = clock::now();
    if (deadline_passed_locked(now)) {
      return false;
    }
    if (now >= wake_at) {
      return true;
    }

    auto until = wake_at;
    if (deadline_ && *deadline_ < until) {
      until = *deadline_;
    }
    cv_.wait_until(lock, until);
  }
}

void CancellationToken::throw_if_cancelled(const std::string& operation) const {
  if (is_cancelled()) {
    throw OperationCancelled(operation + " cancelled: " + reason());
  }
}

}  // namespace uploader
}  // namespace skylift
