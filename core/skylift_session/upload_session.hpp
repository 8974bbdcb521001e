// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef SKYLIFT_UPLOAD_SESSION_HPP
#define SKYLIFT_UPLOAD_SESSION_HPP

#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>

#include <agent.hpp>
#include <cancellation_token.hpp>
#include <onboarding_manager.hpp>
#include <progress_sink.hpp>
#include <retry_policy.hpp>
#include <upload_types.hpp>
#include <uploader_interfaces.hpp>

namespace skylift {
namespace session {

/**
 * Per-call upload options
 *
 * Validated before any I/O; invalid values raise ConfigError.
 */
struct UploadOptions {
  bool chunked = false;
  int parallelism = 3;                               // >= 1, chunked path only
  int retry_attempts = 3;                            // >= 1
  uint64_t chunk_size = 8 * 1024 * 1024;             // > 0
  std::chrono::milliseconds retry_delay{300};        // >= 0
  std::chrono::milliseconds max_retry_delay{30000};  // raised to retry_delay if smaller
  uploader::BackoffStrategy backoff = uploader::BackoffStrategy::Linear;
  std::chrono::milliseconds timeout{0};              // 0 = no deadline
  bool verbose = false;
  uploader::AttemptFailureCallback on_attempt_failure;

  void validate() const;

  uploader::RetryPolicy retry_policy() const;
};

/**
 * Top-level upload facade
 *
 * Checks the source, onboards the agent when in agent mode, then uploads
 * either in one piece or in chunks over a bounded worker pool. The source
 * file is never modified.
 */
class UploadSession {
public:
  UploadSession(
    uploader::ITransportClient& transport, uploader::IProgressSink& progress,
    std::shared_ptr<uploader::IFileSystem> filesystem = nullptr,
    std::shared_ptr<uploader::IFileStreamFactory> streams = nullptr
  );

  // Non-copyable, non-movable
  UploadSession(const UploadSession&) = delete;
  UploadSession& operator=(const UploadSession&) = delete;

  /**
   * Upload on behalf of an agent: onboarding happens before any transfer,
   * and the target asset defaults to the agent's client id.
   */
  void enableAgentMode(agent::Agent& agent, agent::OnboardingManager& onboarding);

  bool agentMode() const {
    return agent_ != nullptr;
  }

  /**
   * @throws ConfigError, SourceNotFound, SourceReadError before any network call
   * @throws CertificateSetupFailed, OnboardingFailed from onboarding
   * @throws ChunkUploadFailed, RetryExhausted, TransportError, IntegrityError
   *         from the transfer
   * @throws OperationCancelled on cancel() or timeout
   */
  uploader::UploadOutcome upload(
    const std::string& source_path, const uploader::UploadTarget& target,
    const UploadOptions& options
  );

  /**
   * Cancel the upload in progress, if any.
   */
  void cancel(const std::string& reason);

  /**
   * Fill the empty fields of target: asset id from the onboarded agent,
   * file path from the source base name, a generic mime type and a dated
   * description.
   *
   * @throws ConfigError if no asset id can be determined
   */
  uploader::UploadTarget resolveTarget(
    const uploader::UploadTarget& target, const std::string& source_path
  ) const;

private:
  uploader::SourceFile checkSource(const std::string& source_path) const;

  uploader::UploadOutcome uploadSingleShot(
    const uploader::UploadTarget& target, const uploader::SourceFile& source,
    const uploader::RetryPolicy& policy, uploader::CancellationToken& cancel
  );

  uploader::ITransportClient& transport_;
  uploader::IProgressSink& progress_;
  std::shared_ptr<uploader::IFileSystem> filesystem_;
  std::shared_ptr<uploader::IFileStreamFactory> streams_;

  agent::Agent* agent_ = nullptr;
  agent::OnboardingManager* onboarding_ = nullptr;

  std::mutex active_mutex_;
  uploader::CancellationToken* active_ = nullptr;
};

/**
 * "File uploaded on <UTC ISO-8601> using skylift"
 */
std::string default_description(std::chrono::system_clock::time_point now);

}  // namespace session
}  // namespace skylift

#endif  // SKYLIFT_UPLOAD_SESSION_HPP
