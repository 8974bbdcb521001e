// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "upload_session.hpp"

#include <algorithm>
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <sstream>
#include <utility>

#include <chunk_planner.hpp>
#include <chunk_upload_worker.hpp>
#include <parallel_upload_coordinator.hpp>
#include <upload_errors.hpp>
#include <uploader_impl.hpp>

#define SKYLIFT_LOG_COMPONENT "session"
#include <skylift_log_macros.hpp>

namespace skylift {
namespace session {

using uploader::CancellationToken;
using uploader::ConfigError;
using uploader::SourceFile;
using uploader::UploadOutcome;
using uploader::UploadTarget;

namespace {

constexpr const char* kDefaultMimeType = "application/octet-stream";

/**
 * Registers the call's token so cancel() can reach it.
 */
class ActiveTokenGuard {
public:
  ActiveTokenGuard(std::mutex& mutex, CancellationToken*& slot, CancellationToken& token)
      : mutex_(mutex)
      , slot_(slot) {
    std::lock_guard<std::mutex> lock(mutex_);
    slot_ = &token;
  }

  ~ActiveTokenGuard() {
    std::lock_guard<std::mutex> lock(mutex_);
    slot_ = nullptr;
  }

private:
  std::mutex& mutex_;
  CancellationToken*& slot_;
};

}  // namespace

std::string default_description(std::chrono::system_clock::time_point now) {
  std::time_t t = std::chrono::system_clock::to_time_t(now);
  std::tm tm_utc{};
  gmtime_r(&t, &tm_utc);

  std::ostringstream oss;
  oss << "File uploaded on " << std::put_time(&tm_utc, "%Y-%m-%dT%H:%M:%SZ") << " using skylift";
  return oss.str();
}

void UploadOptions::validate() const {
  if (parallelism < 1) {
    throw ConfigError("parallelism must be at least 1 (got " + std::to_string(parallelism) + ")");
  }
  if (retry_attempts < 1) {
    throw ConfigError(
      "retry attempts must be at least 1 (got " + std::to_string(retry_attempts) + ")"
    );
  }
  if (chunk_size == 0) {
    throw ConfigError("chunk size must be greater than 0");
  }
  if (timeout.count() < 0) {
    throw ConfigError("timeout must not be negative");
  }
  retry_policy().validate();
}

uploader::RetryPolicy UploadOptions::retry_policy() const {
  uploader::RetryPolicy policy;
  policy.max_attempts = retry_attempts;
  policy.base_delay = retry_delay;
  policy.max_delay = std::max(max_retry_delay, retry_delay);
  policy.backoff = backoff;
  policy.on_attempt_failure = on_attempt_failure;
  return policy;
}

UploadSession::UploadSession(
  uploader::ITransportClient& transport, uploader::IProgressSink& progress,
  std::shared_ptr<uploader::IFileSystem> filesystem,
  std::shared_ptr<uploader::IFileStreamFactory> streams
)
    : transport_(transport)
    , progress_(progress)
    , filesystem_(filesystem ? std::move(filesystem) : std::make_shared<uploader::FileSystemImpl>())
    , streams_(streams ? std::move(streams) : std::make_shared<uploader::FileStreamFactoryImpl>()) {}

void UploadSession::enableAgentMode(agent::Agent& agent, agent::OnboardingManager& onboarding) {
  agent_ = &agent;
  onboarding_ = &onboarding;
}

void UploadSession::cancel(const std::string& reason) {
  std::lock_guard<std::mutex> lock(active_mutex_);
  if (active_ == nullptr) {
    SKYLIFT_LOG_DEBUG("cancel() without an upload in progress");
    return;
  }
  active_->cancel(reason);
}

SourceFile UploadSession::checkSource(const std::string& source_path) const {
  if (source_path.empty() || !filesystem_->exists(source_path) ||
      !filesystem_->is_regular_file(source_path)) {
    throw uploader::SourceNotFound(source_path);
  }

  // Probe readability up front so a permission problem never reaches the network
  if (!streams_->create_file_stream(source_path, std::ios::in | std::ios::binary)) {
    throw uploader::SourceReadError("Can't open " + source_path + " for reading");
  }

  return SourceFile{source_path, filesystem_->file_size(source_path)};
}

UploadTarget UploadSession::resolveTarget(
  const UploadTarget& target, const std::string& source_path
) const {
  UploadTarget resolved = target;

  if (resolved.asset_id.empty()) {
    if (agent_ == nullptr || !agent_->client_id()) {
      throw ConfigError("no asset id given and no onboarded agent to upload to");
    }
    resolved.asset_id = *agent_->client_id();
  }
  if (resolved.file_path.empty()) {
    resolved.file_path = std::filesystem::path(source_path).filename().string();
  }
  if (resolved.mime_type.empty()) {
    resolved.mime_type = kDefaultMimeType;
  }
  if (resolved.description.empty()) {
    resolved.description = default_description(std::chrono::system_clock::now());
  }
  return resolved;
}

UploadOutcome UploadSession::upload(
  const std::string& source_path, const UploadTarget& target, const UploadOptions& options
) {
  options.validate();
  if (target.asset_id.empty() && agent_ == nullptr) {
    throw ConfigError("an asset id is required when uploading without an agent");
  }
  SourceFile source = checkSource(source_path);

  CancellationToken cancel;
  if (options.timeout.count() > 0) {
    cancel.set_deadline(CancellationToken::clock::now() + options.timeout);
  }
  ActiveTokenGuard guard(active_mutex_, active_, cancel);

  uploader::RetryPolicy policy = options.retry_policy();

  if (agent_ != nullptr) {
    progress_.report("onboard", "ensuring agent " + agent_->config().client_id + " is onboarded");
    onboarding_->ensureOnboarded(*agent_, policy, cancel);
  }

  UploadTarget resolved = resolveTarget(target, source_path);
  SKYLIFT_LOG_SCOPED_CONTEXT(agent_ ? *agent_->client_id() : std::string(), resolved.asset_id);
  SKYLIFT_LOG_INFO(
    "Uploading " << source_path << logging::kv("bytes", source.size)
                 << logging::kv("path", resolved.file_path)
                 << logging::kv("chunked", options.chunked)
  );
  progress_.report("upload", source_path + " -> " + resolved.asset_id + "/" + resolved.file_path);

  UploadOutcome outcome;
  if (options.chunked) {
    uploader::ChunkPlan plan = uploader::plan_chunks(source.size, options.chunk_size);
    uploader::ParallelUploadCoordinator coordinator(
      transport_, *streams_, policy, cancel, progress_
    );
    outcome = coordinator.uploadChunked(resolved, plan, options.parallelism, source);
  } else {
    outcome = uploadSingleShot(resolved, source, policy, cancel);
  }

  progress_.report(
    "done", "uploaded " + std::to_string(outcome.total_bytes) + " bytes in " +
              std::to_string(outcome.elapsed.count()) + " ms, md5 " + outcome.content_hash
  );
  return outcome;
}

UploadOutcome UploadSession::uploadSingleShot(
  const UploadTarget& target, const SourceFile& source, const uploader::RetryPolicy& policy,
  CancellationToken& cancel
) {
  auto start_time = std::chrono::steady_clock::now();

  uploader::ChunkUploadWorker worker(transport_, *streams_, policy, cancel, progress_);
  uploader::Chunk whole_file{0, 0, source.size};
  uploader::ChunkResult result = worker.uploadChunk(target, whole_file, source, false);

  if (!result.ok()) {
    if (result.cancelled) {
      throw uploader::OperationCancelled(
        "upload of " + source.path + " cancelled: " + cancel.reason()
      );
    }
    throw uploader::ChunkUploadFailed(0, result.error_message);
  }

  UploadOutcome outcome;
  outcome.content_hash = result.partial_hash;
  outcome.total_bytes = source.size;
  outcome.chunk_count = 1;
  outcome.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
    std::chrono::steady_clock::now() - start_time
  );
  return outcome;
}

}  // namespace session
}  // namespace skylift
