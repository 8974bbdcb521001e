// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef SKYLIFT_UPLOAD_ERRORS_HPP
#define SKYLIFT_UPLOAD_ERRORS_HPP

#include <cstddef>
#include <exception>
#include <stdexcept>
#include <string>
#include <utility>

namespace skylift {
namespace uploader {

/**
 * Stage of the upload pipeline that produced an error.
 */
enum class ErrorStage {
  Config,       // invalid options or configuration
  Source,       // local source file missing or unreadable
  Certificate,  // certificate material could not be installed
  Onboarding,   // trust relationship could not be established
  Chunk,        // a chunk (or the whole file) could not be transferred
  Transport,    // transport collaborator failure
  Integrity,    // content hash disagreement
  Cancelled,    // session cancelled or deadline exceeded
};

/**
 * Base class for every terminal error surfaced by skylift.
 *
 * retryable() tells RetryExecutor whether another attempt can succeed.
 */
class UploadError : public std::runtime_error {
public:
  UploadError(ErrorStage stage, const std::string& message, bool retryable = false)
      : std::runtime_error(message)
      , stage_(stage)
      , retryable_(retryable) {}

  ErrorStage stage() const {
    return stage_;
  }

  bool retryable() const {
    return retryable_;
  }

private:
  ErrorStage stage_;
  bool retryable_;
};

class ConfigError : public UploadError {
public:
  explicit ConfigError(const std::string& message)
      : UploadError(ErrorStage::Config, message) {}
};

class SourceNotFound : public UploadError {
public:
  explicit SourceNotFound(const std::string& path)
      : UploadError(ErrorStage::Source, "Can't find file " + path)
      , path_(path) {}

  const std::string& path() const {
    return path_;
  }

private:
  std::string path_;
};

class SourceReadError : public UploadError {
public:
  explicit SourceReadError(const std::string& message)
      : UploadError(ErrorStage::Source, message) {}
};

class CertificateSetupFailed : public UploadError {
public:
  explicit CertificateSetupFailed(const std::string& message)
      : UploadError(ErrorStage::Certificate, message) {}
};

/**
 * Onboarding failure. Thrown retryable by onboarding clients for transient
 * problems, non-retryable for rejected credentials and after retry exhaustion.
 */
class OnboardingFailed : public UploadError {
public:
  explicit OnboardingFailed(const std::string& message, bool retryable = false)
      : UploadError(ErrorStage::Onboarding, message, retryable) {}
};

class ChunkUploadFailed : public UploadError {
public:
  ChunkUploadFailed(size_t index, const std::string& message)
      : UploadError(
          ErrorStage::Chunk, "Chunk " + std::to_string(index) + " failed: " + message
        )
      , index_(index) {}

  size_t index() const {
    return index_;
  }

private:
  size_t index_;
};

/**
 * A transport collaborator reported failure. Carries the operation context
 * in the message and the HTTP status / platform error code when known.
 */
class TransportError : public UploadError {
public:
  TransportError(
    const std::string& message, bool retryable, int status_code = 0,
    const std::string& error_code = ""
  )
      : UploadError(ErrorStage::Transport, message, retryable)
      , status_code_(status_code)
      , error_code_(error_code) {}

  int status_code() const {
    return status_code_;
  }

  const std::string& error_code() const {
    return error_code_;
  }

private:
  int status_code_;
  std::string error_code_;
};

class IntegrityError : public UploadError {
public:
  explicit IntegrityError(const std::string& message)
      : UploadError(ErrorStage::Integrity, message) {}
};

class OperationCancelled : public UploadError {
public:
  explicit OperationCancelled(const std::string& message)
      : UploadError(ErrorStage::Cancelled, message) {}
};

/**
 * Every attempt failed. Keeps the last underlying error so callers can
 * rethrow or inspect it.
 */
class RetryExhausted : public UploadError {
public:
  RetryExhausted(
    const std::string& label, int attempts, const std::string& cause_message,
    std::exception_ptr cause
  )
      : UploadError(
          ErrorStage::Transport,
          label + ": giving up after " + std::to_string(attempts) +
            " attempts: " + cause_message
        )
      , label_(label)
      , attempts_(attempts)
      , cause_message_(cause_message)
      , cause_(std::move(cause)) {}

  const std::string& label() const {
    return label_;
  }

  int attempts() const {
    return attempts_;
  }

  const std::string& cause_message() const {
    return cause_message_;
  }

  std::exception_ptr cause() const {
    return cause_;
  }

private:
  std::string label_;
  int attempts_;
  std::string cause_message_;
  std::exception_ptr cause_;
};

inline const char* to_string(ErrorStage stage) {
  switch (stage) {
    case ErrorStage::Config:
      return "config";
    case ErrorStage::Source:
      return "source";
    case ErrorStage::Certificate:
      return "certificate";
    case ErrorStage::Onboarding:
      return "onboarding";
    case ErrorStage::Chunk:
      return "chunk";
    case ErrorStage::Transport:
      return "transport";
    case ErrorStage::Integrity:
      return "integrity";
    case ErrorStage::Cancelled:
      return "cancelled";
  }
  return "unknown";
}

}  // namespace uploader
}  // namespace skylift

#endif  // SKYLIFT_UPLOAD_ERRORS_HPP
