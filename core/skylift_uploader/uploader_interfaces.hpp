// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef SKYLIFT_UPLOADER_INTERFACES_HPP
#define SKYLIFT_UPLOADER_INTERFACES_HPP

#include <cstdint>
#include <ios>
#include <memory>
#include <optional>
#include <string>

#include "upload_types.hpp"

namespace skylift {
namespace uploader {

/**
 * Interface for filesystem queries
 * Allows mocking the pre-flight checks in tests
 */
class IFileSystem {
public:
  virtual ~IFileSystem() = default;

  virtual bool exists(const std::string& path) const = 0;

  virtual bool is_regular_file(const std::string& path) const = 0;

  virtual uint64_t file_size(const std::string& path) const = 0;
};

/**
 * Interface for file stream operations
 * Allows mocking reads of the source file
 */
class IFileStream {
public:
  virtual ~IFileStream() = default;

  virtual IFileStream& read(char* buffer, std::streamsize size) = 0;

  virtual IFileStream& seekg(std::streamoff offset, std::ios_base::seekdir origin) = 0;

  /**
   * Number of characters extracted by the last read()
   */
  virtual std::streamsize gcount() const = 0;

  virtual bool good() const = 0;

  virtual bool fail() const = 0;

  virtual bool bad() const = 0;
};

/**
 * Factory for read handles on the source file
 *
 * Every call returns an independent handle, so concurrent workers can read
 * disjoint ranges without sharing stream state.
 */
class IFileStreamFactory {
public:
  virtual ~IFileStreamFactory() = default;

  /**
   * @return Stream positioned at the start, or nullptr if the file can't be opened
   */
  virtual std::unique_ptr<IFileStream> create_file_stream(
    const std::string& path, std::ios_base::openmode mode
  ) = 0;
};

/**
 * Metadata sent along with a payload
 */
struct PartMetadata {
  std::string mime_type;
  std::string description;
  std::optional<size_t> part_index;  // chunk index; absent for single-shot uploads
  std::string content_md5;           // MD5 (hex) of the payload
};

/**
 * Result of a transport call
 */
struct TransportResult {
  bool success;
  std::string server_hash;    // content hash reported by the platform, if any
  std::string etag;           // entity tag of the stored object, if any
  std::string error_message;
  std::string error_code;     // platform error code or HTTP status text
  int status_code;            // HTTP status, 0 when no response was received
  bool is_retryable;          // true for transient errors

  static TransportResult Success(const std::string& etag = "", const std::string& server_hash = "") {
    return {true, server_hash, etag, "", "", 200, false};
  }

  static TransportResult Failure(
    const std::string& message, bool retryable, int status_code = 0, const std::string& code = ""
  ) {
    return {false, "", "", message, code, status_code, retryable};
  }
};

/**
 * Client of the platform file service
 *
 * Implementations must be safe to call concurrently from independent workers.
 * Failures are reported in the result, never thrown.
 */
class ITransportClient {
public:
  virtual ~ITransportClient() = default;

  /**
   * Announce a chunked upload of target.
   */
  virtual TransportResult begin_multipart(const UploadTarget& target) = 0;

  /**
   * Transmit a chunk (metadata.part_index set) or a whole file (unset) and
   * wait for the acknowledgement.
   */
  virtual TransportResult send(
    const UploadTarget& target, const std::string& payload, const PartMetadata& metadata
  ) = 0;

  /**
   * Ask the platform to assemble part_count acknowledged chunks.
   */
  virtual TransportResult complete_multipart(const UploadTarget& target, size_t part_count) = 0;
};

}  // namespace uploader
}  // namespace skylift

#endif  // SKYLIFT_UPLOADER_INTERFACES_HPP
