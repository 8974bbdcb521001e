// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef SKYLIFT_UPLOAD_TYPES_HPP
#define SKYLIFT_UPLOAD_TYPES_HPP

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace skylift {
namespace uploader {

/**
 * Destination of an upload on the platform file service.
 */
struct UploadTarget {
  std::string asset_id;     // Entity receiving the file (agent's client id when uploading to self)
  std::string file_path;    // Logical path on the platform
  std::string mime_type;
  std::string description;
};

/**
 * Local file being uploaded. Read handles are opened per read, never shared.
 */
struct SourceFile {
  std::string path;
  uint64_t size = 0;
};

/**
 * Contiguous byte range of the source uploaded as one unit.
 */
struct Chunk {
  size_t index = 0;
  uint64_t offset = 0;
  uint64_t length = 0;

  bool operator==(const Chunk& other) const {
    return index == other.index && offset == other.offset && length == other.length;
  }
};

/**
 * Ordered, contiguous, non-overlapping chunks covering the whole file.
 */
using ChunkPlan = std::vector<Chunk>;

enum class ChunkStatus { Success, Failed };

/**
 * Outcome of one chunk, produced exactly once per chunk that was started.
 */
struct ChunkResult {
  size_t index = 0;
  ChunkStatus status = ChunkStatus::Failed;
  int attempts = 0;
  std::string partial_hash;   // MD5 (hex) of the chunk bytes
  uint64_t bytes = 0;
  bool cancelled = false;     // failed because the session was cancelled, not on its own
  std::string error_message;

  bool ok() const {
    return status == ChunkStatus::Success;
  }
};

/**
 * Returned to the caller of a successful upload.
 */
struct UploadOutcome {
  std::string content_hash;   // MD5 (hex) of the complete source
  uint64_t total_bytes = 0;
  std::chrono::milliseconds elapsed{0};
  size_t chunk_count = 0;
};

}  // namespace uploader
}  // namespace skylift

#endif  // SKYLIFT_UPLOAD_TYPES_HPP
