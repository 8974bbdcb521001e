// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef SKYLIFT_CHUNK_UPLOAD_WORKER_HPP
#define SKYLIFT_CHUNK_UPLOAD_WORKER_HPP

#include <string>

#include "cancellation_token.hpp"
#include "progress_sink.hpp"
#include "retry_policy.hpp"
#include "upload_types.hpp"
#include "uploader_interfaces.hpp"

namespace skylift {
namespace uploader {

/**
 * Retry label for a chunk, or "upload" for a whole-file transfer.
 */
std::string chunk_label(const Chunk& chunk, bool multipart);

/**
 * Read exactly chunk.length bytes at chunk.offset through a handle of its own.
 *
 * @throws SourceReadError if the file can't be opened or is too short
 */
std::string readChunkImpl(
  const SourceFile& source, const Chunk& chunk, IFileStreamFactory& streams
);

/**
 * Transfers one chunk under the retry policy.
 *
 * Stateless between calls; one instance is shared by all workers of a
 * session. Never throws for transfer failures: every started chunk produces
 * exactly one ChunkResult.
 */
class ChunkUploadWorker {
public:
  ChunkUploadWorker(
    ITransportClient& transport, IFileStreamFactory& streams, const RetryPolicy& policy,
    const CancellationToken& cancel, IProgressSink& progress
  );

  /**
   * Read the chunk's byte range, send it, retry on failure.
   *
   * @param multipart false when the chunk is the whole file (single-shot)
   * @return Success with the partial hash, or Failed with the last error.
   *         cancelled is set when the session was cancelled meanwhile.
   */
  ChunkResult uploadChunk(
    const UploadTarget& target, const Chunk& chunk, const SourceFile& source, bool multipart
  );

private:
  ITransportClient& transport_;
  IFileStreamFactory& streams_;
  const RetryPolicy& policy_;
  const CancellationToken& cancel_;
  IProgressSink& progress_;
};

}  // namespace uploader
}  // namespace skylift

#endif  // SKYLIFT_CHUNK_UPLOAD_WORKER_HPP
