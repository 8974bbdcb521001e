// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "chunk_upload_worker.hpp"

#include <limits>

#include "content_hash.hpp"
#include "retry_executor.hpp"
#include "upload_errors.hpp"

#define SKYLIFT_LOG_COMPONENT "chunk_worker"
#include <skylift_log_macros.hpp>

namespace skylift {
namespace uploader {

std::string chunk_label(const Chunk& chunk, bool multipart) {
  if (!multipart) {
    return "upload";
  }
  return "chunk-" + std::to_string(chunk.index);
}

std::string readChunkImpl(
  const SourceFile& source, const Chunk& chunk, IFileStreamFactory& streams
) {
  if (chunk.length > static_cast<uint64_t>(std::numeric_limits<std::streamsize>::max())) {
    throw SourceReadError("Chunk " + std::to_string(chunk.index) + " is too large to read");
  }

  auto stream = streams.create_file_stream(source.path, std::ios::in | std::ios::binary);
  if (!stream) {
    throw SourceReadError("Can't open " + source.path + " for reading");
  }

  std::string buffer(static_cast<size_t>(chunk.length), '\0');
  if (chunk.length == 0) {
    return buffer;
  }

  stream->seekg(static_cast<std::streamoff>(chunk.offset), std::ios::beg);
  if (stream->fail()) {
    throw SourceReadError(
      "Can't seek to offset " + std::to_string(chunk.offset) + " in " + source.path
    );
  }

  stream->read(&buffer[0], static_cast<std::streamsize>(chunk.length));
  auto got = stream->gcount();
  if (got != static_cast<std::streamsize>(chunk.length)) {
    throw SourceReadError(
      "Short read of chunk " + std::to_string(chunk.index) + " from " + source.path + ": got " +
      std::to_string(got) + " of " + std::to_string(chunk.length) + " bytes"
    );
  }

  return buffer;
}

ChunkUploadWorker::ChunkUploadWorker(
  ITransportClient& transport, IFileStreamFactory& streams, const RetryPolicy& policy,
  const CancellationToken& cancel, IProgressSink& progress
)
    : transport_(transport)
    , streams_(streams)
    , policy_(policy)
    , cancel_(cancel)
    , progress_(progress) {}

ChunkResult ChunkUploadWorker::uploadChunk(
  const UploadTarget& target, const Chunk& chunk, const SourceFile& source, bool multipart
) {
  const std::string label = chunk_label(chunk, multipart);

  ChunkResult result;
  result.index = chunk.index;
  result.bytes = chunk.length;

  try {
    // Bytes are read once; retries resend the same payload
    std::string payload = readChunkImpl(source, chunk, streams_);
    result.partial_hash = md5_hex(payload);

    PartMetadata metadata;
    metadata.mime_type = target.mime_type;
    metadata.description = target.description;
    if (multipart) {
      metadata.part_index = chunk.index;
    }
    metadata.content_md5 = result.partial_hash;

    RetryExecutor executor(policy_, cancel_);
    executor.run(label, [&]() {
      ++result.attempts;
      SKYLIFT_LOG_DEBUG(
        "Sending " << label << " attempt " << result.attempts
                   << logging::kv("bytes", chunk.length)
      );

      TransportResult sent = transport_.send(target, payload, metadata);
      if (!sent.success) {
        throw TransportError(
          label + ": " + sent.error_message, sent.is_retryable, sent.status_code,
          sent.error_code
        );
      }
      if (!sent.server_hash.empty() && sent.server_hash != result.partial_hash) {
        throw IntegrityError(
          label + ": platform reported hash " + sent.server_hash + ", expected " +
          result.partial_hash
        );
      }
      return sent;
    });

    result.status = ChunkStatus::Success;
    progress_.report(
      label, "uploaded " + std::to_string(chunk.length) + " bytes in " +
               std::to_string(result.attempts) + " attempt(s)"
    );
    return result;
  } catch (const OperationCancelled& e) {
    result.cancelled = true;
    result.error_message = e.what();
    SKYLIFT_LOG_DEBUG(label << " abandoned: " << e.what());
  } catch (const UploadError& e) {
    result.error_message = e.what();
    SKYLIFT_LOG_WARN(label << " failed after " << result.attempts << " attempt(s): " << e.what());
  } catch (const std::exception& e) {
    result.error_message = e.what();
    SKYLIFT_LOG_ERROR(label << " failed unexpectedly: " << e.what());
  }

  result.status = ChunkStatus::Failed;
  return result;
}

}  // namespace uploader
}  // namespace skylift
