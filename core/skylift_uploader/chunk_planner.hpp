// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef SKYLIFT_CHUNK_PLANNER_HPP
#define SKYLIFT_CHUNK_PLANNER_HPP

#include <cstdint>

#include "upload_types.hpp"

namespace skylift {
namespace uploader {

/**
 * Split a file into chunks.
 *
 * - Indices run 0..n-1, offsets are contiguous, lengths sum to file_size.
 * - Every chunk is chunk_size bytes except the last, which holds the
 *   remainder (or a full chunk_size when the size divides evenly).
 * - An empty file yields exactly one zero-length chunk.
 * - Deterministic for identical inputs.
 *
 * @throws ConfigError if chunk_size is 0
 */
ChunkPlan plan_chunks(uint64_t file_size, uint64_t chunk_size);

/**
 * Check the plan invariants above against a file size.
 */
bool is_valid_plan(const ChunkPlan& plan, uint64_t file_size);

}  // namespace uploader
}  // namespace skylift

#endif  // SKYLIFT_CHUNK_PLANNER_HPP
