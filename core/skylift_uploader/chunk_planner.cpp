// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "chunk_planner.hpp"

#include <algorithm>

#include "upload_errors.hpp"

namespace skylift {
namespace uploader {

ChunkPlan plan_chunks(uint64_t file_size, uint64_t chunk_size) {
  if (chunk_size == 0) {
    throw ConfigError("chunk size must be greater than 0");
  }

  ChunkPlan plan;
  if (file_size == 0) {
    plan.push_back(Chunk{0, 0, 0});
    return plan;
  }

  uint64_t count = file_size / chunk_size + (file_size % chunk_size == 0 ? 0 : 1);
  plan.reserve(static_cast<size_t>(count));

  uint64_t offset = 0;
  for (size_t index = 0; offset < file_size; ++index) {
    uint64_t length = std::min(chunk_size, file_size - offset);
    plan.push_back(Chunk{index, offset, length});
    offset += length;
  }

  return plan;
}

bool is_valid_plan(const ChunkPlan& plan, uint64_t file_size) {
  if (plan.empty()) {
    return false;
  }

  uint64_t expected_offset = 0;
  for (size_t i = 0; i < plan.size(); ++i) {
    const Chunk& chunk = plan[i];
    if (chunk.index != i || chunk.offset != expected_offset) {
      return false;
    }
    // Only the single chunk of an empty file may be empty
    if (chunk.length == 0 && file_size != 0) {
      return false;
    }
    expected_offset += chunk.length;
  }

  return expected_offset == file_size;
}

}  // namespace uploader
}  // namespace skylift
