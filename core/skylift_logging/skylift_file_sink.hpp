// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef SKYLIFT_FILE_SINK_HPP
#define SKYLIFT_FILE_SINK_HPP

#include <boost/log/sinks/async_frontend.hpp>
#include <boost/log/sinks/bounded_fifo_queue.hpp>
#include <boost/log/sinks/drop_on_overflow.hpp>
#include <boost/log/sinks/text_file_backend.hpp>
#include <boost/smart_ptr/shared_ptr.hpp>

#include <cstdint>
#include <string>

#include "skylift_log_severity.hpp"

namespace skylift {
namespace logging {

typedef boost::log::sinks::asynchronous_sink<
  boost::log::sinks::text_file_backend,
  boost::log::sinks::bounded_fifo_queue<5000, boost::log::sinks::drop_on_overflow>>
  async_file_sink_t;

/**
 * File sink configuration.
 */
struct FileSinkConfig {
  std::string directory = "/tmp/skylift";
  std::string file_pattern = "skylift_%Y%m%d_%H%M%S.log";
  uint64_t rotation_size_mb = 50;
  int max_files = 5;
  bool format_json = false;
};

/**
 * Create async file sink with size-based rotation.
 * Falls back to the system temp directory when the directory cannot be created.
 */
boost::shared_ptr<async_file_sink_t> create_file_sink(
  const FileSinkConfig& config, severity_level min_level = severity_level::debug
);

/**
 * Escape a string for embedding in a JSON log line (RFC 8259).
 */
std::string escape_json(const std::string& s);

}  // namespace logging
}  // namespace skylift

#endif  // SKYLIFT_FILE_SINK_HPP
