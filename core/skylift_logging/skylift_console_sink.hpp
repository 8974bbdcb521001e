// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef SKYLIFT_CONSOLE_SINK_HPP
#define SKYLIFT_CONSOLE_SINK_HPP

#include <boost/log/core/record_view.hpp>
#include <boost/log/sinks/async_frontend.hpp>
#include <boost/log/sinks/bounded_fifo_queue.hpp>
#include <boost/log/sinks/drop_on_overflow.hpp>
#include <boost/log/sinks/text_ostream_backend.hpp>
#include <boost/log/utility/formatting_ostream.hpp>
#include <boost/smart_ptr/shared_ptr.hpp>

#include "skylift_log_severity.hpp"

namespace skylift {
namespace logging {

/**
 * Async console sink with bounded queue.
 * Drops records on overflow so upload workers never wait on the terminal.
 */
typedef boost::log::sinks::asynchronous_sink<
  boost::log::sinks::text_ostream_backend,
  boost::log::sinks::bounded_fifo_queue<1000, boost::log::sinks::drop_on_overflow>>
  async_console_sink_t;

/**
 * Create async console sink writing to std::clog.
 *
 * @param min_level Minimum severity level to log
 * @param use_colors Whether to use ANSI color codes for the severity tag
 */
boost::shared_ptr<async_console_sink_t> create_console_sink(
  severity_level min_level = severity_level::info, bool use_colors = true
);

/**
 * One-line text rendering shared by the console and text file sinks:
 * [time] [LEVEL] message | client_id=... asset_id=...
 */
void format_text_record(
  boost::log::record_view const& rec, boost::log::formatting_ostream& strm, bool use_colors
);

/**
 * ANSI color escape for a severity level (empty for unknown levels).
 */
const char* severity_color(severity_level level);

}  // namespace logging
}  // namespace skylift

#endif  // SKYLIFT_CONSOLE_SINK_HPP
