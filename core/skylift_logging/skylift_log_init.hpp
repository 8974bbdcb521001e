// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef SKYLIFT_LOG_INIT_HPP
#define SKYLIFT_LOG_INIT_HPP

#include <optional>
#include <string>
#include <vector>

#include "skylift_console_sink.hpp"
#include "skylift_file_sink.hpp"
#include "skylift_log_severity.hpp"

namespace skylift {
namespace logging {

/**
 * Sinks installed for one skylift_upload run.
 */
struct LoggingConfig {
  bool console_enabled = true;
  bool console_colors = true;
  severity_level console_level = severity_level::info;

  bool file_enabled = false;
  FileSinkConfig file_config;
  severity_level file_level = severity_level::debug;
};

/**
 * Parse "debug", "info", "warn"/"warning", "error" or "fatal", ignoring case.
 */
std::optional<severity_level> parse_severity_level(const std::string& level_str);

/**
 * Apply SKYLIFT_LOG_* environment variables on top of the settings file.
 *
 *   SKYLIFT_LOG_LEVEL            both sinks
 *   SKYLIFT_LOG_CONSOLE_LEVEL    console sink, wins over SKYLIFT_LOG_LEVEL
 *   SKYLIFT_LOG_FILE_LEVEL       file sink, wins over SKYLIFT_LOG_LEVEL
 *   SKYLIFT_LOG_CONSOLE_ENABLED  true/false, yes/no, on/off, 1/0
 *   SKYLIFT_LOG_FILE_ENABLED     same values
 *   SKYLIFT_LOG_FILE_DIR         log file directory
 *   SKYLIFT_LOG_FORMAT           "json" or "text"
 *
 * Values that don't parse are skipped.
 *
 * @return Names of the variables that changed the config, in the order above
 */
std::vector<std::string> apply_env_overrides(LoggingConfig& config);

/**
 * Install the configured sinks.
 *
 * @return false if logging was already initialized; the config is ignored then
 */
bool init_logging(const LoggingConfig& config);

/**
 * Stop the async sinks, drain their queues and remove them from the core.
 */
void shutdown_logging();

/**
 * Drain queued records so they appear before direct console output.
 */
void flush_logging();

/**
 * Logging for the lifetime of one command. Shuts down on destruction only
 * if this scope installed the sinks.
 */
class ScopedLogging {
public:
  explicit ScopedLogging(const LoggingConfig& config);
  ~ScopedLogging();

  ScopedLogging(const ScopedLogging&) = delete;
  ScopedLogging& operator=(const ScopedLogging&) = delete;

  bool owns_sinks() const {
    return owns_sinks_;
  }

private:
  bool owns_sinks_;
};

}  // namespace logging
}  // namespace skylift

#endif  // SKYLIFT_LOG_INIT_HPP
