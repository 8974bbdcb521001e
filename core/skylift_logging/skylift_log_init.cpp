// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "skylift_log_init.hpp"

#include <boost/log/core.hpp>
#include <boost/log/utility/setup/common_attributes.hpp>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <mutex>
#include <utility>

#include "skylift_log_macros.hpp"

namespace skylift {
namespace logging {

namespace {

struct InstalledSinks {
  std::mutex mutex;
  boost::shared_ptr<async_console_sink_t> console;
  boost::shared_ptr<async_file_sink_t> file;
  bool active = false;
};

InstalledSinks& installed() {
  static InstalledSinks sinks;
  return sinks;
}

struct LevelVariable {
  const char* name;
  bool console;
  bool file;
};

// Global first so the sink-specific variables override it
const LevelVariable kLevelVariables[] = {
  {"SKYLIFT_LOG_LEVEL", true, true},
  {"SKYLIFT_LOG_CONSOLE_LEVEL", true, false},
  {"SKYLIFT_LOG_FILE_LEVEL", false, true},
};

struct SwitchVariable {
  const char* name;
  bool LoggingConfig::*field;
};

const SwitchVariable kSwitchVariables[] = {
  {"SKYLIFT_LOG_CONSOLE_ENABLED", &LoggingConfig::console_enabled},
  {"SKYLIFT_LOG_FILE_ENABLED", &LoggingConfig::file_enabled},
};

std::string lowercase(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return s;
}

const char* env_value(const char* name) {
  const char* value = std::getenv(name);
  return (value != nullptr && *value != '\0') ? value : nullptr;
}

std::optional<bool> parse_switch(const std::string& value) {
  std::string lower = lowercase(value);
  if (lower == "true" || lower == "yes" || lower == "on" || lower == "1") {
    return true;
  }
  if (lower == "false" || lower == "no" || lower == "off" || lower == "0") {
    return false;
  }
  return std::nullopt;
}

template<typename Sink>
void stop_sink(boost::shared_ptr<Sink>& sink) {
  if (!sink) {
    return;
  }
  sink->stop();
  sink->flush();
  boost::log::core::get()->remove_sink(sink);
  sink.reset();
}

}  // namespace

std::optional<severity_level> parse_severity_level(const std::string& level_str) {
  static const std::pair<const char*, severity_level> kNames[] = {
    {"debug", severity_level::debug},
    {"info", severity_level::info},
    {"warn", severity_level::warn},
    {"warning", severity_level::warn},
    {"error", severity_level::error},
    {"fatal", severity_level::fatal},
  };

  std::string lower = lowercase(level_str);
  for (const auto& entry : kNames) {
    if (lower == entry.first) {
      return entry.second;
    }
  }
  return std::nullopt;
}

std::vector<std::string> apply_env_overrides(LoggingConfig& config) {
  std::vector<std::string> applied;

  for (const auto& variable : kLevelVariables) {
    const char* value = env_value(variable.name);
    if (value == nullptr) {
      continue;
    }
    auto level = parse_severity_level(value);
    if (!level) {
      continue;
    }
    if (variable.console) {
      config.console_level = *level;
    }
    if (variable.file) {
      config.file_level = *level;
    }
    applied.emplace_back(variable.name);
  }

  for (const auto& variable : kSwitchVariables) {
    const char* value = env_value(variable.name);
    if (value == nullptr) {
      continue;
    }
    if (auto enabled = parse_switch(value)) {
      config.*variable.field = *enabled;
      applied.emplace_back(variable.name);
    }
  }

  if (const char* dir = env_value("SKYLIFT_LOG_FILE_DIR")) {
    config.file_config.directory = dir;
    applied.emplace_back("SKYLIFT_LOG_FILE_DIR");
  }

  if (const char* format = env_value("SKYLIFT_LOG_FORMAT")) {
    std::string lower = lowercase(format);
    if (lower == "json" || lower == "text") {
      config.file_config.format_json = (lower == "json");
      applied.emplace_back("SKYLIFT_LOG_FORMAT");
    }
  }

  return applied;
}

logger_type& get_logger() {
  static logger_type instance;
  return instance;
}

bool init_logging(const LoggingConfig& config) {
  InstalledSinks& sinks = installed();
  std::lock_guard<std::mutex> lock(sinks.mutex);
  if (sinks.active) {
    return false;
  }

  auto core = boost::log::core::get();
  boost::log::add_common_attributes();

  if (config.console_enabled) {
    sinks.console = create_console_sink(config.console_level, config.console_colors);
    core->add_sink(sinks.console);
  }
  if (config.file_enabled) {
    sinks.file = create_file_sink(config.file_config, config.file_level);
    core->add_sink(sinks.file);
  }

  sinks.active = true;
  return true;
}

void shutdown_logging() {
  InstalledSinks& sinks = installed();
  std::lock_guard<std::mutex> lock(sinks.mutex);
  stop_sink(sinks.console);
  stop_sink(sinks.file);
  sinks.active = false;
}

void flush_logging() {
  InstalledSinks& sinks = installed();
  std::lock_guard<std::mutex> lock(sinks.mutex);
  if (sinks.console) {
    sinks.console->flush();
  }
  if (sinks.file) {
    sinks.file->flush();
  }
}

ScopedLogging::ScopedLogging(const LoggingConfig& config)
    : owns_sinks_(init_logging(config)) {}

ScopedLogging::~ScopedLogging() {
  if (owns_sinks_) {
    shutdown_logging();
  }
}

}  // namespace logging
}  // namespace skylift
