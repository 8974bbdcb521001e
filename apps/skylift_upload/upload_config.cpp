// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "upload_config.hpp"

#include <fstream>

#include <retry_policy.hpp>
#include <skylift_log_init.hpp>

namespace skylift {
namespace cli {

bool ConfigParser::load_from_file(const std::string& path, UploadAppConfig& config) {
  std::ifstream file(path);
  if (!file.good()) {
    last_error_ = "Config file not found or not readable: " + path;
    return false;
  }

  try {
    YAML::Node yaml = YAML::LoadFile(path);
    return load_from_string(YAML::Dump(yaml), config);
  } catch (const YAML::Exception& e) {
    last_error_ = "Failed to parse YAML file: " + std::string(e.what());
    return false;
  }
}

bool ConfigParser::load_from_string(const std::string& yaml_content, UploadAppConfig& config) {
  try {
    YAML::Node node = YAML::Load(yaml_content);
    if (!node || node.IsNull()) {
      return true;
    }
    if (!node.IsMap()) {
      last_error_ = "Settings must be a YAML mapping";
      return false;
    }

    if (node["platform"]) {
      parse_platform(node["platform"], config.platform);
    }
    if (node["upload"]) {
      parse_upload(node["upload"], config.upload);
    }
    if (node["agent"]) {
      parse_agent(node["agent"], config.agent);
    }
    if (node["logging"]) {
      parse_logging(node["logging"], config.logging);
    }

    return true;
  } catch (const YAML::Exception& e) {
    last_error_ = "Failed to parse YAML content: " + std::string(e.what());
    return false;
  }
}

bool ConfigParser::validate(const UploadAppConfig& config, std::string& error_msg) {
  if (config.upload.chunk_size_mb <= 0) {
    error_msg = "upload.chunk_size_mb must be positive";
    return false;
  }
  if (config.upload.parallelism < 1) {
    error_msg = "upload.parallelism must be at least 1";
    return false;
  }
  if (config.upload.retry_attempts < 1) {
    error_msg = "upload.retry.attempts must be at least 1";
    return false;
  }
  if (config.upload.retry_delay_ms < 0) {
    error_msg = "upload.retry.delay_ms must not be negative";
    return false;
  }
  uploader::BackoffStrategy backoff;
  if (!uploader::parse_backoff_strategy(config.upload.retry_backoff, backoff)) {
    error_msg = "upload.retry.backoff must be 'linear' or 'fixed', got '" +
                config.upload.retry_backoff + "'";
    return false;
  }
  if (config.platform.request_timeout_ms <= 0) {
    error_msg = "platform.request_timeout_ms must be positive";
    return false;
  }
  if (!logging::parse_severity_level(config.logging.level)) {
    error_msg = "Invalid logging.level: " + config.logging.level;
    return false;
  }
  if (config.logging.format != "text" && config.logging.format != "json") {
    error_msg = "logging.format must be 'text' or 'json'";
    return false;
  }
  return true;
}

void ConfigParser::parse_platform(const YAML::Node& node, PlatformSettings& platform) {
  if (node["gateway_url"]) {
    platform.gateway_url = node["gateway_url"].as<std::string>();
  }
  if (node["token"]) {
    platform.token = node["token"].as<std::string>();
  }
  if (node["verify_ssl"]) {
    platform.verify_ssl = node["verify_ssl"].as<bool>();
  }
  if (node["request_timeout_ms"]) {
    platform.request_timeout_ms = node["request_timeout_ms"].as<int>();
  }
}

void ConfigParser::parse_upload(const YAML::Node& node, TransferSettings& upload) {
  if (node["chunked"]) {
    upload.chunked = node["chunked"].as<bool>();
  }
  if (node["chunk_size_mb"]) {
    upload.chunk_size_mb = node["chunk_size_mb"].as<int>();
  }
  if (node["parallelism"]) {
    upload.parallelism = node["parallelism"].as<int>();
  }

  if (node["retry"]) {
    const auto& retry = node["retry"];
    if (retry["attempts"]) {
      upload.retry_attempts = retry["attempts"].as<int>();
    }
    if (retry["delay_ms"]) {
      upload.retry_delay_ms = retry["delay_ms"].as<int>();
    }
    if (retry["backoff"]) {
      upload.retry_backoff = retry["backoff"].as<std::string>();
    }
  }
}

void ConfigParser::parse_agent(const YAML::Node& node, AgentSettings& agent) {
  if (node["config_file"]) {
    agent.config_file = node["config_file"].as<std::string>();
  }
  if (node["state_dir"]) {
    agent.state_dir = node["state_dir"].as<std::string>();
  }
  if (node["certificate"]) {
    agent.certificate = node["certificate"].as<std::string>();
  }
}

void ConfigParser::parse_logging(const YAML::Node& node, LoggingSettings& logging) {
  if (node["level"]) {
    logging.level = node["level"].as<std::string>();
  }
  if (node["file_enabled"]) {
    logging.file_enabled = node["file_enabled"].as<bool>();
  }
  if (node["file_dir"]) {
    logging.file_dir = node["file_dir"].as<std::string>();
  }
  if (node["format"]) {
    logging.format = node["format"].as<std::string>();
  }
}

void convert_logging_config(
  const LoggingSettings& settings, ::skylift::logging::LoggingConfig& log_config
) {
  if (auto level = ::skylift::logging::parse_severity_level(settings.level)) {
    log_config.console_level = *level;
    log_config.file_level = *level;
  }

  log_config.file_enabled = settings.file_enabled;
  log_config.file_config.directory = settings.file_dir;
  log_config.file_config.format_json = (settings.format == "json");
}

}  // namespace cli
}  // namespace skylift
