// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef SKYLIFT_UPLOAD_CONFIG_HPP
#define SKYLIFT_UPLOAD_CONFIG_HPP

#include <yaml-cpp/yaml.h>

#include <cstdint>
#include <string>

namespace skylift {
namespace logging {
struct LoggingConfig;
}
}  // namespace skylift

namespace skylift {
namespace cli {

struct PlatformSettings {
  std::string gateway_url;
  std::string token;  // service credential token, never logged
  bool verify_ssl = true;
  int request_timeout_ms = 300000;
};

struct TransferSettings {
  bool chunked = false;
  int chunk_size_mb = 8;
  int parallelism = 3;
  int retry_attempts = 3;
  int retry_delay_ms = 300;
  std::string retry_backoff = "linear";
};

struct AgentSettings {
  std::string config_file;  // onboarding JSON; empty = service credential mode
  std::string state_dir;    // empty = ~/.skylift
  std::string certificate;  // PEM private key for RSA_3072 agents
};

struct LoggingSettings {
  std::string level = "info";
  bool file_enabled = false;
  std::string file_dir = "/tmp/skylift";
  std::string format = "text";
};

/**
 * Settings file for skylift_upload
 *
 *   platform: { gateway_url, token, verify_ssl, request_timeout_ms }
 *   upload:   { chunked, chunk_size_mb, parallelism,
 *               retry: { attempts, delay_ms, backoff } }
 *   agent:    { config_file, state_dir, certificate }
 *   logging:  { level, file_enabled, file_dir, format }
 */
struct UploadAppConfig {
  PlatformSettings platform;
  TransferSettings upload;
  AgentSettings agent;
  LoggingSettings logging;
};

/**
 * Convert LoggingSettings to skylift::logging::LoggingConfig.
 * Unknown levels keep the logging defaults.
 */
void convert_logging_config(
  const LoggingSettings& settings, ::skylift::logging::LoggingConfig& log_config
);

class ConfigParser {
public:
  ConfigParser() = default;

  /**
   * Load configuration from YAML file
   */
  bool load_from_file(const std::string& path, UploadAppConfig& config);

  /**
   * Load configuration from YAML string. Missing keys keep their current value.
   */
  bool load_from_string(const std::string& yaml_content, UploadAppConfig& config);

  static bool validate(const UploadAppConfig& config, std::string& error_msg);

  const std::string& get_last_error() const {
    return last_error_;
  }

private:
  void parse_platform(const YAML::Node& node, PlatformSettings& platform);
  void parse_upload(const YAML::Node& node, TransferSettings& upload);
  void parse_agent(const YAML::Node& node, AgentSettings& agent);
  void parse_logging(const YAML::Node& node, LoggingSettings& logging);

  std::string last_error_;
};

}  // namespace cli
}  // namespace skylift

#endif  // SKYLIFT_UPLOAD_CONFIG_HPP
