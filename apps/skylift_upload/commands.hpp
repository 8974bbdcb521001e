// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef SKYLIFT_UPLOAD_COMMANDS_HPP
#define SKYLIFT_UPLOAD_COMMANDS_HPP

#include <optional>
#include <string>

#include <upload_errors.hpp>
#include <upload_session.hpp>

#include "upload_config.hpp"

namespace skylift {
namespace cli {

/**
 * Agent configuration used when neither --config, the settings file nor a
 * token selects a mode.
 */
constexpr const char* DEFAULT_AGENT_CONFIG = "agentconfig.json";

/**
 * Options given on the command line. Unset values fall back to the
 * settings file.
 */
struct CommandLineOptions {
  std::string file;
  std::string agent_config;
  std::string certificate;
  std::string file_path;
  std::string asset_id;
  std::string mime_type;
  std::string description;
  std::string token;
  std::string settings_file;
  std::optional<int> parallelism;
  std::optional<int> retry_attempts;
  bool chunked = false;
  bool verbose = false;
  bool help = false;
};

/**
 * Parse argv into options.
 *
 * @return false with error set for unknown flags, missing or non-numeric values
 */
bool parse_command_line(
  int argc, const char* const argv[], CommandLineOptions& options, std::string& error
);

/**
 * Overlay command line options on the settings file. The token is taken
 * from --token, then SKYLIFT_TOKEN, then the settings file.
 */
void apply_command_line(const CommandLineOptions& options, UploadAppConfig& config);

session::UploadOptions make_upload_options(const UploadAppConfig& config, bool verbose);

/**
 * One-line description of a failure naming its stage,
 * e.g. "chunk 3: HTTP 503" or "onboarding: ...".
 */
std::string describe_failure(const uploader::UploadError& error);

/**
 * Command handler for skylift_upload CLI
 */
class Commands {
public:
  Commands();
  ~Commands() = default;

  // Non-copyable
  Commands(const Commands&) = delete;
  Commands& operator=(const Commands&) = delete;

  /**
   * Parse and execute command line
   */
  int execute(int argc, char* argv[]);

private:
  int upload(const CommandLineOptions& options, const UploadAppConfig& config);

  void print_usage();

  bool verbose_;
};

}  // namespace cli
}  // namespace skylift

#endif  // SKYLIFT_UPLOAD_COMMANDS_HPP
