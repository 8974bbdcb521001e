// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "commands.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <memory>
#include <thread>
#include <vector>

#define SKYLIFT_LOG_COMPONENT "skylift_upload"
#include <agent.hpp>
#include <agent_store.hpp>
#include <http_file_client.hpp>
#include <http_onboarding_client.hpp>
#include <onboarding_manager.hpp>
#include <progress_sink.hpp>
#include <skylift_log_init.hpp>
#include <skylift_log_macros.hpp>

namespace skylift {
namespace cli {

namespace {

std::atomic<bool> g_interrupted{false};

void signal_handler(int) {
  // Async-signal-safe: only flip the flag, the watcher thread cancels.
  g_interrupted.store(true);
}

bool is_flag(const std::string& arg, const char* long_name, const char* short_name) {
  return arg == long_name || arg == short_name;
}

bool parse_int(const std::string& text, int& value) {
  try {
    size_t consumed = 0;
    value = std::stoi(text, &consumed);
    return consumed == text.size();
  } catch (const std::exception&) {
    return false;
  }
}

/**
 * Cancels the session when SIGINT/SIGTERM arrives.
 */
class InterruptWatcher {
public:
  explicit InterruptWatcher(session::UploadSession& session)
      : session_(session)
      , thread_([this] {
        run();
      }) {}

  ~InterruptWatcher() {
    done_.store(true);
    thread_.join();
  }

private:
  void run() {
    while (!done_.load()) {
      if (g_interrupted.load()) {
        session_.cancel("interrupted");
        return;
      }
      std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }
  }

  session::UploadSession& session_;
  std::atomic<bool> done_{false};
  std::thread thread_;
};

}  // namespace

bool parse_command_line(
  int argc, const char* const argv[], CommandLineOptions& options, std::string& error
) {
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];

    if (arg == "--help") {
      options.help = true;
      continue;
    }
    if (is_flag(arg, "--chunked", "-k")) {
      options.chunked = true;
      continue;
    }
    if (is_flag(arg, "--verbose", "-v")) {
      options.verbose = true;
      continue;
    }

    std::string* text_value = nullptr;
    std::optional<int>* int_value = nullptr;
    if (is_flag(arg, "--file", "-f")) {
      text_value = &options.file;
    } else if (is_flag(arg, "--config", "-c")) {
      text_value = &options.agent_config;
    } else if (is_flag(arg, "--cert", "-r")) {
      text_value = &options.certificate;
    } else if (is_flag(arg, "--filepath", "-h")) {
      text_value = &options.file_path;
    } else if (is_flag(arg, "--assetid", "-i")) {
      text_value = &options.asset_id;
    } else if (is_flag(arg, "--mime", "-m")) {
      text_value = &options.mime_type;
    } else if (is_flag(arg, "--desc", "-d")) {
      text_value = &options.description;
    } else if (is_flag(arg, "--token", "-t")) {
      text_value = &options.token;
    } else if (is_flag(arg, "--settings", "-s")) {
      text_value = &options.settings_file;
    } else if (is_flag(arg, "--parallel", "-l")) {
      int_value = &options.parallelism;
    } else if (is_flag(arg, "--retry", "-y")) {
      int_value = &options.retry_attempts;
    } else {
      error = "Unknown option '" + arg + "'";
      return false;
    }

    if (i + 1 >= argc) {
      error = "Missing value for " + arg;
      return false;
    }
    std::string value = argv[++i];

    if (text_value != nullptr) {
      *text_value = value;
      continue;
    }
    int number = 0;
    if (!parse_int(value, number)) {
      error = "Expected a number for " + arg + ", got '" + value + "'";
      return false;
    }
    *int_value = number;
  }
  return true;
}

void apply_command_line(const CommandLineOptions& options, UploadAppConfig& config) {
  if (!options.agent_config.empty()) {
    config.agent.config_file = options.agent_config;
  }
  if (!options.certificate.empty()) {
    config.agent.certificate = options.certificate;
  }
  if (options.chunked) {
    config.upload.chunked = true;
  }
  if (options.parallelism) {
    config.upload.parallelism = *options.parallelism;
  }
  if (options.retry_attempts) {
    config.upload.retry_attempts = *options.retry_attempts;
  }
  if (options.verbose) {
    config.logging.level = "debug";
  }

  if (!options.token.empty()) {
    config.platform.token = options.token;
  } else if (const char* env_token = std::getenv("SKYLIFT_TOKEN")) {
    if (*env_token != '\0') {
      config.platform.token = env_token;
    }
  }

  // Without a token the upload goes through an agent
  if (config.agent.config_file.empty() && config.platform.token.empty()) {
    config.agent.config_file = DEFAULT_AGENT_CONFIG;
  }
}

session::UploadOptions make_upload_options(const UploadAppConfig& config, bool verbose) {
  session::UploadOptions options;
  options.chunked = config.upload.chunked;
  options.parallelism = config.upload.parallelism;
  options.retry_attempts = config.upload.retry_attempts;
  options.chunk_size = static_cast<uint64_t>(config.upload.chunk_size_mb) * 1024 * 1024;
  options.retry_delay = std::chrono::milliseconds(config.upload.retry_delay_ms);
  if (!uploader::parse_backoff_strategy(config.upload.retry_backoff, options.backoff)) {
    throw uploader::ConfigError("Unknown retry backoff '" + config.upload.retry_backoff + "'");
  }
  options.verbose = verbose;
  return options;
}

std::string describe_failure(const uploader::UploadError& error) {
  if (const auto* chunk = dynamic_cast<const uploader::ChunkUploadFailed*>(&error)) {
    return "chunk " + std::to_string(chunk->index()) + ": " + error.what();
  }
  return std::string(uploader::to_string(error.stage())) + ": " + error.what();
}

Commands::Commands()
    : verbose_(false) {}

int Commands::execute(int argc, char* argv[]) {
  CommandLineOptions options;
  std::string error;
  if (!parse_command_line(argc, argv, options, error)) {
    std::cerr << "Error: " << error << std::endl;
    print_usage();
    return 1;
  }
  if (options.help) {
    print_usage();
    return 0;
  }
  if (options.file.empty()) {
    std::cerr << "Error: Missing file name. Run skylift_upload --help for full syntax."
              << std::endl;
    return 1;
  }
  verbose_ = options.verbose;

  UploadAppConfig config;
  if (!options.settings_file.empty()) {
    ConfigParser parser;
    if (!parser.load_from_file(options.settings_file, config)) {
      std::cerr << "Error: " << parser.get_last_error() << std::endl;
      return 1;
    }
  }
  apply_command_line(options, config);

  std::string validation_error;
  if (!ConfigParser::validate(config, validation_error)) {
    std::cerr << "Error: " << validation_error << std::endl;
    return 1;
  }

  logging::LoggingConfig log_config;
  convert_logging_config(config.logging, log_config);
  std::vector<std::string> env_overrides = logging::apply_env_overrides(log_config);
  logging::ScopedLogging logging_scope(log_config);
  for (const auto& name : env_overrides) {
    SKYLIFT_LOG_DEBUG("Logging setting taken from environment" << logging::kv("variable", name));
  }

  return upload(options, config);
}

int Commands::upload(const CommandLineOptions& options, const UploadAppConfig& config) {
  try {
    std::unique_ptr<agent::Agent> device;
    std::unique_ptr<agent::JsonFileAgentStore> store;
    std::unique_ptr<agent::HttpOnboardingClient> onboarding_client;
    std::unique_ptr<agent::OnboardingManager> onboarding;

    http::HttpClient::Config http_config;
    http_config.request_timeout = std::chrono::milliseconds(config.platform.request_timeout_ms);
    http_config.verify_ssl = config.platform.verify_ssl;

    uploader::FileServiceConfig service;
    service.gateway_url = config.platform.gateway_url;
    service.http = http_config;

    if (!config.agent.config_file.empty()) {
      if (verbose_) {
        std::cout << "Upload using the agent configuration stored in: "
                  << config.agent.config_file << std::endl;
      }
      device = std::make_unique<agent::Agent>(
        agent::AgentConfig::loadFromFile(config.agent.config_file), config.agent.certificate
      );
      store = std::make_unique<agent::JsonFileAgentStore>(
        config.agent.state_dir.empty() ? agent::JsonFileAgentStore::default_state_dir()
                                       : config.agent.state_dir
      );
      onboarding_client = std::make_unique<agent::HttpOnboardingClient>(http_config);
      onboarding = std::make_unique<agent::OnboardingManager>(*onboarding_client, store.get());
      if (service.gateway_url.empty()) {
        service.gateway_url = device->config().base_url;
      }
    }

    auto tokens = std::make_shared<uploader::StaticTokenProvider>(config.platform.token);
    uploader::HttpFileClient transport(service, tokens);
    uploader::LogProgressSink progress(verbose_);

    session::UploadSession session(transport, progress);
    if (device) {
      session.enableAgentMode(*device, *onboarding);
    }

    uploader::UploadTarget target;
    target.asset_id = options.asset_id;
    target.file_path = options.file_path;
    target.mime_type = options.mime_type;
    target.description = options.description;

    session::UploadOptions upload_options = make_upload_options(config, verbose_);
    upload_options.on_attempt_failure =
      [](const std::string& label, int attempt, const std::string& message) {
        std::cerr << "Retrying " << label << " after attempt " << attempt << " failed: "
                  << message << std::endl;
      };

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    uploader::UploadOutcome outcome;
    {
      InterruptWatcher watcher(session);
      outcome = session.upload(options.file, target, upload_options);
    }

    // Keep queued log records ahead of the summary
    logging::flush_logging();
    if (device && device->client_id()) {
      std::cout << "Agent " << *device->client_id() << " is onboarded." << std::endl;
    }
    std::cout << "Upload time: " << std::fixed << std::setprecision(3)
              << static_cast<double>(outcome.elapsed.count()) / 1000.0 << " seconds"
              << std::endl;
    std::cout << "Your file " << options.file << " with " << outcome.content_hash
              << " md5 hash was successfully uploaded." << std::endl;
    return 0;

  } catch (const uploader::UploadError& e) {
    SKYLIFT_LOG_ERROR("Upload failed" << logging::kv("stage", uploader::to_string(e.stage())));
    logging::flush_logging();
    std::cerr << "Error: " << describe_failure(e) << std::endl;
    return 1;
  }
}

void Commands::print_usage() {
  std::cout << "Usage: skylift_upload --file <path> [options]" << std::endl;
  std::cout << std::endl;
  std::cout << "Upload a file to the platform file service." << std::endl;
  std::cout << std::endl;
  std::cout << "Options:" << std::endl;
  std::cout << "  --file, -f <path>        File to upload" << std::endl;
  std::cout << "  --config, -c <path>      Agent configuration (default: agentconfig.json)"
            << std::endl;
  std::cout << "  --cert, -r <path>        Private key for RSA_3072 agents" << std::endl;
  std::cout << "  --filepath, -h <path>    File path on the platform" << std::endl;
  std::cout << "  --assetid, -i <id>       Target asset (default: the agent)" << std::endl;
  std::cout << "  --mime, -m <type>        Mime type of the file" << std::endl;
  std::cout << "  --desc, -d <text>        Description" << std::endl;
  std::cout << "  --chunked, -k            Use chunked upload" << std::endl;
  std::cout << "  --parallel, -l <n>       Parallel chunk uploads (default: 3)" << std::endl;
  std::cout << "  --retry, -y <n>          Attempts before giving up (default: 3)" << std::endl;
  std::cout << "  --token, -t <token>      Service credential token (or SKYLIFT_TOKEN)"
            << std::endl;
  std::cout << "  --settings, -s <path>    YAML settings file" << std::endl;
  std::cout << "  --verbose, -v            Verbose output" << std::endl;
  std::cout << "  --help                   Show this help message" << std::endl;
  std::cout << std::endl;
  std::cout << "Examples:" << std::endl;
  std::cout << "  skylift_upload -f CHANGELOG.md" << std::endl;
  std::cout << "  skylift_upload -f data.bin -i <asset> -t <token> --chunked" << std::endl;
}

}  // namespace cli
}  // namespace skylift
