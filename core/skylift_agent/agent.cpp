// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "agent.hpp"

#include <fstream>
#include <nlohmann/json.hpp>
#include <sstream>
#include <stdexcept>
#include <utility>

#include <upload_errors.hpp>

#define SKYLIFT_LOG_COMPONENT "agent"
#include <skylift_log_macros.hpp>

namespace skylift {
namespace agent {

using uploader::CertificateSetupFailed;
using uploader::ConfigError;

namespace {

constexpr int kRsaProfileBits = 3072;

SecurityProfile parse_profile(const nlohmann::json& profiles) {
  if (!profiles.is_array() || profiles.empty()) {
    throw ConfigError("clientCredentialProfile must be a non-empty array");
  }

  std::string name = profiles.at(0).get<std::string>();
  if (name == "SHARED_SECRET") {
    return SecurityProfile::SharedSecret;
  }
  if (name == "RSA_3072") {
    return SecurityProfile::Rsa3072;
  }
  throw ConfigError("unsupported clientCredentialProfile " + name);
}

std::string required_string(const nlohmann::json& content, const char* key) {
  if (!content.contains(key) || !content[key].is_string() || content[key].get<std::string>().empty()) {
    throw ConfigError(std::string("agent configuration is missing ") + key);
  }
  return content[key].get<std::string>();
}

}  // namespace

const char* to_string(OnboardingState state) {
  return state == OnboardingState::Onboarded ? "onboarded" : "not-onboarded";
}

const char* to_string(SecurityProfile profile) {
  return profile == SecurityProfile::Rsa3072 ? "RSA_3072" : "SHARED_SECRET";
}

AgentConfig AgentConfig::fromJson(const std::string& json) {
  nlohmann::json root;
  try {
    root = nlohmann::json::parse(json);
  } catch (const nlohmann::json::parse_error& e) {
    throw ConfigError(std::string("invalid agent configuration JSON: ") + e.what());
  }

  if (!root.is_object() || !root.contains("content") || !root["content"].is_object()) {
    throw ConfigError("agent configuration has no content object");
  }
  const nlohmann::json& content = root["content"];

  AgentConfig config;
  config.base_url = required_string(content, "baseUrl");
  config.iat = required_string(content, "iat");
  config.client_id = required_string(content, "clientId");
  config.tenant = content.value("tenant", "");
  config.expiration = root.value("expiration", "");

  try {
    config.profile = content.contains("clientCredentialProfile")
                       ? parse_profile(content["clientCredentialProfile"])
                       : SecurityProfile::SharedSecret;
  } catch (const nlohmann::json::exception& e) {
    throw ConfigError(std::string("invalid clientCredentialProfile: ") + e.what());
  }

  return config;
}

AgentConfig AgentConfig::loadFromFile(const std::string& path) {
  std::ifstream file(path);
  if (!file.is_open()) {
    throw ConfigError("Can't open agent configuration " + path);
  }
  std::stringstream buffer;
  buffer << file.rdbuf();
  return fromJson(buffer.str());
}

Agent::Agent(AgentConfig config, std::string certificate_path)
    : config_(std::move(config))
    , certificate_path_(std::move(certificate_path)) {}

void Agent::setup_certificate() {
  if (certificate_path_.empty()) {
    throw CertificateSetupFailed(
      std::string("profile ") + to_string(config_.profile) + " requires a certificate"
    );
  }
  install_certificate(RsaKey::loadFromFile(certificate_path_));
}

void Agent::install_certificate(const RsaKey& key) {
  if (requires_certificate() && key.bits() != kRsaProfileBits) {
    throw CertificateSetupFailed(
      "RSA_3072 requires a 3072 bit key, got " + std::to_string(key.bits()) + " bits"
    );
  }
  certificate_ = key;
  SKYLIFT_LOG_INFO("Installed certificate" << logging::kv("bits", key.bits()));
}

void Agent::mark_onboarded(const std::string& client_id, const AgentCredentials& credentials) {
  if (is_onboarded()) {
    throw std::logic_error("agent " + *client_id_ + " is already onboarded");
  }
  client_id_ = client_id;
  credentials_ = credentials;
  state_ = OnboardingState::Onboarded;
}

}  // namespace agent
}  // namespace skylift
