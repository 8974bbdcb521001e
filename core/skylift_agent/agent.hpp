// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef SKYLIFT_AGENT_HPP
#define SKYLIFT_AGENT_HPP

#include <optional>
#include <string>

#include "rsa_key.hpp"

namespace skylift {
namespace agent {

enum class OnboardingState { NotOnboarded, Onboarded };

enum class SecurityProfile {
  SharedSecret,  // SHARED_SECRET
  Rsa3072,       // RSA_3072, requires certificate material
};

const char* to_string(OnboardingState state);
const char* to_string(SecurityProfile profile);

/**
 * Agent onboarding configuration as issued by the platform
 *
 * {"content": {"baseUrl": ..., "iat": ..., "clientCredentialProfile": ["SHARED_SECRET"],
 *              "clientId": ..., "tenant": ...},
 *  "expiration": ...}
 */
struct AgentConfig {
  std::string base_url;
  std::string iat;  // initial access token, never logged
  std::string client_id;
  std::string tenant;
  SecurityProfile profile = SecurityProfile::SharedSecret;
  std::string expiration;

  /**
   * @throws ConfigError for malformed JSON or missing fields
   */
  static AgentConfig fromJson(const std::string& json);

  /**
   * @throws ConfigError if the file can't be read or parsed
   */
  static AgentConfig loadFromFile(const std::string& path);
};

/**
 * Credentials issued by the platform at onboarding. Opaque to everything but
 * the agent and its store; never logged.
 */
struct AgentCredentials {
  std::string client_secret;
  std::string registration_access_token;
  std::string registration_client_uri;
};

/**
 * Identity record of a device agent
 *
 * client_id() is set if and only if the agent is onboarded. The transition
 * to Onboarded is performed once, by OnboardingManager.
 */
class Agent {
public:
  /**
   * @param certificate_path PEM private key used for RSA_3072 profiles
   */
  explicit Agent(AgentConfig config, std::string certificate_path = "");

  const AgentConfig& config() const {
    return config_;
  }

  OnboardingState state() const {
    return state_;
  }

  bool is_onboarded() const {
    return state_ == OnboardingState::Onboarded;
  }

  const std::optional<std::string>& client_id() const {
    return client_id_;
  }

  bool requires_certificate() const {
    return config_.profile == SecurityProfile::Rsa3072;
  }

  bool has_certificate() const {
    return certificate_.has_value();
  }

  /**
   * Certificate material, or nullptr when none is installed
   */
  const RsaKey* certificate() const {
    return certificate_ ? &*certificate_ : nullptr;
  }

  const std::string& certificate_path() const {
    return certificate_path_;
  }

  /**
   * Load and validate the configured certificate (3072-bit RSA for RSA_3072).
   *
   * @throws CertificateSetupFailed when no path is configured or the key is unusable
   */
  void setup_certificate();

  /**
   * Install certificate material directly.
   *
   * @throws CertificateSetupFailed if the key does not match the profile
   */
  void install_certificate(const RsaKey& key);

  const AgentCredentials& credentials() const {
    return credentials_;
  }

private:
  friend class OnboardingManager;

  void mark_onboarded(const std::string& client_id, const AgentCredentials& credentials);

  AgentConfig config_;
  std::string certificate_path_;
  OnboardingState state_ = OnboardingState::NotOnboarded;
  std::optional<std::string> client_id_;
  std::optional<RsaKey> certificate_;
  AgentCredentials credentials_;
};

}  // namespace agent
}  // namespace skylift

#endif  // SKYLIFT_AGENT_HPP
