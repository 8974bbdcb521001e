// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef SKYLIFT_ONBOARDING_CLIENT_HPP
#define SKYLIFT_ONBOARDING_CLIENT_HPP

#include <string>

#include "agent.hpp"

namespace skylift {
namespace agent {

/**
 * Result of a successful onboarding call
 */
struct OnboardingResponse {
  std::string client_id;
  AgentCredentials credentials;
};

/**
 * Platform onboarding operation
 *
 * Failures are thrown as uploader::OnboardingFailed; retryable() is false
 * when the platform rejected the credentials and true for transient problems.
 */
class IOnboardingClient {
public:
  virtual ~IOnboardingClient() = default;

  /**
   * @param certificate Certificate material, nullptr for shared-secret profiles
   */
  virtual OnboardingResponse onboard(const AgentConfig& config, const RsaKey* certificate) = 0;
};

}  // namespace agent
}  // namespace skylift

#endif  // SKYLIFT_ONBOARDING_CLIENT_HPP
