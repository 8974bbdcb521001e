// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef SKYLIFT_HTTP_ONBOARDING_CLIENT_HPP
#define SKYLIFT_HTTP_ONBOARDING_CLIENT_HPP

#include <string>

#include <http_client.hpp>

#include "onboarding_client.hpp"

namespace skylift {
namespace agent {

/**
 * IOnboardingClient over the platform agent management API
 *
 * POST {baseUrl}/api/agentmanagement/v3/register with the initial access
 * token as bearer credential.
 */
class HttpOnboardingClient : public IOnboardingClient {
public:
  explicit HttpOnboardingClient(const http::HttpClient::Config& config = http::HttpClient::Config());

  OnboardingResponse onboard(const AgentConfig& config, const RsaKey* certificate) override;

private:
  http::HttpClient http_;
};

// Internal implementations, exposed for tests

/**
 * Registration URL for the configured base URL
 */
std::string buildRegistrationUrlImpl(const AgentConfig& config);

/**
 * JSON request body; carries the public JWK set when a certificate is given
 */
std::string buildRegistrationBodyImpl(const AgentConfig& config, const RsaKey* certificate);

/**
 * Map a registration response onto an OnboardingResponse.
 *
 * @throws OnboardingFailed, non-retryable for 400/401/403/404, retryable for
 *         transient statuses, network errors and unparseable bodies
 */
OnboardingResponse parseRegistrationResponseImpl(const http::HttpResponse& response);

}  // namespace agent
}  // namespace skylift

#endif  // SKYLIFT_HTTP_ONBOARDING_CLIENT_HPP
