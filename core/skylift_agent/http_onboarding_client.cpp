// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "http_onboarding_client.hpp"

#include <nlohmann/json.hpp>

#include <upload_errors.hpp>

#define SKYLIFT_LOG_COMPONENT "onboarding_client"
#include <skylift_log_macros.hpp>

namespace bhttp = boost::beast::http;

namespace skylift {
namespace agent {

using uploader::OnboardingFailed;

std::string buildRegistrationUrlImpl(const AgentConfig& config) {
  std::string base = config.base_url;
  while (!base.empty() && base.back() == '/') {
    base.pop_back();
  }
  return base + "/api/agentmanagement/v3/register";
}

std::string buildRegistrationBodyImpl(const AgentConfig& config, const RsaKey* certificate) {
  nlohmann::json body;
  body["client_id"] = config.client_id;
  if (certificate != nullptr) {
    nlohmann::json jwk = nlohmann::json::parse(certificate->public_jwk_json("key1"));
    body["jwks"]["keys"] = nlohmann::json::array({jwk});
  }
  return body.dump();
}

OnboardingResponse parseRegistrationResponseImpl(const http::HttpResponse& response) {
  if (response.status_code == 0) {
    throw OnboardingFailed("registration request failed: " + response.error_message, true);
  }

  if (!response.success) {
    int status = response.status_code;
    std::string message = "registration rejected with HTTP " + std::to_string(status);
    if (status == 401 || status == 403) {
      throw OnboardingFailed(message + " (initial access token invalid or expired)", false);
    }
    throw OnboardingFailed(message, http::HttpClient::is_retryable_status(status));
  }

  try {
    nlohmann::json root = nlohmann::json::parse(response.body);
    OnboardingResponse result;
    result.client_id = root.at("client_id").get<std::string>();
    result.credentials.client_secret = root.value("client_secret", "");
    result.credentials.registration_access_token = root.value("registration_access_token", "");
    result.credentials.registration_client_uri = root.value("registration_client_uri", "");
    return result;
  } catch (const nlohmann::json::exception& e) {
    throw OnboardingFailed(std::string("unreadable registration response: ") + e.what(), true);
  }
}

HttpOnboardingClient::HttpOnboardingClient(const http::HttpClient::Config& config)
    : http_(config) {}

OnboardingResponse HttpOnboardingClient::onboard(
  const AgentConfig& config, const RsaKey* certificate
) {
  std::map<std::string, std::string> headers;
  headers["Authorization"] = "Bearer " + config.iat;
  headers["Content-Type"] = "application/json";
  headers["Accept"] = "application/json";

  std::string url = buildRegistrationUrlImpl(config);
  SKYLIFT_LOG_DEBUG("Registering agent" << logging::kv("url", url));

  http::HttpResponse response =
    http_.request(bhttp::verb::post, url, headers, buildRegistrationBodyImpl(config, certificate));
  return parseRegistrationResponseImpl(response);
}

}  // namespace agent
}  // namespace skylift
