// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "onboarding_manager.hpp"

#include <retry_executor.hpp>
#include <upload_errors.hpp>

#define SKYLIFT_LOG_COMPONENT "onboarding"
#include <skylift_log_macros.hpp>

namespace skylift {
namespace agent {

using uploader::OnboardingFailed;
using uploader::RetryExhausted;

OnboardingManager::OnboardingManager(IOnboardingClient& client, IAgentStore* store)
    : client_(client)
    , store_(store) {}

void OnboardingManager::ensureOnboarded(
  Agent& agent, const uploader::RetryPolicy& policy, const uploader::CancellationToken& cancel
) {
  std::lock_guard<std::mutex> lock(mutex_);

  if (agent.is_onboarded()) {
    SKYLIFT_LOG_DEBUG("Agent already onboarded" << logging::kv("client_id", *agent.client_id()));
    return;
  }

  if (restoreFromStore(agent)) {
    return;
  }

  if (agent.requires_certificate() && !agent.has_certificate()) {
    agent.setup_certificate();
  }

  const std::string& configured_id = agent.config().client_id;
  SKYLIFT_LOG_INFO(
    "Onboarding agent" << logging::kv("client_id", configured_id)
                       << logging::kv("profile", to_string(agent.config().profile))
  );

  uploader::RetryExecutor executor(policy, cancel);
  OnboardingResponse response;
  try {
    response = executor.run("onboard", [&]() {
      return client_.onboard(agent.config(), agent.certificate());
    });
  } catch (const RetryExhausted& e) {
    throw OnboardingFailed(
      "Onboarding of " + configured_id + " failed after " + std::to_string(e.attempts()) +
      " attempts: " + e.cause_message()
    );
  }

  if (response.client_id.empty()) {
    throw OnboardingFailed("platform returned no client id for " + configured_id);
  }

  agent.mark_onboarded(response.client_id, response.credentials);
  SKYLIFT_LOG_INFO("Agent onboarded" << logging::kv("client_id", response.client_id));

  if (store_ != nullptr) {
    AgentIdentity identity{response.client_id, response.credentials};
    if (!store_->save(configured_id, identity)) {
      SKYLIFT_LOG_WARN("Onboarded identity was not persisted; the next run will onboard again");
    }
  }
}

bool OnboardingManager::restoreFromStore(Agent& agent) {
  if (store_ == nullptr) {
    return false;
  }

  auto identity = store_->load(agent.config().client_id);
  if (!identity) {
    return false;
  }

  agent.mark_onboarded(identity->client_id, identity->credentials);
  SKYLIFT_LOG_INFO("Restored onboarded identity" << logging::kv("client_id", identity->client_id));
  return true;
}

}  // namespace agent
}  // namespace skylift
