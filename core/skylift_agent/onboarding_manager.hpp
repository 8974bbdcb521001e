// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef SKYLIFT_ONBOARDING_MANAGER_HPP
#define SKYLIFT_ONBOARDING_MANAGER_HPP

#include <mutex>

#include <cancellation_token.hpp>
#include <retry_policy.hpp>

#include "agent.hpp"
#include "agent_store.hpp"
#include "onboarding_client.hpp"

namespace skylift {
namespace agent {

/**
 * Establishes the agent's trust relationship with the platform.
 *
 * NotOnboarded -> Onboarded is the only transition, and this class is the
 * only writer of the agent's client id.
 */
class OnboardingManager {
public:
  /**
   * @param store Optional identity persistence; nullptr disables it
   */
  explicit OnboardingManager(IOnboardingClient& client, IAgentStore* store = nullptr);

  /**
   * Make sure the agent is onboarded.
   *
   * 1. Already onboarded: no-op.
   * 2. Identity in the store: restore it, no network call.
   * 3. Certificate profile without material: install it (fatal on failure).
   * 4. Call the platform under the retry policy with label "onboard".
   *
   * @throws CertificateSetupFailed if the certificate can't be installed
   * @throws OnboardingFailed if the platform rejected the agent or retries ran out
   * @throws OperationCancelled if cancelled meanwhile
   */
  void ensureOnboarded(
    Agent& agent, const uploader::RetryPolicy& policy, const uploader::CancellationToken& cancel
  );

private:
  bool restoreFromStore(Agent& agent);

  IOnboardingClient& client_;
  IAgentStore* store_;
  std::mutex mutex_;
};

}  // namespace agent
}  // namespace skylift

#endif  // SKYLIFT_ONBOARDING_MANAGER_HPP
