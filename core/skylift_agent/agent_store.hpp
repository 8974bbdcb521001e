// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#ifndef SKYLIFT_AGENT_STORE_HPP
#define SKYLIFT_AGENT_STORE_HPP

#include <optional>
#include <string>

#include "agent.hpp"

namespace skylift {
namespace agent {

/**
 * Onboarded identity as persisted between runs
 */
struct AgentIdentity {
  std::string client_id;
  AgentCredentials credentials;
};

/**
 * Persistence of onboarded identities, keyed by the configured client id
 */
class IAgentStore {
public:
  virtual ~IAgentStore() = default;

  /**
   * @return Identity, or std::nullopt if none is stored or it is unreadable
   */
  virtual std::optional<AgentIdentity> load(const std::string& key) = 0;

  /**
   * @return true if the identity was written
   */
  virtual bool save(const std::string& key, const AgentIdentity& identity) = 0;
};

/**
 * Stores each identity as <state_dir>/<key>.json, readable by the owner only.
 * Writes go to a temporary file that is renamed over the previous one.
 */
class JsonFileAgentStore : public IAgentStore {
public:
  explicit JsonFileAgentStore(std::string state_dir);

  std::optional<AgentIdentity> load(const std::string& key) override;

  bool save(const std::string& key, const AgentIdentity& identity) override;

  std::string path_for(const std::string& key) const;

  /**
   * $HOME/.skylift, or ./.skylift when HOME is unset
   */
  static std::string default_state_dir();

private:
  std::string state_dir_;
};

}  // namespace agent
}  // namespace skylift

#endif  // SKYLIFT_AGENT_STORE_HPP
