// SPDX-FileCopyrightText: 2026 ArcheBase
//
// SPDX-License-Identifier: MulanPSL-2.0

#include "agent_store.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <utility>

#define SKYLIFT_LOG_COMPONENT "agent_store"
#include <skylift_log_macros.hpp>

namespace fs = std::filesystem;

namespace skylift {
namespace agent {

namespace {

// Client ids are platform generated; keep file names to a safe alphabet
std::string sanitize_key(const std::string& key) {
  std::string safe;
  safe.reserve(key.size());
  for (char c : key) {
    bool ok = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') ||
              c == '-' || c == '_' || c == '.';
    safe.push_back(ok ? c : '_');
  }
  return safe;
}

}  // namespace

JsonFileAgentStore::JsonFileAgentStore(std::string state_dir)
    : state_dir_(std::move(state_dir)) {}

std::string JsonFileAgentStore::default_state_dir() {
  const char* home = std::getenv("HOME");
  if (home == nullptr || *home == '\0') {
    return ".skylift";
  }
  return (fs::path(home) / ".skylift").string();
}

std::string JsonFileAgentStore::path_for(const std::string& key) const {
  return (fs::path(state_dir_) / (sanitize_key(key) + ".json")).string();
}

std::optional<AgentIdentity> JsonFileAgentStore::load(const std::string& key) {
  std::string path = path_for(key);
  std::error_code ec;
  if (!fs::exists(path, ec)) {
    return std::nullopt;
  }

  std::ifstream file(path);
  if (!file.is_open()) {
    SKYLIFT_LOG_WARN("Can't open stored identity " << path);
    return std::nullopt;
  }

  try {
    nlohmann::json root = nlohmann::json::parse(file);
    AgentIdentity identity;
    identity.client_id = root.at("client_id").get<std::string>();
    identity.credentials.client_secret = root.value("client_secret", "");
    identity.credentials.registration_access_token = root.value("registration_access_token", "");
    identity.credentials.registration_client_uri = root.value("registration_client_uri", "");
    if (identity.client_id.empty()) {
      SKYLIFT_LOG_WARN("Stored identity " << path << " has an empty client id, ignoring it");
      return std::nullopt;
    }
    return identity;
  } catch (const nlohmann::json::exception& e) {
    SKYLIFT_LOG_WARN("Ignoring unreadable identity " << path << ": " << e.what());
    return std::nullopt;
  }
}

bool JsonFileAgentStore::save(const std::string& key, const AgentIdentity& identity) {
  std::error_code ec;
  fs::create_directories(state_dir_, ec);
  if (ec) {
    SKYLIFT_LOG_WARN("Can't create state directory " << state_dir_ << ": " << ec.message());
    return false;
  }

  nlohmann::json root;
  root["client_id"] = identity.client_id;
  root["client_secret"] = identity.credentials.client_secret;
  root["registration_access_token"] = identity.credentials.registration_access_token;
  root["registration_client_uri"] = identity.credentials.registration_client_uri;

  std::string path = path_for(key);
  std::string tmp_path = path + ".tmp";
  {
    std::ofstream file(tmp_path, std::ios::trunc);
    if (!file.is_open()) {
      SKYLIFT_LOG_WARN("Can't write identity to " << tmp_path);
      return false;
    }
    file << root.dump(2);
    if (!file.good()) {
      SKYLIFT_LOG_WARN("Failed writing identity to " << tmp_path);
      return false;
    }
  }

  fs::permissions(tmp_path, fs::perms::owner_read | fs::perms::owner_write, ec);
  if (ec) {
    SKYLIFT_LOG_WARN("Can't restrict permissions of " << tmp_path << ": " << ec.message());
  }

  fs::rename(tmp_path, path, ec);
  if (ec) {
    SKYLIFT_LOG_WARN("Can't move identity into place at " << path << ": " << ec.message());
    fs::remove(tmp_path, ec);
    return false;
  }

  SKYLIFT_LOG_DEBUG("Stored identity" << logging::kv("client_id", identity.client_id));
  return true;
}

}  // namespace agent
}  // namespace skylift
