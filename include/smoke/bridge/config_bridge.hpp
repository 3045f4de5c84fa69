#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "smoke/config/project_config.hpp"
#include "smoke/state/secret_store.hpp"
#include "smoke/suite/suite_registry.hpp"

namespace smoke::bridge {

struct RemoteCredentials {
  std::string user;  // Empty means the bot account name
  std::string secret;
};

// Everything the runner needs at startup. Serialized to
// <runner_dir>/.smoke-config.json.
struct ConfigBridge {
  std::string base_url;
  bool remote = false;
  bool remote_auth = false;
  std::string site_title;
  int64_t timeout_ms = 0;
  std::vector<std::string> custom_urls;
  // id -> suite fields, only for suites that are enabled and detected.
  nlohmann::json suites = nlohmann::json::object();
};

auto ToJson(const ConfigBridge& bridge) -> nlohmann::json;

// DDEV_PRIMARY_URL, then the configured base URL, then https://localhost.
// Trailing slashes are dropped.
auto ResolveBaseUrl(std::string_view configured_base_url) -> std::string;

class ConfigBridgeWriter {
 public:
  ConfigBridgeWriter(
      const config::ProjectConfig& config, const suite::SuiteRegistry& registry,
      const state::SecretStore& secrets);

  [[nodiscard]] auto Generate(
      const std::optional<std::string>& target_url,
      const std::optional<RemoteCredentials>& credentials) const
      -> ConfigBridge;

  // Overwrites the bridge file and returns its path. Throws on I/O failure.
  auto WriteConfig(
      const std::optional<std::string>& target_url,
      const std::optional<RemoteCredentials>& credentials) const
      -> std::filesystem::path;

  [[nodiscard]] auto BridgePath() const -> std::filesystem::path;

 private:
  const config::ProjectConfig& config_;
  const suite::SuiteRegistry& registry_;
  const state::SecretStore& secrets_;
};

}  // namespace smoke::bridge
