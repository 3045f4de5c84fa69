#include "smoke/bridge/config_bridge.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

#include <fmt/core.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "smoke/common/constants.hpp"
#include "smoke/common/string_utils.hpp"
#include "smoke/config/project_config.hpp"
#include "smoke/state/secret_store.hpp"
#include "smoke/suite/suite_registry.hpp"

namespace smoke::bridge {

namespace fs = std::filesystem;

auto ToJson(const ConfigBridge& bridge) -> nlohmann::json {
  return nlohmann::json{
      {"baseUrl", bridge.base_url},
      {"remote", bridge.remote},
      {"remoteAuth", bridge.remote_auth},
      {"siteTitle", bridge.site_title},
      {"timeout", bridge.timeout_ms},
      {"customUrls", bridge.custom_urls},
      {"suites", bridge.suites},
  };
}

auto ResolveBaseUrl(std::string_view configured_base_url) -> std::string {
  // NOLINTNEXTLINE(concurrency-mt-unsafe)
  if (const char* ddev = std::getenv("DDEV_PRIMARY_URL");
      ddev != nullptr && *ddev != '\0') {
    return common::TrimTrailingSlashes(ddev);
  }
  if (!configured_base_url.empty()) {
    return common::TrimTrailingSlashes(configured_base_url);
  }
  return "https://localhost";
}

ConfigBridgeWriter::ConfigBridgeWriter(
    const config::ProjectConfig& config, const suite::SuiteRegistry& registry,
    const state::SecretStore& secrets)
    : config_(config), registry_(registry), secrets_(secrets) {
}

auto ConfigBridgeWriter::Generate(
    const std::optional<std::string>& target_url,
    const std::optional<RemoteCredentials>& credentials) const
    -> ConfigBridge {
  ConfigBridge bridge;
  bridge.remote = target_url.has_value() && !target_url->empty();
  bridge.base_url = bridge.remote ? common::TrimTrailingSlashes(*target_url)
                                  : ResolveBaseUrl(config_.base_url);
  bridge.remote_auth = credentials.has_value() && !credentials->secret.empty();
  bridge.site_title = config_.site_title;
  bridge.custom_urls = config_.custom_urls;

  bridge.timeout_ms = config_.timeout_ms;
  if (bridge.timeout_ms < 0) {
    spdlog::warn(
        "ignoring negative test timeout {} ms, using {} ms", bridge.timeout_ms,
        kDefaultTestTimeoutMs);
    bridge.timeout_ms = kDefaultTestTimeoutMs;
  }

  for (const auto& [id, def] : registry_.Detect()) {
    if (!def.detected || !config_.IsSuiteEnabled(id)) {
      continue;
    }
    nlohmann::json entry =
        def.metadata.is_object() ? def.metadata : nlohmann::json::object();
    entry["enabled"] = true;
    entry["detected"] = true;
    entry["label"] = def.label;
    entry["description"] = def.description;
    bridge.suites[id] = std::move(entry);
  }

  const std::string auth_id(kAuthSuiteId);
  if (bridge.suites.contains(auth_id)) {
    auto& auth = bridge.suites[auth_id];
    if (bridge.remote_auth) {
      auth["testUser"] = credentials->user.empty() ? std::string(kBotUsername)
                                                   : credentials->user;
      auth["testPassword"] = credentials->secret;
    } else {
      auth["testUser"] = std::string(kBotUsername);
      auth["testPassword"] = secrets_.BotPassword();
    }
  }

  return bridge;
}

auto ConfigBridgeWriter::BridgePath() const -> fs::path {
  return config_.runner_dir / kBridgeFileName;
}

auto ConfigBridgeWriter::WriteConfig(
    const std::optional<std::string>& target_url,
    const std::optional<RemoteCredentials>& credentials) const -> fs::path {
  auto bridge = Generate(target_url, credentials);
  fs::path path = BridgePath();

  fs::create_directories(path.parent_path());
  std::ofstream out(path, std::ios::trunc);
  if (!out) {
    throw std::runtime_error(
        fmt::format("cannot write runner config {}", path.string()));
  }
  out << ToJson(bridge).dump(
             2, ' ', false, nlohmann::json::error_handler_t::replace)
      << "\n";
  if (!out) {
    throw std::runtime_error(
        fmt::format("failed writing runner config {}", path.string()));
  }
  spdlog::debug("wrote runner config {}", path.string());
  return path;
}

}  // namespace smoke::bridge
