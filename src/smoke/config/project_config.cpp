#include "smoke/config/project_config.hpp"

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <fmt/core.h>
#include <nlohmann/json.hpp>

#include "smoke/common/constants.hpp"
#include "smoke/common/diagnostic.hpp"

#if defined(__clang__)
#pragma clang diagnostic push
#pragma clang diagnostic ignored "-Wdeprecated-literal-operator"
#elif defined(__GNUC__)
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wdeprecated-literal-operator"
#endif
#include <toml++/toml.hpp>
#if defined(__clang__)
#pragma clang diagnostic pop
#elif defined(__GNUC__)
#pragma GCC diagnostic pop
#endif

namespace smoke::config {

namespace fs = std::filesystem;

namespace {

constexpr std::string_view kStarterConfig = R"(# smoke project configuration

[site]
title = ""
# base_url = "https://mysite.ddev.site"
# Capabilities gate the optional suites (webform, commerce, search_api,
# search, simple_sitemap, xmlsitemap, content_type:page).
capabilities = []

[runner]
dir = "playwright"
timeout = 30000
process_timeout = 300
min_node_major = 20

[suites]
custom_urls = []
quick = ["core_pages", "auth"]

[suites.enabled]

[state]
path = ".smoke/state.json"

# [report]
# junit = "reports/smoke-junit.xml"
)";

auto ResolveAgainst(const fs::path& root, const fs::path& path) -> fs::path {
  if (path.is_relative()) {
    return root / path;
  }
  return path;
}

auto ReadStringArray(const toml::node_view<toml::node>& node)
    -> std::vector<std::string> {
  std::vector<std::string> out;
  if (auto* arr = node.as_array()) {
    for (const auto& elem : *arr) {
      if (auto str = elem.value<std::string>()) {
        out.push_back(*str);
      }
    }
  }
  return out;
}

auto TableToJson(const toml::table& table) -> nlohmann::json {
  std::ostringstream os;
  os << toml::json_formatter{table};
  return nlohmann::json::parse(os.str());
}

}  // namespace

auto ProjectConfig::IsSuiteEnabled(std::string_view id) const -> bool {
  auto it = enabled.find(std::string(id));
  return it == enabled.end() || it->second;
}

auto DefaultConfig(const fs::path& root_dir) -> ProjectConfig {
  return ProjectConfig{
      .site_title = "",
      .base_url = "",
      .capabilities = {},
      .runner_dir = root_dir / "playwright",
      .timeout_ms = kDefaultTestTimeoutMs,
      .process_timeout = kDefaultProcessTimeout,
      .min_node_major = kDefaultMinNodeMajor,
      .custom_urls = {},
      .quick_suites = {kQuickModeSuites.begin(), kQuickModeSuites.end()},
      .enabled = {},
      .suite_metadata = nlohmann::json::object(),
      .providers = {},
      .state_path = root_dir / ".smoke" / "state.json",
      .junit_path = std::nullopt,
      .root_dir = root_dir,
  };
}

auto FindConfig(const fs::path& start_dir) -> std::optional<fs::path> {
  fs::path dir = fs::absolute(start_dir);

  while (true) {
    fs::path config_path = dir / kConfigFileName;
    if (fs::exists(config_path)) {
      return config_path;
    }

    fs::path parent = dir.parent_path();
    if (parent == dir) {
      // Reached root
      return std::nullopt;
    }
    dir = parent;
  }
}

auto LoadConfig(const fs::path& config_path) -> Result<ProjectConfig> {
  ProjectConfig config =
      DefaultConfig(fs::absolute(config_path).parent_path());
  const std::string file = config_path.string();

  toml::table tbl;
  try {
    tbl = toml::parse_file(file);
  } catch (const toml::parse_error& e) {
    return std::unexpected(
        Diagnostic::HostError(
            fmt::format("failed to parse {}: {}", file, e.what())));
  }

  // [site] section (optional)
  if (auto site = tbl["site"]) {
    if (auto title = site["title"].value<std::string>()) {
      config.site_title = *title;
    }
    if (auto base_url = site["base_url"].value<std::string>()) {
      config.base_url = *base_url;
    }
    config.capabilities = ReadStringArray(site["capabilities"]);
  }

  // [runner] section (optional)
  if (auto runner = tbl["runner"]) {
    if (auto dir = runner["dir"].value<std::string>()) {
      config.runner_dir = ResolveAgainst(config.root_dir, *dir);
    }
    if (auto timeout = runner["timeout"].value<int64_t>()) {
      if (*timeout < 0) {
        return std::unexpected(
            Diagnostic::HostError(
                fmt::format(
                    "{}: 'runner.timeout' must not be negative (got {})", file,
                    *timeout)));
      }
      config.timeout_ms = *timeout;
    }
    if (auto ceiling = runner["process_timeout"].value<int64_t>()) {
      if (*ceiling <= 0) {
        return std::unexpected(
            Diagnostic::HostError(
                fmt::format(
                    "{}: 'runner.process_timeout' must be positive (got {})",
                    file, *ceiling)));
      }
      config.process_timeout = std::chrono::seconds{*ceiling};
    }
    if (auto floor = runner["min_node_major"].value<int64_t>()) {
      config.min_node_major = static_cast<int>(*floor);
    }
  }

  // [suites] section (optional)
  if (auto suites = tbl["suites"]) {
    config.custom_urls = ReadStringArray(suites["custom_urls"]);
    if (suites["quick"].as_array() != nullptr) {
      config.quick_suites = ReadStringArray(suites["quick"]);
    }

    if (auto* enabled = suites["enabled"].as_table()) {
      for (const auto& [key, node] : *enabled) {
        auto flag = node.value<bool>();
        if (!flag) {
          return std::unexpected(
              Diagnostic::HostError(
                  fmt::format(
                      "{}: 'suites.enabled.{}' must be a boolean", file,
                      key.str())));
        }
        config.enabled[std::string(key.str())] = *flag;
      }
    }

    if (auto* metadata = suites["metadata"].as_table()) {
      for (const auto& [key, node] : *metadata) {
        const auto* suite_table = node.as_table();
        if (suite_table == nullptr) {
          return std::unexpected(
              Diagnostic::HostError(
                  fmt::format(
                      "{}: 'suites.metadata.{}' must be a table", file,
                      key.str())));
        }
        config.suite_metadata[std::string(key.str())] =
            TableToJson(*suite_table);
      }
    }

    if (auto* providers = suites["providers"].as_array()) {
      for (const auto& elem : *providers) {
        const auto* provider = elem.as_table();
        auto name = provider != nullptr
                        ? (*provider)["name"].value<std::string>()
                        : std::nullopt;
        auto root = provider != nullptr
                        ? (*provider)["root"].value<std::string>()
                        : std::nullopt;
        if (!name || !root) {
          return std::unexpected(
              Diagnostic::HostError(
                  fmt::format(
                      "{}: every [[suites.providers]] entry needs 'name' and "
                      "'root'",
                      file)));
        }
        config.providers.push_back(
            SuiteProvider{
                .name = *name,
                .root = ResolveAgainst(config.root_dir, *root),
            });
      }
    }
  }

  // [state] section (optional)
  if (auto state = tbl["state"]) {
    if (auto path = state["path"].value<std::string>()) {
      config.state_path = ResolveAgainst(config.root_dir, *path);
    }
  }

  // [report] section (optional)
  if (auto report = tbl["report"]) {
    if (auto junit = report["junit"].value<std::string>()) {
      config.junit_path = ResolveAgainst(config.root_dir, *junit);
    }
  }

  return config;
}

auto LoadProjectConfig(const fs::path& start_dir) -> Result<ProjectConfig> {
  auto config_path = FindConfig(start_dir);
  if (!config_path) {
    return DefaultConfig(fs::absolute(start_dir));
  }
  return LoadConfig(*config_path);
}

auto StarterConfig() -> std::string_view {
  return kStarterConfig;
}

}  // namespace smoke::config
