#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "smoke/common/diagnostic.hpp"

namespace smoke::config {

// A directory that may hold a smoke.suites.yml declaration file.
struct SuiteProvider {
  std::string name;
  std::filesystem::path root;  // Absolute
};

struct ProjectConfig {
  // [site]
  std::string site_title;
  std::string base_url;  // Empty when not configured
  std::vector<std::string> capabilities;

  // [runner]
  std::filesystem::path runner_dir;
  int64_t timeout_ms;
  std::chrono::seconds process_timeout;
  int min_node_major;

  // [suites]
  std::vector<std::string> custom_urls;
  std::vector<std::string> quick_suites;
  std::map<std::string, bool> enabled;  // Missing ids are enabled
  nlohmann::json suite_metadata = nlohmann::json::object();
  std::vector<SuiteProvider> providers;

  // [state]
  std::filesystem::path state_path;

  // [report]
  std::optional<std::filesystem::path> junit_path;

  // Directory where smoke.toml was found (or the working directory when
  // running without one).
  std::filesystem::path root_dir;

  [[nodiscard]] auto IsSuiteEnabled(std::string_view id) const -> bool;
};

// Configuration used when no smoke.toml exists. Relative paths resolve
// against root_dir.
auto DefaultConfig(const std::filesystem::path& root_dir) -> ProjectConfig;

// Search for smoke.toml starting from dir, going up to parent dirs.
// Returns nullopt if not found.
auto FindConfig(
    const std::filesystem::path& start_dir = std::filesystem::current_path())
    -> std::optional<std::filesystem::path>;

// Parse smoke.toml. Every section is optional.
// Returns a host error Diagnostic on parse errors or invalid values.
auto LoadConfig(const std::filesystem::path& config_path)
    -> Result<ProjectConfig>;

// FindConfig + LoadConfig, falling back to DefaultConfig(start_dir).
auto LoadProjectConfig(const std::filesystem::path& start_dir)
    -> Result<ProjectConfig>;

// Contents written by `smoke init`.
auto StarterConfig() -> std::string_view;

}  // namespace smoke::config
