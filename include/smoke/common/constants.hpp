#pragma once

#include <array>
#include <chrono>
#include <cstdint>
#include <string_view>

namespace smoke {

// Per-test timeout written to the bridge file when none is configured.
inline constexpr int64_t kDefaultTestTimeoutMs = 30000;

// Ceiling for one runner invocation.
inline constexpr std::chrono::seconds kDefaultProcessTimeout{300};

inline constexpr int kDefaultMinNodeMajor = 20;

// Local account the auth suite logs in with when no remote credentials
// are given.
inline constexpr std::string_view kBotUsername = "smoke_bot";

// State store keys.
inline constexpr std::string_view kStateBotPassword = "smoke.bot_password";
inline constexpr std::string_view kStateLastResults = "smoke.last_results";
inline constexpr std::string_view kStateLastRun = "smoke.last_run";

// Files shared with the runner, relative to the runner directory.
inline constexpr std::string_view kBridgeFileName = ".smoke-config.json";
inline constexpr std::string_view kResultsFileName = "results.json";
inline constexpr std::string_view kRunnerSuitesDir = "suites";
inline constexpr std::string_view kSpecSuffix = ".spec.ts";

inline constexpr std::string_view kConfigFileName = "smoke.toml";
inline constexpr std::string_view kDeclarationFileName = "smoke.suites.yml";

// The one suite that receives injected login credentials.
inline constexpr std::string_view kAuthSuiteId = "auth";

inline constexpr std::array<std::string_view, 2> kQuickModeSuites = {
    "core_pages", "auth"};

// Process exit codes of the CLI.
inline constexpr int kExitSuccess = 0;
inline constexpr int kExitFailure = 1;
inline constexpr int kExitSetupRequired = 2;

}  // namespace smoke
