#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "smoke/common/diagnostic.hpp"

namespace smoke::report {

enum class TestStatus : uint8_t {
  kPassed,
  kFailed,
  kSkipped,
};

auto ToString(TestStatus status) -> std::string_view;
auto ParseTestStatus(std::string_view text) -> std::optional<TestStatus>;

enum class ErrorCode : uint8_t {
  kPlaywrightNotSetup,
  kBrowserLaunchFailed,
  kConfigMissing,
  kInvalidSuite,
  kTimeout,
  kUnknownError,
  kParseFailed,
  kEnvironmentNotReady,  // Node missing or too old
};

// Wire names, e.g. "BROWSER_LAUNCH_FAILED".
auto ToString(ErrorCode code) -> std::string_view;
auto ParseErrorCode(std::string_view text) -> std::optional<ErrorCode>;

struct StructuredError {
  ErrorCode code = ErrorCode::kUnknownError;
  std::string message;
  std::string hint;
  std::string raw;  // Truncated diagnostic output

  auto operator==(const StructuredError&) const -> bool = default;
};

struct TestResult {
  std::string title;
  TestStatus status = TestStatus::kPassed;
  int64_t duration_ms = 0;
  std::optional<std::string> error;

  auto operator==(const TestResult&) const -> bool = default;
};

struct SuiteResult {
  std::string title;
  std::vector<TestResult> tests;
  int passed = 0;
  int failed = 0;
  int skipped = 0;
  int64_t duration_ms = 0;

  [[nodiscard]] auto HasFailures() const -> bool {
    return failed > 0;
  }

  auto operator==(const SuiteResult&) const -> bool = default;
};

struct Summary {
  int total = 0;
  int passed = 0;
  int failed = 0;
  int skipped = 0;
  int64_t duration_ms = 0;

  auto operator==(const Summary&) const -> bool = default;
};

struct RunResult {
  std::map<std::string, SuiteResult> suites;
  Summary summary;
  std::optional<std::string> ran_at;  // ISO-8601 UTC
  int exit_code = 0;
  std::optional<StructuredError> error;

  auto operator==(const RunResult&) const -> bool = default;
};

// Recompute a suite's counters and duration from its test list.
void RecountSuite(SuiteResult& suite);

// Recompute the summary from all suites.
void RecomputeSummary(RunResult& result);

auto ToJson(const StructuredError& error) -> nlohmann::json;
auto ToJson(const RunResult& result) -> nlohmann::json;

// Read a RunResult previously written by ToJson. Counters are recomputed
// from the test lists.
auto RunResultFromJson(const nlohmann::json& json) -> Result<RunResult>;

// Current time as "YYYY-MM-DDTHH:MM:SS+00:00".
auto CurrentTimestamp() -> std::string;

}  // namespace smoke::report
