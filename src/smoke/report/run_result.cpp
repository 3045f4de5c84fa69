#include "smoke/report/run_result.hpp"

#include <ctime>
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include <fmt/chrono.h>
#include <fmt/core.h>
#include <nlohmann/json.hpp>

#include "smoke/common/diagnostic.hpp"
#include "smoke/common/internal_error.hpp"

namespace smoke::report {

auto ToString(TestStatus status) -> std::string_view {
  switch (status) {
    case TestStatus::kPassed:
      return "passed";
    case TestStatus::kFailed:
      return "failed";
    case TestStatus::kSkipped:
      return "skipped";
  }
  common::ThrowInternalError(
      "ToString(TestStatus)",
      fmt::format("unhandled value {}", static_cast<int>(status)));
}

auto ParseTestStatus(std::string_view text) -> std::optional<TestStatus> {
  if (text == "passed") {
    return TestStatus::kPassed;
  }
  if (text == "failed") {
    return TestStatus::kFailed;
  }
  if (text == "skipped") {
    return TestStatus::kSkipped;
  }
  return std::nullopt;
}

auto ToString(ErrorCode code) -> std::string_view {
  switch (code) {
    case ErrorCode::kPlaywrightNotSetup:
      return "PLAYWRIGHT_NOT_SETUP";
    case ErrorCode::kBrowserLaunchFailed:
      return "BROWSER_LAUNCH_FAILED";
    case ErrorCode::kConfigMissing:
      return "CONFIG_MISSING";
    case ErrorCode::kInvalidSuite:
      return "INVALID_SUITE";
    case ErrorCode::kTimeout:
      return "TIMEOUT";
    case ErrorCode::kUnknownError:
      return "UNKNOWN_ERROR";
    case ErrorCode::kParseFailed:
      return "PARSE_FAILED";
    case ErrorCode::kEnvironmentNotReady:
      return "ENVIRONMENT_NOT_READY";
  }
  common::ThrowInternalError(
      "ToString(ErrorCode)",
      fmt::format("unhandled value {}", static_cast<int>(code)));
}

auto ParseErrorCode(std::string_view text) -> std::optional<ErrorCode> {
  for (auto code :
       {ErrorCode::kPlaywrightNotSetup, ErrorCode::kBrowserLaunchFailed,
        ErrorCode::kConfigMissing, ErrorCode::kInvalidSuite,
        ErrorCode::kTimeout, ErrorCode::kUnknownError, ErrorCode::kParseFailed,
        ErrorCode::kEnvironmentNotReady}) {
    if (ToString(code) == text) {
      return code;
    }
  }
  return std::nullopt;
}

void RecountSuite(SuiteResult& suite) {
  suite.passed = 0;
  suite.failed = 0;
  suite.skipped = 0;
  suite.duration_ms = 0;
  for (const auto& test : suite.tests) {
    switch (test.status) {
      case TestStatus::kPassed:
        ++suite.passed;
        break;
      case TestStatus::kFailed:
        ++suite.failed;
        break;
      case TestStatus::kSkipped:
        ++suite.skipped;
        break;
    }
    suite.duration_ms += test.duration_ms;
  }
}

void RecomputeSummary(RunResult& result) {
  Summary summary;
  for (const auto& [id, suite] : result.suites) {
    summary.passed += suite.passed;
    summary.failed += suite.failed;
    summary.skipped += suite.skipped;
    summary.duration_ms += suite.duration_ms;
  }
  summary.total = summary.passed + summary.failed + summary.skipped;
  result.summary = summary;
}

auto ToJson(const StructuredError& error) -> nlohmann::json {
  return nlohmann::json{
      {"code", ToString(error.code)},
      {"message", error.message},
      {"hint", error.hint},
      {"raw", error.raw},
  };
}

auto ToJson(const RunResult& result) -> nlohmann::json {
  nlohmann::json suites = nlohmann::json::object();
  for (const auto& [id, suite] : result.suites) {
    nlohmann::json tests = nlohmann::json::array();
    for (const auto& test : suite.tests) {
      nlohmann::json entry{
          {"title", test.title},
          {"status", ToString(test.status)},
          {"duration", test.duration_ms},
      };
      if (test.error) {
        entry["error"] = *test.error;
      }
      tests.push_back(std::move(entry));
    }
    suites[id] = nlohmann::json{
        {"title", suite.title},
        {"tests", std::move(tests)},
        {"passed", suite.passed},
        {"failed", suite.failed},
        {"skipped", suite.skipped},
        {"duration", suite.duration_ms},
        {"status", suite.HasFailures() ? "failed" : "passed"},
    };
  }

  nlohmann::json json{
      {"suites", std::move(suites)},
      {"summary",
       {
           {"total", result.summary.total},
           {"passed", result.summary.passed},
           {"failed", result.summary.failed},
           {"skipped", result.summary.skipped},
           {"duration", result.summary.duration_ms},
       }},
      {"exitCode", result.exit_code},
  };
  if (result.ran_at) {
    json["ranAt"] = *result.ran_at;
  }
  if (result.error) {
    json["error"] = ToJson(*result.error);
  }
  return json;
}

auto RunResultFromJson(const nlohmann::json& json) -> Result<RunResult> {
  if (!json.is_object()) {
    return std::unexpected(
        Diagnostic::HostError("stored results are not a JSON object"));
  }

  RunResult result;
  try {
    if (auto it = json.find("suites"); it != json.end() && it->is_object()) {
      for (const auto& [id, suite_json] : it->items()) {
        SuiteResult suite;
        suite.title = suite_json.value("title", id);
        for (const auto& test_json :
             suite_json.value("tests", nlohmann::json::array())) {
          auto status =
              ParseTestStatus(test_json.at("status").get<std::string>());
          if (!status) {
            return std::unexpected(
                Diagnostic::HostError(
                    fmt::format(
                        "stored results: suite '{}' has a test with unknown "
                        "status",
                        id)));
          }
          TestResult test{
              .title = test_json.value("title", ""),
              .status = *status,
              .duration_ms = test_json.value("duration", int64_t{0}),
              .error = std::nullopt,
          };
          if (auto err = test_json.find("error");
              err != test_json.end() && err->is_string()) {
            test.error = err->get<std::string>();
          }
          suite.tests.push_back(std::move(test));
        }
        RecountSuite(suite);
        result.suites.emplace(id, std::move(suite));
      }
    }
    if (auto it = json.find("ranAt"); it != json.end() && it->is_string()) {
      result.ran_at = it->get<std::string>();
    }
    result.exit_code = json.value("exitCode", 0);
    if (auto it = json.find("error"); it != json.end() && it->is_object()) {
      result.error = StructuredError{
          .code = ParseErrorCode(it->value("code", ""))
                      .value_or(ErrorCode::kUnknownError),
          .message = it->value("message", ""),
          .hint = it->value("hint", ""),
          .raw = it->value("raw", ""),
      };
    }
  } catch (const nlohmann::json::exception& e) {
    return std::unexpected(
        Diagnostic::HostError(
            fmt::format("stored results are malformed: {}", e.what())));
  }

  RecomputeSummary(result);
  return result;
}

auto CurrentTimestamp() -> std::string {
  return fmt::format(
      "{:%Y-%m-%dT%H:%M:%S}+00:00", fmt::gmtime(std::time(nullptr)));
}

}  // namespace smoke::report
