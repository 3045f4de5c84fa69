#include "smoke/report/result_parser.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "smoke/common/constants.hpp"
#include "smoke/common/string_utils.hpp"
#include "smoke/report/run_result.hpp"
#include "smoke/suite/suite_registry.hpp"

namespace smoke::report {

namespace {

constexpr size_t kRawExcerptLength = 2000;

auto ParseFailure(std::string_view input) -> RunResult {
  RunResult result;
  result.error = StructuredError{
      .code = ErrorCode::kParseFailed,
      .message = "Failed to parse Playwright output.",
      .hint = "Check that the runner wrote results.json. Run with --verbose "
              "to see the runner output.",
      .raw = std::string(common::Utf8Prefix(input, kRawExcerptLength)),
  };
  return result;
}

auto Severity(TestStatus status) -> int {
  switch (status) {
    case TestStatus::kPassed:
      return 0;
    case TestStatus::kSkipped:
      return 1;
    case TestStatus::kFailed:
      return 2;
  }
  return 0;
}

// Reporter fields are read leniently: a missing key or one of another type
// yields the fallback.
auto StringField(
    const nlohmann::json& object, const char* key, std::string_view fallback)
    -> std::string {
  auto it = object.find(key);
  if (it == object.end() || !it->is_string()) {
    return std::string(fallback);
  }
  return it->get<std::string>();
}

auto AttemptStatus(std::string_view status) -> std::optional<TestStatus> {
  if (status == "timedOut" || status == "interrupted") {
    return TestStatus::kFailed;
  }
  return ParseTestStatus(status);
}

auto AttemptError(const nlohmann::json& attempt) -> std::optional<std::string> {
  auto it = attempt.find("error");
  if (it == attempt.end()) {
    return std::nullopt;
  }
  if (it->is_string()) {
    return it->get<std::string>();
  }
  if (it->is_object()) {
    if (auto msg = it->find("message"); msg != it->end() && msg->is_string()) {
      return msg->get<std::string>();
    }
  }
  return std::nullopt;
}

void FlattenSpecs(
    const nlohmann::json& suite, std::vector<const nlohmann::json*>& out) {
  if (auto specs = suite.find("specs");
      specs != suite.end() && specs->is_array()) {
    for (const auto& spec : *specs) {
      if (spec.is_object()) {
        out.push_back(&spec);
      }
    }
  }
  if (auto children = suite.find("suites");
      children != suite.end() && children->is_array()) {
    for (const auto& child : *children) {
      if (child.is_object()) {
        FlattenSpecs(child, out);
      }
    }
  }
}

auto ParseSpec(const nlohmann::json& spec) -> TestResult {
  TestResult test{
      .title = StringField(spec, "title", "Unknown test"),
      .status = TestStatus::kPassed,
      .duration_ms = 0,
      .error = std::nullopt,
  };

  auto tests = spec.find("tests");
  if (tests == spec.end() || !tests->is_array()) {
    return test;
  }
  for (const auto& run : *tests) {
    auto results = run.find("results");
    if (results == run.end() || !results->is_array()) {
      continue;
    }
    for (const auto& attempt : *results) {
      if (!attempt.is_object()) {
        continue;
      }
      if (auto d = attempt.find("duration");
          d != attempt.end() && d->is_number()) {
        test.duration_ms += d->get<int64_t>();
      }
      auto status = AttemptStatus(StringField(attempt, "status", ""));
      if (!status) {
        continue;
      }
      if (*status == TestStatus::kFailed) {
        if (auto err = AttemptError(attempt)) {
          test.error = std::move(err);
        }
      }
      if (Severity(*status) > Severity(test.status)) {
        test.status = *status;
      }
    }
  }
  return test;
}

}  // namespace

auto ResolveSuiteId(std::string_view title) -> std::string {
  std::string_view name = common::Trim(title);
  if (auto slash = name.find_last_of('/'); slash != std::string_view::npos) {
    name = name.substr(slash + 1);
  }

  for (const auto& builtin : suite::BuiltInSuites()) {
    std::string dash = common::DashCase(builtin.id);
    if (name == builtin.id || name == dash || name == builtin.label ||
        name == dash + std::string(kSpecSuffix)) {
      return std::string(builtin.id);
    }
  }

  if (name.ends_with(kSpecSuffix) && name.size() > kSpecSuffix.size()) {
    return common::UnderscoreCase(
        name.substr(0, name.size() - kSpecSuffix.size()));
  }

  auto slug = common::Slugify(title);
  return slug.empty() ? "unknown" : slug;
}

auto ParseResults(std::string_view json_text) -> RunResult {
  nlohmann::json data;
  try {
    data = nlohmann::json::parse(json_text);
  } catch (const nlohmann::json::parse_error& e) {
    spdlog::debug("runner report is not valid JSON: {}", e.what());
    return ParseFailure(json_text);
  }
  if (!data.is_object() || data.empty()) {
    return ParseFailure(json_text);
  }

  RunResult result;
  try {
    auto suites = data.find("suites");
    if (suites != data.end() && suites->is_array()) {
      for (const auto& pw_suite : *suites) {
        if (!pw_suite.is_object()) {
          continue;
        }
        std::string title = StringField(pw_suite, "title", "unknown");
        std::string id = ResolveSuiteId(title);

        std::vector<const nlohmann::json*> specs;
        FlattenSpecs(pw_suite, specs);

        auto [it, inserted] = result.suites.try_emplace(id);
        SuiteResult& suite = it->second;
        if (inserted) {
          suite.title = title;
        }
        for (const auto* spec : specs) {
          suite.tests.push_back(ParseSpec(*spec));
        }
        RecountSuite(suite);
      }
    }
  } catch (const nlohmann::json::exception& e) {
    spdlog::debug("runner report has an unexpected shape: {}", e.what());
    return ParseFailure(json_text);
  }

  RecomputeSummary(result);
  return result;
}

void MergeSuitesInto(RunResult& result, const std::string& target_id) {
  SuiteResult merged;
  merged.title = target_id;
  for (auto& [id, suite] : result.suites) {
    for (auto& test : suite.tests) {
      merged.tests.push_back(std::move(test));
    }
  }
  RecountSuite(merged);
  result.suites.clear();
  result.suites.emplace(target_id, std::move(merged));
  RecomputeSummary(result);
}

auto FindBrowserLaunchFailure(const RunResult& result)
    -> std::optional<std::string> {
  for (const auto& [id, suite] : result.suites) {
    for (const auto& test : suite.tests) {
      if (test.status == TestStatus::kFailed && test.error &&
          test.error->find("browserType.launch") != std::string::npos) {
        return test.error;
      }
    }
  }
  return std::nullopt;
}

}  // namespace smoke::report
