#include "smoke/report/junit_exporter.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <string_view>
#include <system_error>

#include <fmt/core.h>
#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include "smoke/common/string_utils.hpp"
#include "smoke/report/run_result.hpp"

namespace smoke::report {

namespace {

constexpr size_t kMessageAttributeLimit = 200;

auto FormatSeconds(int64_t milliseconds) -> std::string {
  return fmt::format("{:.3f}", static_cast<double>(milliseconds) / 1000.0);
}

// "]]>" cannot appear inside a CDATA section; split it across two sections.
auto Cdata(std::string_view text) -> std::string {
  std::string body;
  size_t pos = 0;
  while (true) {
    auto end = text.find("]]>", pos);
    if (end == std::string_view::npos) {
      body.append(text.substr(pos));
      break;
    }
    body.append(text.substr(pos, end - pos));
    body.append("]]]]><![CDATA[>");
    pos = end + 3;
  }
  return fmt::format("<![CDATA[{}]]>", body);
}

void AppendTestCase(
    fmt::memory_buffer& out, const std::string& suite_id,
    const TestResult& test) {
  auto open = fmt::format(
      "    <testcase name=\"{}\" classname=\"smoke.{}\" time=\"{}\"",
      common::EscapeXml(SanitizeMessage(test.title)),
      common::EscapeXml(suite_id), FormatSeconds(test.duration_ms));

  switch (test.status) {
    case TestStatus::kPassed:
      fmt::format_to(std::back_inserter(out), "{}/>\n", open);
      break;
    case TestStatus::kFailed: {
      std::string message =
          test.error ? SanitizeMessage(*test.error) : "Test failed";
      fmt::format_to(
          std::back_inserter(out),
          "{}>\n      <failure message=\"{}\" type=\"AssertionError\">",
          open,
          common::EscapeXml(common::Truncate(message, kMessageAttributeLimit)));
      if (test.error && !test.error->empty()) {
        fmt::format_to(std::back_inserter(out), "{}", Cdata(message));
      }
      fmt::format_to(std::back_inserter(out), "</failure>\n    </testcase>\n");
      break;
    }
    case TestStatus::kSkipped:
      fmt::format_to(
          std::back_inserter(out),
          "{}>\n      <skipped message=\"Test was skipped\"/>\n"
          "    </testcase>\n",
          open);
      break;
  }
}

}  // namespace

auto SanitizeMessage(std::string_view message) -> std::string {
  return common::RemoveInvalidXmlChars(common::StripAnsi(message));
}

auto GenerateJUnit(const RunResult& result, std::string_view name)
    -> std::string {
  fmt::memory_buffer out;
  auto it = std::back_inserter(out);

  fmt::format_to(it, "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n");
  fmt::format_to(
      it,
      "<testsuites name=\"{}\" tests=\"{}\" failures=\"{}\" errors=\"0\" "
      "skipped=\"{}\" time=\"{}\" timestamp=\"{}\">\n",
      common::EscapeXml(name), result.summary.total, result.summary.failed,
      result.summary.skipped, FormatSeconds(result.summary.duration_ms),
      common::EscapeXml(result.ran_at.value_or(CurrentTimestamp())));

  for (const auto& [id, suite] : result.suites) {
    const std::string& title = suite.title.empty() ? id : suite.title;
    fmt::format_to(
        it,
        "  <testsuite name=\"{}\" tests=\"{}\" failures=\"{}\" errors=\"0\" "
        "skipped=\"{}\" time=\"{}\">\n",
        common::EscapeXml(SanitizeMessage(title)),
        suite.passed + suite.failed + suite.skipped, suite.failed,
        suite.skipped, FormatSeconds(suite.duration_ms));
    for (const auto& test : suite.tests) {
      AppendTestCase(out, id, test);
    }
    fmt::format_to(it, "  </testsuite>\n");
  }

  fmt::format_to(it, "</testsuites>\n");
  return fmt::to_string(out);
}

auto WriteJUnitFile(
    const RunResult& result, const std::filesystem::path& path,
    std::string_view name) -> bool {
  std::error_code ec;
  if (path.has_parent_path()) {
    std::filesystem::create_directories(path.parent_path(), ec);
    if (ec) {
      spdlog::error(
          "cannot create {}: {}", path.parent_path().string(), ec.message());
      return false;
    }
  }

  std::ofstream out(path, std::ios::trunc);
  if (!out) {
    spdlog::error("cannot open {} for writing", path.string());
    return false;
  }
  out << GenerateJUnit(result, name);
  return static_cast<bool>(out);
}

}  // namespace smoke::report
