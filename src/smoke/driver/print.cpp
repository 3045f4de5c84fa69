#include "print.hpp"

#include <cstdint>
#include <cstdio>
#include <string>

#include <fmt/color.h>
#include <fmt/core.h>

#include "smoke/common/diagnostic.hpp"
#include "smoke/common/string_utils.hpp"
#include "smoke/report/error_classifier.hpp"
#include "smoke/report/run_result.hpp"

namespace smoke::driver {

namespace {

constexpr auto kToolColor = fmt::terminal_color::white;
constexpr auto kToolStyle = fmt::fg(kToolColor) | fmt::emphasis::bold;
constexpr auto kPassStyle = fmt::fg(fmt::terminal_color::bright_green);
constexpr auto kFailStyle =
    fmt::fg(fmt::terminal_color::bright_red) | fmt::emphasis::bold;
constexpr auto kSkipStyle = fmt::fg(fmt::terminal_color::bright_yellow);
constexpr size_t kInlineErrorLimit = 200;

auto DiagKindToString(DiagKind kind) -> const char* {
  switch (kind) {
    case DiagKind::kError:
    case DiagKind::kHostError:
      return "error:";
    case DiagKind::kWarning:
      return "warning:";
    case DiagKind::kNote:
      return "note:";
  }
  return "error:";
}

auto DiagKindToStyle(DiagKind kind) -> fmt::text_style {
  switch (kind) {
    case DiagKind::kError:
    case DiagKind::kHostError:
      return fmt::fg(fmt::terminal_color::bright_red) | fmt::emphasis::bold;
    case DiagKind::kWarning:
      return fmt::fg(fmt::terminal_color::bright_yellow) | fmt::emphasis::bold;
    case DiagKind::kNote:
      return fmt::fg(fmt::terminal_color::bright_cyan) | fmt::emphasis::bold;
  }
  return fmt::fg(fmt::terminal_color::bright_red) | fmt::emphasis::bold;
}

void PrintTagged(DiagKind kind, const std::string& message) {
  fmt::print(
      stderr, "{}: {} {}\n", fmt::styled("smoke", kToolStyle),
      fmt::styled(DiagKindToString(kind), DiagKindToStyle(kind)),
      fmt::styled(message, fmt::emphasis::bold));
}

auto FormatSeconds(int64_t ms) -> std::string {
  return fmt::format("{:.1f}s", static_cast<double>(ms) / 1000.0);
}

}  // namespace

void PrintError(const std::string& message) {
  PrintTagged(DiagKind::kError, message);
}

void PrintWarning(const std::string& message) {
  PrintTagged(DiagKind::kWarning, message);
}

void PrintNote(const std::string& message) {
  PrintTagged(DiagKind::kNote, message);
}

void PrintDiagnostic(const Diagnostic& diag) {
  PrintTagged(diag.primary.kind, diag.primary.message);
  for (const auto& note : diag.notes) {
    PrintTagged(note.kind, note.message);
  }
}

void PrintRunError(const report::StructuredError& error, bool verbose) {
  fmt::print(
      stderr, "{}\n",
      fmt::styled(report::FormatForCli(error, verbose), kFailStyle));
}

void PrintSuiteLine(
    const std::string& label, const report::SuiteResult& suite) {
  if (suite.HasFailures()) {
    fmt::print(
        "  {} {}  {} passed, {} failed, {} skipped ({})\n",
        fmt::styled("FAIL", kFailStyle), label, suite.passed, suite.failed,
        suite.skipped, FormatSeconds(suite.duration_ms));
    for (const auto& test : suite.tests) {
      if (test.status != report::TestStatus::kFailed) {
        continue;
      }
      fmt::print("      - {}\n", test.title);
      if (test.error) {
        fmt::print(
            "        {}\n",
            common::Truncate(
                common::StripAnsi(common::Trim(*test.error)),
                kInlineErrorLimit));
      }
    }
    return;
  }
  fmt::print(
      "  {} {}  {} passed, {} skipped ({})\n", fmt::styled("PASS", kPassStyle),
      label, suite.passed, suite.skipped, FormatSeconds(suite.duration_ms));
}

void PrintSuiteTests(const report::SuiteResult& suite) {
  for (const auto& test : suite.tests) {
    switch (test.status) {
      case report::TestStatus::kPassed:
        fmt::print(
            "  {} {} ({})\n", fmt::styled("PASS", kPassStyle), test.title,
            FormatSeconds(test.duration_ms));
        break;
      case report::TestStatus::kSkipped:
        fmt::print("  {} {}\n", fmt::styled("SKIP", kSkipStyle), test.title);
        break;
      case report::TestStatus::kFailed:
        fmt::print(
            "  {} {} ({})\n", fmt::styled("FAIL", kFailStyle), test.title,
            FormatSeconds(test.duration_ms));
        if (test.error) {
          fmt::print("        {}\n", common::StripAnsi(*test.error));
        }
        break;
    }
  }
}

void PrintSummary(const report::Summary& summary) {
  auto style = summary.failed > 0 ? kFailStyle : kPassStyle;
  fmt::print(
      "\n{}\n",
      fmt::styled(
          fmt::format(
              "{} tests: {} passed, {} failed, {} skipped ({})", summary.total,
              summary.passed, summary.failed, summary.skipped,
              FormatSeconds(summary.duration_ms)),
          style));
}

}  // namespace smoke::driver
