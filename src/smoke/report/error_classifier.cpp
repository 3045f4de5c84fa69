#include "smoke/report/error_classifier.hpp"

#include <array>
#include <cstddef>
#include <string>
#include <string_view>

#include <fmt/core.h>

#include "smoke/common/string_utils.hpp"
#include "smoke/report/run_result.hpp"

namespace smoke::report {

namespace {

constexpr size_t kRawLimit = 500;

struct Signature {
  std::string_view pattern;
  std::string_view message;
  std::string_view hint;
  ErrorCode code;
};

constexpr std::string_view kInstallDepsHint =
    "Install browser dependencies with: sudo npx playwright install-deps "
    "chromium";

constexpr std::array<Signature, 11> kSignatures = {{
    {"browserType.launch", "Chromium browser could not be launched.",
     kInstallDepsHint, ErrorCode::kBrowserLaunchFailed},
    {"Failed to launch", "Chromium browser failed to launch.",
     "Run: smoke setup to reinstall the browser.",
     ErrorCode::kBrowserLaunchFailed},
    {"ENOENT", "Playwright or Node.js executable not found.",
     "Ensure Node.js is installed and run: smoke setup",
     ErrorCode::kPlaywrightNotSetup},
    {"Cannot find module", "Playwright dependencies are not installed.",
     "Run: smoke setup to install npm dependencies.",
     ErrorCode::kPlaywrightNotSetup},
    {"ETIMEDOUT", "Test timed out waiting for the page.",
     "The site may be slow or unresponsive. Check that it is running.",
     ErrorCode::kTimeout},
    {"Timeout", "Test exceeded the configured timeout.",
     "Increase runner.timeout in smoke.toml or check site performance.",
     ErrorCode::kTimeout},
    {"ECONNREFUSED", "Could not connect to the site.",
     "Ensure the site is running.", ErrorCode::kTimeout},
    {"net::ERR_CONNECTION_REFUSED", "Browser could not reach the site.",
     "Ensure the site is running and reachable from the runner.",
     ErrorCode::kTimeout},
    {".smoke-config.json", "Smoke test configuration file is missing.",
     "Run: smoke setup to generate the config.", ErrorCode::kConfigMissing},
    {"libnss3", "System library libnss3 is missing.", kInstallDepsHint,
     ErrorCode::kBrowserLaunchFailed},
    {"libatk", "System library libatk is missing.", kInstallDepsHint,
     ErrorCode::kBrowserLaunchFailed},
}};

auto FirstMessageLine(std::string_view text) -> std::string_view {
  while (!text.empty()) {
    auto eol = text.find('\n');
    std::string_view line = common::Trim(text.substr(0, eol));
    if (!line.empty() && !line.starts_with("at ")) {
      return line;
    }
    if (eol == std::string_view::npos) {
      break;
    }
    text.remove_prefix(eol + 1);
  }
  return {};
}

}  // namespace

auto Analyze(std::string_view raw_error, int /*exit_code*/)
    -> StructuredError {
  std::string clean = common::StripAnsi(raw_error);

  for (const auto& sig : kSignatures) {
    if (clean.find(sig.pattern) != std::string::npos) {
      return StructuredError{
          .code = sig.code,
          .message = std::string(sig.message),
          .hint = std::string(sig.hint),
          .raw = common::Truncate(clean, kRawLimit),
      };
    }
  }

  std::string_view first_line = FirstMessageLine(clean);
  return StructuredError{
      .code = ErrorCode::kUnknownError,
      .message = first_line.empty() ? "Playwright test execution failed."
                                    : std::string(first_line),
      .hint = "Check the raw error below. Run with verbose output: npx "
              "playwright test --debug",
      .raw = common::Truncate(clean, kRawLimit),
  };
}

auto FormatForCli(const StructuredError& error, bool include_raw)
    -> std::string {
  std::string out = fmt::format(
      "[{}] {}\n\nHint: {}", ToString(error.code), error.message, error.hint);
  if (include_raw && !error.raw.empty()) {
    out += fmt::format("\n\nDetails:\n{}", error.raw);
  }
  return out;
}

auto IsSetupError(ErrorCode code) -> bool {
  return code == ErrorCode::kPlaywrightNotSetup ||
         code == ErrorCode::kBrowserLaunchFailed ||
         code == ErrorCode::kConfigMissing;
}

}  // namespace smoke::report
