#include "smoke/runner/playwright.hpp"

#include <charconv>
#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

#include <fmt/core.h>
#include <fmt/ranges.h>
#include <spdlog/spdlog.h>

#include "smoke/common/constants.hpp"
#include "smoke/common/string_utils.hpp"
#include "smoke/common/subprocess.hpp"
#include "smoke/report/run_result.hpp"

namespace smoke::runner {

namespace fs = std::filesystem;

namespace {

constexpr std::chrono::seconds kProbeTimeout{10};
constexpr std::chrono::seconds kInstallTimeout{600};

auto RunStep(
    const std::vector<std::string>& argv, const fs::path& dir,
    bool stream_output) -> common::SubprocessResult {
  spdlog::info("running: {}", fmt::join(argv, " "));
  return common::RunSubprocess(
      argv, {
                .working_dir = dir,
                .env = {},
                .stdout_mode = stream_output ? common::StdoutMode::kInherit
                                             : common::StdoutMode::kDiscard,
                .timeout = kInstallTimeout,
            });
}

}  // namespace

auto ParseNodeMajor(std::string_view version_output) -> std::optional<int> {
  std::string_view text = common::Trim(version_output);
  if (text.starts_with('v')) {
    text.remove_prefix(1);
  }
  int major = 0;
  const char* end = text.data() + text.size();
  auto [ptr, ec] = std::from_chars(text.data(), end, major);
  if (ec != std::errc{} || ptr == text.data()) {
    return std::nullopt;
  }
  return major;
}

PlaywrightAdapter::PlaywrightAdapter(fs::path runner_dir, int min_node_major)
    : runner_dir_(std::move(runner_dir)), min_node_major_(min_node_major) {
}

auto PlaywrightAdapter::CheckEnvironment() const
    -> std::optional<report::StructuredError> {
  auto probe = common::RunSubprocess(
      {"node", "--version"},
      {.working_dir = std::nullopt,
       .env = {},
       .stdout_mode = common::StdoutMode::kCapture,
       .timeout = kProbeTimeout});
  if (probe.exit_code != 0) {
    return report::StructuredError{
        .code = report::ErrorCode::kEnvironmentNotReady,
        .message = "Node.js is not available.",
        .hint = fmt::format(
            "Install Node.js {} or newer and make sure `node` is on PATH.",
            min_node_major_),
        .raw = common::Truncate(probe.stderr_output, 500),
    };
  }

  auto major = ParseNodeMajor(probe.stdout_output);
  if (!major || *major < min_node_major_) {
    return report::StructuredError{
        .code = report::ErrorCode::kEnvironmentNotReady,
        .message = fmt::format(
            "Node.js {} or newer is required (found {}).", min_node_major_,
            common::Trim(probe.stdout_output)),
        .hint = "Upgrade Node.js, then run: smoke setup",
        .raw = "",
    };
  }

  if (!IsSetup()) {
    return report::StructuredError{
        .code = report::ErrorCode::kPlaywrightNotSetup,
        .message = "Playwright dependencies are not installed.",
        .hint = "Run: smoke setup to install npm dependencies.",
        .raw = "",
    };
  }
  return std::nullopt;
}

auto PlaywrightAdapter::IsSetup() const -> bool {
  return fs::is_directory(runner_dir_ / "node_modules");
}

auto PlaywrightAdapter::ArtifactPath() const -> fs::path {
  return runner_dir_ / kResultsFileName;
}

auto PlaywrightAdapter::Invoke(const Invocation& invocation)
    -> InvocationOutcome {
  std::vector<std::string> argv = {"npx", "playwright", "test"};
  if (invocation.target && !invocation.target->empty()) {
    argv.push_back(*invocation.target);
  }
  spdlog::debug(
      "invoking runner in {}: {}", runner_dir_.string(), fmt::join(argv, " "));

  auto result = common::RunSubprocess(
      argv, {
                .working_dir = runner_dir_,
                .env = invocation.env,
                .stdout_mode = invocation.stream_output
                                   ? common::StdoutMode::kInherit
                                   : common::StdoutMode::kDiscard,
                .timeout = invocation.timeout,
            });
  if (result.timed_out) {
    spdlog::warn(
        "runner exceeded {} s and was killed", invocation.timeout.count());
  }
  return InvocationOutcome{
      .exit_code = result.exit_code,
      .stderr_output = std::move(result.stderr_output),
      .timed_out = result.timed_out,
  };
}

PlaywrightRemediator::PlaywrightRemediator(
    fs::path runner_dir, bool stream_output)
    : runner_dir_(std::move(runner_dir)), stream_output_(stream_output) {
}

auto PlaywrightRemediator::Remediate() -> bool {
  auto npm = RunStep({"npm", "install"}, runner_dir_, stream_output_);
  if (npm.exit_code != 0) {
    spdlog::error(
        "npm install failed (exit {}): {}", npm.exit_code,
        common::Trim(npm.stderr_output));
    return false;
  }

  auto browser = RunStep(
      {"npx", "playwright", "install", "chromium"}, runner_dir_,
      stream_output_);
  if (browser.exit_code != 0) {
    spdlog::error(
        "browser install failed (exit {}): {}", browser.exit_code,
        common::Trim(browser.stderr_output));
    return false;
  }

  auto deps = RunStep(
      {"npx", "playwright", "install-deps", "chromium"}, runner_dir_,
      stream_output_);
  if (deps.exit_code != 0) {
    spdlog::warn(
        "could not install browser system libraries (exit {}); if launches "
        "keep failing run: sudo npx playwright install-deps chromium",
        deps.exit_code);
  }
  return true;
}

}  // namespace smoke::runner
