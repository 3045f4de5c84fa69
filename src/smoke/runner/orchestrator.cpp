#include "smoke/runner/orchestrator.hpp"

#include <chrono>
#include <filesystem>
#include <fstream>
#include <optional>
#include <sstream>
#include <string>
#include <system_error>
#include <utility>

#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include "smoke/common/constants.hpp"
#include "smoke/common/string_utils.hpp"
#include "smoke/report/error_classifier.hpp"
#include "smoke/report/result_parser.hpp"
#include "smoke/report/run_result.hpp"
#include "smoke/runner/staged_suite.hpp"

namespace smoke::runner {

namespace fs = std::filesystem;

ProcessOrchestrator::ProcessOrchestrator(
    RunnerAdapter& adapter, Remediator& remediator,
    const bridge::ConfigBridgeWriter& bridge,
    const suite::SuiteRegistry& registry, state::StateStore& state,
    std::chrono::seconds process_timeout)
    : adapter_(adapter),
      remediator_(remediator),
      bridge_(bridge),
      registry_(registry),
      state_(state),
      process_timeout_(process_timeout) {
}

auto ProcessOrchestrator::Run(const RunRequest& request) -> report::RunResult {
  if (auto env_error = adapter_.CheckEnvironment()) {
    spdlog::warn("runner environment not ready: {}", env_error->message);
    report::RunResult result;
    result.exit_code = kExitFailure;
    result.error = std::move(*env_error);
    return Persist(request, std::move(result));
  }

  // One initial attempt plus at most one retry after remediation.
  constexpr int kMaxAttempts = 2;
  for (int attempt_no = 1;; ++attempt_no) {
    auto attempt = Attempt(request, attempt_no < kMaxAttempts);
    if (!attempt.wants_retry) {
      return Persist(request, std::move(attempt.result));
    }

    spdlog::info("runner environment problem detected, remediating");
    if (!remediator_.Remediate()) {
      spdlog::warn("remediation failed, not retrying");
      return Persist(request, std::move(attempt.result));
    }
    spdlog::info("retrying run after remediation");
  }
}

auto ProcessOrchestrator::BuildInvocation(const RunRequest& request) const
    -> Invocation {
  Invocation invocation;
  invocation.timeout = process_timeout_;
  invocation.stream_output = request.options.verbose;
  if (request.options.parallel) {
    invocation.env["SMOKE_PARALLEL"] = "1";
  }
  if (request.options.verbose) {
    invocation.env["SMOKE_VERBOSE"] = "1";
  }
  if (request.options.html_path) {
    invocation.env["SMOKE_HTML_PATH"] = request.options.html_path->string();
  }
  return invocation;
}

auto ProcessOrchestrator::ReadArtifact() const -> std::string {
  std::ifstream in(adapter_.ArtifactPath());
  if (!in) {
    return "";
  }
  std::ostringstream buffer;
  buffer << in.rdbuf();
  return buffer.str();
}

auto ProcessOrchestrator::Attempt(const RunRequest& request, bool can_retry)
    -> AttemptResult {
  bridge_.WriteConfig(request.target_url, request.credentials);

  const fs::path artifact = adapter_.ArtifactPath();
  std::error_code ec;
  fs::remove(artifact, ec);
  if (ec) {
    spdlog::warn(
        "could not remove stale {}: {}", artifact.string(), ec.message());
  }

  Invocation invocation = BuildInvocation(request);
  std::optional<StagedSuite> staged;
  if (request.suite_id) {
    const std::string dash = common::DashCase(*request.suite_id);
    const fs::path& runner_dir = adapter_.RunnerDir();
    auto spec = registry_.GetSpecPath(*request.suite_id);
    if (spec && !IsWithin(*spec, runner_dir)) {
      fs::path staged_rel = fs::path(kRunnerSuitesDir) / dash;
      staged.emplace(*spec, runner_dir / staged_rel);
      if (!fs::is_directory(*spec)) {
        staged_rel /= spec->filename();
      }
      invocation.target = staged_rel.generic_string();
    } else if (spec) {
      invocation.target =
          spec->lexically_relative(runner_dir).generic_string();
    } else {
      invocation.target =
          (fs::path(kRunnerSuitesDir) / (dash + std::string(kSpecSuffix)))
              .generic_string();
    }
  }

  InvocationOutcome outcome = adapter_.Invoke(invocation);
  staged.reset();

  AttemptResult attempt;
  std::string artifact_text = ReadArtifact();

  if (common::Trim(artifact_text).empty() &&
      (outcome.exit_code != 0 || outcome.timed_out)) {
    auto error = report::Analyze(outcome.stderr_output, outcome.exit_code);
    bool launch_class = outcome.timed_out || report::IsSetupError(error.code);
    if (outcome.timed_out) {
      error.code = report::ErrorCode::kTimeout;
      error.message = fmt::format(
          "The runner did not finish within {} s.", process_timeout_.count());
      error.hint =
          "Raise runner.process_timeout in smoke.toml or check site "
          "performance.";
    }
    attempt.result.error = std::move(error);
    attempt.wants_retry = can_retry && launch_class;
  } else {
    attempt.result = report::ParseResults(artifact_text);
    if (auto launch_error = report::FindBrowserLaunchFailure(attempt.result)) {
      attempt.result.error = report::Analyze(*launch_error);
      attempt.wants_retry = can_retry;
    }
  }

  attempt.result.exit_code = outcome.exit_code;
  return attempt;
}

auto ProcessOrchestrator::Persist(
    const RunRequest& request, report::RunResult result) -> report::RunResult {
  result.ran_at = report::CurrentTimestamp();

  if (request.suite_id) {
    const std::string& id = *request.suite_id;
    if (!result.suites.contains(id) &&
        (!result.suites.empty() || !result.error)) {
      report::MergeSuitesInto(result, id);
    }

    report::RunResult merged = GetLastResults().value_or(report::RunResult{});
    if (auto it = result.suites.find(id); it != result.suites.end()) {
      merged.suites.insert_or_assign(id, std::move(it->second));
    } else {
      merged.suites.erase(id);
    }
    merged.ran_at = result.ran_at;
    merged.exit_code = result.exit_code;
    merged.error = std::move(result.error);
    result = std::move(merged);
  }

  report::RecomputeSummary(result);
  state_.Set(kStateLastResults, report::ToJson(result));
  state_.Set(kStateLastRun, *result.ran_at);
  return result;
}

auto ProcessOrchestrator::IsSetup() const -> bool {
  return adapter_.IsSetup();
}

auto ProcessOrchestrator::GetLastResults() const
    -> std::optional<report::RunResult> {
  auto stored = state_.Get(kStateLastResults);
  if (!stored) {
    return std::nullopt;
  }
  auto result = report::RunResultFromJson(*stored);
  if (!result) {
    spdlog::warn("ignoring stored results: {}", result.error().primary.message);
    return std::nullopt;
  }
  return *std::move(result);
}

auto ProcessOrchestrator::GetLastRunTime() const -> std::optional<std::string> {
  auto stored = state_.Get(kStateLastRun);
  if (!stored || !stored->is_string()) {
    return std::nullopt;
  }
  return stored->get<std::string>();
}

void ProcessOrchestrator::ClearLastResults() {
  state_.Delete(kStateLastResults);
}

}  // namespace smoke::runner
