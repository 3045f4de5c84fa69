#pragma once

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>

#include "smoke/bridge/config_bridge.hpp"
#include "smoke/report/run_result.hpp"
#include "smoke/runner/remediator.hpp"
#include "smoke/runner/runner_adapter.hpp"
#include "smoke/state/state_store.hpp"
#include "smoke/suite/suite_registry.hpp"

namespace smoke::runner {

struct RunOptions {
  bool parallel = false;  // Runner worker count only; suites stay sequential
  bool verbose = false;
  std::optional<std::filesystem::path> html_path;
};

struct RunRequest {
  std::optional<std::string> suite_id;  // nullopt runs everything
  std::optional<std::string> target_url;
  std::optional<bridge::RemoteCredentials> credentials;
  RunOptions options;
};

// Drives one runner invocation end to end: environment check, bridge file,
// spawn, parse, one remediation-and-retry, merge and persist.
//
// Not safe for overlapping calls: the bridge file, the results artifact and
// the persisted state are single well-known locations.
class ProcessOrchestrator {
 public:
  ProcessOrchestrator(
      RunnerAdapter& adapter, Remediator& remediator,
      const bridge::ConfigBridgeWriter& bridge,
      const suite::SuiteRegistry& registry, state::StateStore& state,
      std::chrono::seconds process_timeout);

  // Test-domain failures are reported through the result, never thrown.
  // Filesystem errors writing the bridge file or staging a suite propagate.
  auto Run(const RunRequest& request) -> report::RunResult;

  [[nodiscard]] auto IsSetup() const -> bool;
  [[nodiscard]] auto GetLastResults() const -> std::optional<report::RunResult>;
  [[nodiscard]] auto GetLastRunTime() const -> std::optional<std::string>;
  void ClearLastResults();

 private:
  struct AttemptResult {
    report::RunResult result;
    bool wants_retry = false;
  };

  auto Attempt(const RunRequest& request, bool can_retry) -> AttemptResult;
  [[nodiscard]] auto BuildInvocation(const RunRequest& request) const
      -> Invocation;
  [[nodiscard]] auto ReadArtifact() const -> std::string;
  auto Persist(const RunRequest& request, report::RunResult result)
      -> report::RunResult;

  RunnerAdapter& adapter_;
  Remediator& remediator_;
  const bridge::ConfigBridgeWriter& bridge_;
  const suite::SuiteRegistry& registry_;
  state::StateStore& state_;
  std::chrono::seconds process_timeout_;
};

}  // namespace smoke::runner
