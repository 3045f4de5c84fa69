#pragma once

#include <chrono>
#include <filesystem>
#include <map>
#include <optional>
#include <string>

#include "smoke/report/run_result.hpp"

namespace smoke::runner {

struct Invocation {
  // Spec file or directory argument, relative to the runner directory.
  // Empty runs everything the runner discovers.
  std::optional<std::string> target;
  // Behavior toggles (SMOKE_PARALLEL, SMOKE_VERBOSE, SMOKE_HTML_PATH).
  std::map<std::string, std::string> env;
  // Let runner output through to the terminal instead of discarding it.
  bool stream_output = false;
  std::chrono::seconds timeout{0};
};

struct InvocationOutcome {
  int exit_code = -1;
  std::string stderr_output;
  bool timed_out = false;
};

// Boundary to the external test runner. Results are not returned by
// Invoke(); the runner writes them to ArtifactPath().
class RunnerAdapter {
 public:
  RunnerAdapter() = default;
  virtual ~RunnerAdapter() = default;
  RunnerAdapter(const RunnerAdapter&) = delete;
  auto operator=(const RunnerAdapter&) -> RunnerAdapter& = delete;
  RunnerAdapter(RunnerAdapter&&) = delete;
  auto operator=(RunnerAdapter&&) -> RunnerAdapter& = delete;

  // nullopt when the runner can be started.
  [[nodiscard]] virtual auto CheckEnvironment() const
      -> std::optional<report::StructuredError> = 0;

  // Runner dependencies are installed.
  [[nodiscard]] virtual auto IsSetup() const -> bool = 0;

  [[nodiscard]] virtual auto RunnerDir() const
      -> const std::filesystem::path& = 0;

  [[nodiscard]] virtual auto ArtifactPath() const -> std::filesystem::path = 0;

  virtual auto Invoke(const Invocation& invocation) -> InvocationOutcome = 0;
};

}  // namespace smoke::runner
