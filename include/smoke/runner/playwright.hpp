#pragma once

#include <filesystem>
#include <optional>
#include <string_view>

#include "smoke/report/run_result.hpp"
#include "smoke/runner/remediator.hpp"
#include "smoke/runner/runner_adapter.hpp"

namespace smoke::runner {

// Major version from `node --version` output ("v20.11.1" -> 20).
auto ParseNodeMajor(std::string_view version_output) -> std::optional<int>;

// Runs `npx playwright test [target]` inside the runner directory.
class PlaywrightAdapter final : public RunnerAdapter {
 public:
  PlaywrightAdapter(std::filesystem::path runner_dir, int min_node_major);

  [[nodiscard]] auto CheckEnvironment() const
      -> std::optional<report::StructuredError> override;
  [[nodiscard]] auto IsSetup() const -> bool override;
  [[nodiscard]] auto RunnerDir() const
      -> const std::filesystem::path& override {
    return runner_dir_;
  }
  [[nodiscard]] auto ArtifactPath() const -> std::filesystem::path override;
  auto Invoke(const Invocation& invocation) -> InvocationOutcome override;

 private:
  std::filesystem::path runner_dir_;
  int min_node_major_;
};

// npm install, then the Chromium download, then its system libraries. The
// last step needs root and is allowed to fail.
class PlaywrightRemediator final : public Remediator {
 public:
  PlaywrightRemediator(std::filesystem::path runner_dir, bool stream_output);

  auto Remediate() -> bool override;

 private:
  std::filesystem::path runner_dir_;
  bool stream_output_;
};

}  // namespace smoke::runner
