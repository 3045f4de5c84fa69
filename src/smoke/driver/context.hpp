#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include <vector>

#include "smoke/bridge/config_bridge.hpp"
#include "smoke/common/diagnostic.hpp"
#include "smoke/config/project_config.hpp"
#include "smoke/runner/orchestrator.hpp"
#include "smoke/runner/playwright.hpp"
#include "smoke/state/secret_store.hpp"
#include "smoke/state/state_store.hpp"
#include "smoke/suite/feature_detector.hpp"
#include "smoke/suite/suite_registry.hpp"

namespace smoke::driver {

// Every service a command needs, wired from one ProjectConfig. Members hold
// references to each other, so a Context never moves.
class Context {
 public:
  Context(config::ProjectConfig project, bool verbose);

  Context(const Context&) = delete;
  auto operator=(const Context&) -> Context& = delete;
  Context(Context&&) = delete;
  auto operator=(Context&&) -> Context& = delete;
  ~Context() = default;

  config::ProjectConfig project;
  suite::ConfiguredFeatureDetector detector;
  suite::SuiteRegistry registry;
  state::JsonFileStateStore store;
  state::StateSecretStore secrets;
  bridge::ConfigBridgeWriter bridge_writer;
  runner::PlaywrightAdapter adapter;
  runner::PlaywrightRemediator remediator;
  runner::ProcessOrchestrator orchestrator;
};

// Load smoke.toml (or the defaults) from the working directory and build a
// Context around it.
auto LoadContext(bool verbose) -> Result<std::unique_ptr<Context>>;

// SMOKE_REMOTE_USER / SMOKE_REMOTE_PASS. Present only when both are set.
auto RemoteCredentialsFromEnv() -> std::optional<bridge::RemoteCredentials>;

}  // namespace smoke::driver
