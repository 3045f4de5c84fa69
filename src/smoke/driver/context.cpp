#include "context.hpp"

#include <cstdlib>
#include <expected>
#include <filesystem>
#include <memory>
#include <optional>
#include <utility>

#include <spdlog/spdlog.h>

#include "smoke/config/project_config.hpp"
#include "smoke/suite/suite_declarations.hpp"

namespace smoke::driver {

Context::Context(config::ProjectConfig cfg, bool verbose)
    : project(std::move(cfg)),
      detector(project.capabilities, project.suite_metadata),
      registry(
          detector, project.runner_dir,
          suite::DiscoverDeclarations(project.providers)),
      store(project.state_path),
      secrets(store),
      bridge_writer(project, registry, secrets),
      adapter(project.runner_dir, project.min_node_major),
      remediator(project.runner_dir, verbose),
      orchestrator(
          adapter, remediator, bridge_writer, registry, store,
          project.process_timeout) {
}

auto LoadContext(bool verbose) -> Result<std::unique_ptr<Context>> {
  auto config = config::LoadProjectConfig(std::filesystem::current_path());
  if (!config) {
    return std::unexpected(config.error());
  }
  spdlog::debug(
      "project root {}, runner {}", config->root_dir.string(),
      config->runner_dir.string());
  return std::make_unique<Context>(*std::move(config), verbose);
}

auto RemoteCredentialsFromEnv() -> std::optional<bridge::RemoteCredentials> {
  const char* user = std::getenv("SMOKE_REMOTE_USER");
  const char* pass = std::getenv("SMOKE_REMOTE_PASS");
  if (user == nullptr || *user == '\0' || pass == nullptr || *pass == '\0') {
    return std::nullopt;
  }
  return bridge::RemoteCredentials{.user = user, .secret = pass};
}

}  // namespace smoke::driver
