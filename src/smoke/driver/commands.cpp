#include "commands.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include <argparse/argparse.hpp>
#include <fmt/core.h>
#include <fmt/ranges.h>
#include <spdlog/spdlog.h>

#include "context.hpp"
#include "print.hpp"
#include "smoke/common/constants.hpp"
#include "smoke/config/project_config.hpp"
#include "smoke/report/error_classifier.hpp"
#include "smoke/report/junit_exporter.hpp"
#include "smoke/report/run_result.hpp"
#include "smoke/runner/orchestrator.hpp"
#include "smoke/suite/suite_definition.hpp"

namespace smoke::driver {
namespace {

namespace fs = std::filesystem;

// Suites in display order: by weight, then id.
auto SortedSuites(const std::map<std::string, suite::SuiteDefinition>& suites)
    -> std::vector<const suite::SuiteDefinition*> {
  std::vector<const suite::SuiteDefinition*> out;
  out.reserve(suites.size());
  for (const auto& [id, def] : suites) {
    out.push_back(&def);
  }
  std::ranges::stable_sort(out, [](const auto* a, const auto* b) {
    return a->weight < b->weight;
  });
  return out;
}

// Run remediation when the runner has no dependencies installed yet.
auto EnsureSetup(Context& ctx) -> bool {
  if (ctx.orchestrator.IsSetup()) {
    return true;
  }
  PrintNote("runner dependencies are missing, running setup first");
  if (!ctx.remediator.Remediate()) {
    PrintError("setup failed");
    PrintNote("run `smoke setup` with --verbose output to see the cause");
    return false;
  }
  return true;
}

auto ExitCodeFor(const report::RunResult& result) -> int {
  if (result.error && (report::IsSetupError(result.error->code) ||
                       result.error->code ==
                           report::ErrorCode::kEnvironmentNotReady)) {
    return kExitSetupRequired;
  }
  if (result.error || result.summary.failed > 0) {
    return kExitFailure;
  }
  return kExitSuccess;
}

void EnableVerboseLogging(bool verbose) {
  if (verbose) {
    spdlog::set_level(spdlog::level::debug);
  }
}

auto ReadRunOptions(const argparse::ArgumentParser& cmd)
    -> runner::RunOptions {
  runner::RunOptions options;
  options.verbose = cmd.get<bool>("--verbose");
  options.parallel = cmd.get<bool>("--parallel");
  if (auto html = cmd.present<std::string>("--html")) {
    options.html_path = fs::absolute(*html);
  }
  return options;
}

}  // namespace

auto RunCommand(const argparse::ArgumentParser& cmd) -> int {
  bool verbose = cmd.get<bool>("--verbose");
  bool quick = cmd.get<bool>("--quick");
  EnableVerboseLogging(verbose);

  auto ctx = LoadContext(verbose);
  if (!ctx) {
    PrintDiagnostic(ctx.error());
    return kExitFailure;
  }
  Context& context = **ctx;

  if (!EnsureSetup(context)) {
    return kExitSetupRequired;
  }
  context.orchestrator.ClearLastResults();

  std::vector<const suite::SuiteDefinition*> selected;
  auto suites = context.registry.Detect();
  for (const auto* def : SortedSuites(suites)) {
    if (!def->detected || !context.project.IsSuiteEnabled(def->id)) {
      continue;
    }
    if (quick &&
        std::ranges::find(context.project.quick_suites, def->id) ==
            context.project.quick_suites.end()) {
      continue;
    }
    selected.push_back(def);
  }
  if (selected.empty()) {
    PrintWarning("no suites to run");
    return kExitSuccess;
  }

  runner::RunRequest request{
      .suite_id = std::nullopt,
      .target_url = cmd.present<std::string>("--target"),
      .credentials = RemoteCredentialsFromEnv(),
      .options = ReadRunOptions(cmd),
  };
  if (request.target_url) {
    fmt::print("Running smoke tests against {}\n", *request.target_url);
  }

  report::RunResult last;
  bool any_error = false;
  for (const auto* def : selected) {
    request.suite_id = def->id;
    last = context.orchestrator.Run(request);
    if (last.error) {
      any_error = true;
      fmt::print("  {}\n", def->label);
      PrintRunError(*last.error, verbose);
      if (ExitCodeFor(last) == kExitSetupRequired) {
        break;
      }
      continue;
    }
    if (auto it = last.suites.find(def->id); it != last.suites.end()) {
      PrintSuiteLine(def->label, it->second);
    } else {
      PrintWarning(fmt::format("suite '{}' reported no tests", def->id));
    }
  }
  PrintSummary(last.summary);

  std::optional<fs::path> junit_path;
  if (auto path = cmd.present<std::string>("--junit")) {
    junit_path = fs::absolute(*path);
  } else if (context.project.junit_path) {
    junit_path = context.project.junit_path;
  }
  if (junit_path) {
    if (report::WriteJUnitFile(last, *junit_path)) {
      fmt::print("JUnit report written to {}\n", junit_path->string());
    } else {
      PrintError(
          fmt::format(
              "could not write JUnit report to {}", junit_path->string()));
      any_error = true;
    }
  }

  int exit_code = ExitCodeFor(last);
  if (exit_code == kExitSuccess && any_error) {
    return kExitFailure;
  }
  return exit_code;
}

auto SuiteCommand(const argparse::ArgumentParser& cmd) -> int {
  auto id = cmd.get<std::string>("id");
  bool verbose = cmd.get<bool>("--verbose");
  EnableVerboseLogging(verbose);

  auto ctx = LoadContext(verbose);
  if (!ctx) {
    PrintDiagnostic(ctx.error());
    return kExitFailure;
  }
  Context& context = **ctx;

  auto suites = context.registry.Detect();
  auto it = suites.find(id);
  if (it == suites.end()) {
    std::vector<std::string> available;
    for (const auto& [suite_id, def] : suites) {
      if (def.detected) {
        available.push_back(suite_id);
      }
    }
    PrintDiagnostic(
        Diagnostic::Error(fmt::format("unknown suite '{}'", id))
            .WithNote(
                fmt::format(
                    "available suites: {}", fmt::join(available, ", "))));
    return kExitFailure;
  }
  if (!it->second.detected) {
    PrintError(fmt::format("suite '{}' is not available on this site", id));
    PrintNote("add the capability it needs to [site] capabilities");
    return kExitFailure;
  }
  if (!context.project.IsSuiteEnabled(id)) {
    PrintWarning(fmt::format("suite '{}' is disabled in smoke.toml", id));
  }

  if (!EnsureSetup(context)) {
    return kExitSetupRequired;
  }

  auto result = context.orchestrator.Run({
      .suite_id = id,
      .target_url = cmd.present<std::string>("--target"),
      .credentials = RemoteCredentialsFromEnv(),
      .options = {.parallel = false, .verbose = verbose, .html_path = {}},
  });

  fmt::print("{}\n", it->second.label);
  if (result.error) {
    PrintRunError(*result.error, verbose);
    return ExitCodeFor(result);
  }
  if (auto suite = result.suites.find(id); suite != result.suites.end()) {
    PrintSuiteTests(suite->second);
    PrintSummary(
        report::Summary{
            .total = static_cast<int>(suite->second.tests.size()),
            .passed = suite->second.passed,
            .failed = suite->second.failed,
            .skipped = suite->second.skipped,
            .duration_ms = suite->second.duration_ms,
        });
    return suite->second.HasFailures() ? kExitFailure : kExitSuccess;
  }
  PrintWarning(fmt::format("suite '{}' reported no tests", id));
  return kExitSuccess;
}

auto ListCommand(const argparse::ArgumentParser& /*cmd*/) -> int {
  auto ctx = LoadContext(false);
  if (!ctx) {
    PrintDiagnostic(ctx.error());
    return kExitFailure;
  }
  Context& context = **ctx;

  auto suites = context.registry.Detect();
  for (const auto* def : SortedSuites(suites)) {
    std::string status = "ready";
    if (!def->detected) {
      status = "not detected";
    } else if (!context.project.IsSuiteEnabled(def->id)) {
      status = "disabled";
    }
    std::string spec = def->spec_locator.empty()
                           ? std::string("-")
                           : def->spec_locator.string();
    fmt::print(
        "{:<20} {:<24} {:<13} {:<9} {}\n", def->id, def->label, status,
        suite::ToString(def->origin), spec);
  }
  return kExitSuccess;
}

auto StatusCommand(const argparse::ArgumentParser& /*cmd*/) -> int {
  auto ctx = LoadContext(false);
  if (!ctx) {
    PrintDiagnostic(ctx.error());
    return kExitFailure;
  }
  Context& context = **ctx;

  fmt::print(
      "Runner: {} ({})\n", context.project.runner_dir.string(),
      context.orchestrator.IsSetup() ? "installed" : "not set up");

  auto last = context.orchestrator.GetLastResults();
  if (!last) {
    fmt::print("No results yet. Run: smoke run\n");
    return kExitSuccess;
  }
  if (auto ran = context.orchestrator.GetLastRunTime()) {
    fmt::print("Last run: {}\n", *ran);
  }

  auto suites = context.registry.Detect();
  for (const auto& [id, suite] : last->suites) {
    auto def = suites.find(id);
    PrintSuiteLine(def != suites.end() ? def->second.label : id, suite);
  }
  if (last->error) {
    PrintRunError(*last->error, false);
  }
  PrintSummary(last->summary);
  return ExitCodeFor(*last);
}

auto SetupCommand(const argparse::ArgumentParser& cmd) -> int {
  bool verbose = cmd.get<bool>("--verbose");
  EnableVerboseLogging(verbose);

  auto ctx = LoadContext(verbose);
  if (!ctx) {
    PrintDiagnostic(ctx.error());
    return kExitFailure;
  }
  Context& context = **ctx;

  if (auto password = cmd.present<std::string>("--bot-password")) {
    context.secrets.SetBotPassword(*password);
    fmt::print("Stored the {} password\n", kBotUsername);
  }

  if (auto env_error = context.adapter.CheckEnvironment();
      env_error &&
      env_error->code == report::ErrorCode::kEnvironmentNotReady) {
    PrintRunError(*env_error, verbose);
    return kExitSetupRequired;
  }

  fmt::print(
      "Installing runner dependencies in {}\n",
      context.project.runner_dir.string());
  if (!context.remediator.Remediate()) {
    PrintError("setup failed");
    return kExitSetupRequired;
  }

  auto bridge_path =
      context.bridge_writer.WriteConfig(std::nullopt, std::nullopt);
  fmt::print("Wrote {}\n", bridge_path.string());
  return kExitSuccess;
}

auto ReportCommand(const argparse::ArgumentParser& cmd) -> int {
  auto ctx = LoadContext(false);
  if (!ctx) {
    PrintDiagnostic(ctx.error());
    return kExitFailure;
  }
  Context& context = **ctx;

  fs::path path;
  if (auto arg = cmd.present<std::string>("path")) {
    path = fs::absolute(*arg);
  } else if (context.project.junit_path) {
    path = *context.project.junit_path;
  } else {
    PrintError("no output path given and no [report] junit in smoke.toml");
    return kExitFailure;
  }

  auto last = context.orchestrator.GetLastResults();
  if (!last) {
    PrintError("no results to export");
    PrintNote("run `smoke run` first");
    return kExitFailure;
  }

  auto name = cmd.get<std::string>("--name");
  if (!report::WriteJUnitFile(*last, path, name)) {
    PrintError(fmt::format("could not write {}", path.string()));
    return kExitFailure;
  }
  fmt::print("JUnit report written to {}\n", path.string());
  return kExitSuccess;
}

auto InitCommand(const argparse::ArgumentParser& cmd) -> int {
  bool force = cmd.get<bool>("--force");
  fs::path config_path = fs::current_path() / kConfigFileName;

  if (fs::exists(config_path) && !force) {
    PrintError(
        fmt::format(
            "{} already exists (use --force to overwrite)", kConfigFileName));
    return kExitFailure;
  }

  std::ofstream out(config_path);
  if (!out) {
    PrintError(fmt::format("cannot write {}", config_path.string()));
    return kExitFailure;
  }
  out << config::StarterConfig();
  out.close();
  if (!out) {
    PrintError(fmt::format("cannot write {}", config_path.string()));
    return kExitFailure;
  }

  fmt::print("Created {}\n", kConfigFileName);
  return kExitSuccess;
}

}  // namespace smoke::driver
