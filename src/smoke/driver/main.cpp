#include <argparse/argparse.hpp>
#include <exception>
#include <filesystem>
#include <iostream>
#include <string>
#include <system_error>

#include <fmt/core.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "commands.hpp"
#include "print.hpp"
#include "smoke/report/junit_exporter.hpp"

namespace {

namespace fs = std::filesystem;

// Log records go to stderr so stdout stays the command's report.
void ConfigureLogging() {
  auto logger = spdlog::stderr_color_mt("smoke");
  logger->set_pattern("[smoke][%H:%M:%S][%^%l%$] %v");
  spdlog::set_default_logger(logger);
  spdlog::set_level(spdlog::level::warn);
}

void AddRunFlags(argparse::ArgumentParser& cmd) {
  cmd.add_argument("--target")
      .help("Run against a remote site instead of the local one")
      .metavar("url");
  cmd.add_argument("--verbose", "-v")
      .default_value(false)
      .implicit_value(true)
      .help("Stream runner output and show debug logs");
}

auto Dispatch(
    const argparse::ArgumentParser& program,
    const argparse::ArgumentParser& run_cmd,
    const argparse::ArgumentParser& suite_cmd,
    const argparse::ArgumentParser& list_cmd,
    const argparse::ArgumentParser& status_cmd,
    const argparse::ArgumentParser& setup_cmd,
    const argparse::ArgumentParser& report_cmd,
    const argparse::ArgumentParser& init_cmd) -> int {
  using namespace smoke::driver;

  if (program.is_subcommand_used("run")) {
    return RunCommand(run_cmd);
  }
  if (program.is_subcommand_used("suite")) {
    return SuiteCommand(suite_cmd);
  }
  if (program.is_subcommand_used("list")) {
    return ListCommand(list_cmd);
  }
  if (program.is_subcommand_used("status")) {
    return StatusCommand(status_cmd);
  }
  if (program.is_subcommand_used("setup")) {
    return SetupCommand(setup_cmd);
  }
  if (program.is_subcommand_used("report")) {
    return ReportCommand(report_cmd);
  }
  if (program.is_subcommand_used("init")) {
    return InitCommand(init_cmd);
  }

  // No subcommand provided
  std::cout << program;
  return 0;
}

}  // namespace

auto main(int argc, char* argv[]) -> int {
  ConfigureLogging();

  argparse::ArgumentParser program("smoke", "0.1.0");
  program.add_description("Run end-to-end smoke suites against a site");
  program.add_argument("-C").help("Run as if started in <dir>").metavar("dir");

  // Subcommand: run
  argparse::ArgumentParser run_cmd("run");
  run_cmd.add_description("Run every enabled suite the site supports");
  AddRunFlags(run_cmd);
  run_cmd.add_argument("--quick")
      .default_value(false)
      .implicit_value(true)
      .help("Only run the suites listed in [suites] quick");
  run_cmd.add_argument("--parallel")
      .default_value(false)
      .implicit_value(true)
      .help("Let the runner use several workers inside each suite");
  run_cmd.add_argument("--junit")
      .help("Also write a JUnit XML report")
      .metavar("path");
  run_cmd.add_argument("--html")
      .help("Ask the runner for an HTML report")
      .metavar("path");

  // Subcommand: suite
  argparse::ArgumentParser suite_cmd("suite");
  suite_cmd.add_description("Run a single suite");
  suite_cmd.add_argument("id").help("Suite id, as shown by `smoke list`");
  AddRunFlags(suite_cmd);

  // Subcommand: list
  argparse::ArgumentParser list_cmd("list");
  list_cmd.add_description("List suites and whether they will run");

  // Subcommand: status
  argparse::ArgumentParser status_cmd("status");
  status_cmd.add_description("Show the results of the last run");

  // Subcommand: setup
  argparse::ArgumentParser setup_cmd("setup");
  setup_cmd.add_description(
      "Install runner dependencies and write the runner config");
  setup_cmd.add_argument("--bot-password")
      .help("Store the password of the local test account")
      .metavar("password");
  setup_cmd.add_argument("--verbose", "-v")
      .default_value(false)
      .implicit_value(true)
      .help("Stream installer output");

  // Subcommand: report
  argparse::ArgumentParser report_cmd("report");
  report_cmd.add_description("Export the last results as JUnit XML");
  report_cmd.add_argument("path").nargs(0, 1).help(
      "Output file (defaults to [report] junit)");
  report_cmd.add_argument("--name")
      .default_value(std::string(smoke::report::kDefaultJUnitName))
      .help("Name of the <testsuites> element");

  // Subcommand: init
  argparse::ArgumentParser init_cmd("init");
  init_cmd.add_description("Create a starter smoke.toml");
  init_cmd.add_argument("--force", "-f")
      .default_value(false)
      .implicit_value(true)
      .help("Overwrite existing smoke.toml");

  program.add_subparser(run_cmd);
  program.add_subparser(suite_cmd);
  program.add_subparser(list_cmd);
  program.add_subparser(status_cmd);
  program.add_subparser(setup_cmd);
  program.add_subparser(report_cmd);
  program.add_subparser(init_cmd);

  try {
    program.parse_args(argc, argv);
  } catch (const std::exception& err) {
    smoke::driver::PrintError(err.what());
    std::cerr << program;
    return 1;
  }

  // Handle -C before dispatching subcommands
  if (auto dir = program.present("-C")) {
    std::error_code ec;
    fs::current_path(*dir, ec);
    if (ec) {
      smoke::driver::PrintError(
          fmt::format("cannot change to '{}': {}", *dir, ec.message()));
      return 1;
    }
  }

  try {
    return Dispatch(
        program, run_cmd, suite_cmd, list_cmd, status_cmd, setup_cmd,
        report_cmd, init_cmd);
  } catch (const std::exception& e) {
    smoke::driver::PrintError(e.what());
    return 1;
  }
}
