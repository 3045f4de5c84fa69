#pragma once

#include <argparse/argparse.hpp>

namespace smoke::driver {

auto RunCommand(const argparse::ArgumentParser& cmd) -> int;
auto SuiteCommand(const argparse::ArgumentParser& cmd) -> int;
auto ListCommand(const argparse::ArgumentParser& cmd) -> int;
auto StatusCommand(const argparse::ArgumentParser& cmd) -> int;
auto SetupCommand(const argparse::ArgumentParser& cmd) -> int;
auto ReportCommand(const argparse::ArgumentParser& cmd) -> int;
auto InitCommand(const argparse::ArgumentParser& cmd) -> int;

}  // namespace smoke::driver
