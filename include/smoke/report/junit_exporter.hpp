#pragma once

#include <filesystem>
#include <string>
#include <string_view>

#include "smoke/report/run_result.hpp"

namespace smoke::report {

inline constexpr std::string_view kDefaultJUnitName = "Smoke Tests";

// Render a RunResult as JUnit XML (<testsuites> / <testsuite> / <testcase>).
// Durations are written in seconds with three decimals. A failed test gets a
// <failure> whose message attribute is truncated and whose CDATA body holds
// the full sanitized error.
auto GenerateJUnit(
    const RunResult& result, std::string_view name = kDefaultJUnitName)
    -> std::string;

// Write GenerateJUnit output to path, creating parent directories.
// Returns false on any I/O failure.
auto WriteJUnitFile(
    const RunResult& result, const std::filesystem::path& path,
    std::string_view name = kDefaultJUnitName) -> bool;

// Strip ANSI sequences and characters that are invalid in XML 1.0.
auto SanitizeMessage(std::string_view message) -> std::string;

}  // namespace smoke::report
