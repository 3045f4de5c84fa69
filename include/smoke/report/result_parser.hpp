#pragma once

#include <optional>
#include <string>
#include <string_view>

#include "smoke/report/run_result.hpp"

namespace smoke::report {

// Map a runner suite title to a canonical suite id. Accepts the dash-cased
// name, the display label and the spec file name of built-in suites (with or
// without a leading directory). Other "<name>.spec.ts" titles map to the
// underscore form of <name>; anything else is slugified.
auto ResolveSuiteId(std::string_view title) -> std::string;

// Parse the runner's JSON report. Never throws: malformed, non-object and
// empty input produce an empty RunResult with a PARSE_FAILED error carrying
// the first 2000 characters of the input.
//
// Nested suites are flattened so each top-level suite yields one flat test
// list. A test's duration is the sum of its attempts; its status is the most
// severe attempt status (failed > skipped > passed), with "timedOut" and
// "interrupted" counted as failed.
auto ParseResults(std::string_view json_text) -> RunResult;

// Collapse every parsed suite into one entry keyed (and titled) target_id.
void MergeSuitesInto(RunResult& result, const std::string& target_id);

// Error text of the first failed test whose error mentions
// browserType.launch.
auto FindBrowserLaunchFailure(const RunResult& result)
    -> std::optional<std::string>;

}  // namespace smoke::report
