#pragma once

#include <string>
#include <string_view>

#include "smoke/report/run_result.hpp"

namespace smoke::report {

// Classify raw runner stderr. ANSI sequences are stripped, then the text is
// matched against a fixed, ordered signature table (first match wins).
// Unmatched text yields UNKNOWN_ERROR with the first line that is not a
// stack frame as message. raw holds at most 500 characters plus "...".
// Pure: identical input gives identical output.
auto Analyze(std::string_view raw_error, int exit_code = 1) -> StructuredError;

// "[CODE] message", blank line, "Hint: hint", and with include_raw a
// "Details:" block holding raw.
auto FormatForCli(const StructuredError& error, bool include_raw = false)
    -> std::string;

// Errors a one-shot remediation may fix.
auto IsSetupError(ErrorCode code) -> bool;

}  // namespace smoke::report
