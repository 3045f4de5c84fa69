#pragma once

#include <string>

#include "smoke/common/diagnostic.hpp"
#include "smoke/report/run_result.hpp"

namespace smoke::driver {

void PrintError(const std::string& message);
void PrintWarning(const std::string& message);
void PrintNote(const std::string& message);
void PrintDiagnostic(const Diagnostic& diag);

// "[CODE] message / Hint: ..." block for a failed run, with the raw runner
// output only when verbose.
void PrintRunError(const report::StructuredError& error, bool verbose);

// One line per suite: status mark, label, counts and duration. Failed tests
// follow on indented lines with their error truncated.
void PrintSuiteLine(
    const std::string& label, const report::SuiteResult& suite);

// Every test of a suite, one per line.
void PrintSuiteTests(const report::SuiteResult& suite);

void PrintSummary(const report::Summary& summary);

}  // namespace smoke::driver
