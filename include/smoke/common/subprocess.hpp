#pragma once

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace smoke::common {

// What to do with the child's stdout. Runner output can be large, so callers
// either let it through to the terminal or drop it; it is never buffered.
enum class StdoutMode {
  kInherit,
  kDiscard,
  kCapture,  // Small outputs only (version probes)
};

struct SubprocessOptions {
  std::optional<std::filesystem::path> working_dir;
  // Added to (or overriding) the parent environment.
  std::map<std::string, std::string> env;
  StdoutMode stdout_mode = StdoutMode::kDiscard;
  // Zero means no timeout.
  std::chrono::seconds timeout{0};
  // Bytes of stderr (and captured stdout) kept; the rest is drained.
  size_t max_capture_bytes = size_t{256} * 1024;
};

struct SubprocessResult {
  // Exit status, 128+signal when signalled, 127 when exec failed, -1 when the
  // child could not be started at all.
  int exit_code = -1;
  std::string stdout_output;
  std::string stderr_output;
  bool timed_out = false;
};

// Execute command with argv array (no shell interpretation).
// argv[0] is resolved through PATH.
auto RunSubprocess(
    const std::vector<std::string>& argv, const SubprocessOptions& options = {})
    -> SubprocessResult;

}  // namespace smoke::common
