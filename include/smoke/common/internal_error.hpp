#pragma once

#include <stdexcept>
#include <string>

#include <fmt/core.h>

namespace smoke::common {

// Exception type for internal smoke errors (bugs, not user errors)
class InternalError : public std::runtime_error {
 public:
  InternalError(const char* context, const std::string& detail)
      : std::runtime_error(
            fmt::format(
                "Internal error in {}: {}\n"
                "This is a bug in smoke, not in the suites under test.",
                context, detail)) {
  }
};

[[noreturn]] inline void ThrowInternalError(
    const char* context, const std::string& detail) {
  throw InternalError(context, detail);
}

}  // namespace smoke::common
