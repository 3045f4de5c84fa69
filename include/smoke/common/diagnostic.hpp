#pragma once

#include <cstdint>
#include <expected>
#include <string>
#include <utility>
#include <vector>

namespace smoke {

// Type of diagnostic message
enum class DiagKind : uint8_t {
  kError,      // Invalid user input (unknown suite, bad flag value)
  kHostError,  // I/O, malformed config or declaration files
  kWarning,    // Non-fatal
  kNote,       // Auxiliary message
};

// Single diagnostic item (primary or note)
struct DiagItem {
  DiagKind kind;
  std::string message;

  auto operator==(const DiagItem&) const -> bool = default;
};

// Complete diagnostic with primary message and optional notes
struct Diagnostic {
  DiagItem primary;
  std::vector<DiagItem> notes;

  auto operator==(const Diagnostic&) const -> bool = default;

  static auto Error(std::string msg) -> Diagnostic {
    return Diagnostic{
        .primary = {.kind = DiagKind::kError, .message = std::move(msg)},
        .notes = {},
    };
  }

  // Factory: host error (file system, config parsing)
  static auto HostError(std::string msg) -> Diagnostic {
    return Diagnostic{
        .primary = {.kind = DiagKind::kHostError, .message = std::move(msg)},
        .notes = {},
    };
  }

  auto WithNote(std::string msg) && -> Diagnostic {
    notes.push_back(
        DiagItem{
            .kind = DiagKind::kNote,
            .message = std::move(msg),
        });
    return std::move(*this);
  }
};

template <typename T>
using Result = std::expected<T, Diagnostic>;

}  // namespace smoke
