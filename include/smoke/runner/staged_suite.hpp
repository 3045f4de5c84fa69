#pragma once

#include <filesystem>

namespace smoke::runner {

// Copies a suite that lives outside the runner tree to
// <runner>/suites/<dash-id>/ so the runner discovers it and its relative
// imports resolve. The copy is removed on destruction.
class StagedSuite {
 public:
  // spec is a spec file (its directory is copied) or a suite directory.
  // Throws std::filesystem::filesystem_error when the copy fails.
  StagedSuite(const std::filesystem::path& spec, std::filesystem::path dest);
  ~StagedSuite();

  StagedSuite(const StagedSuite&) = delete;
  auto operator=(const StagedSuite&) -> StagedSuite& = delete;
  StagedSuite(StagedSuite&&) = delete;
  auto operator=(StagedSuite&&) -> StagedSuite& = delete;

 private:
  std::filesystem::path dest_;
};

// True when path is dir or lies below it (lexical check).
auto IsWithin(
    const std::filesystem::path& path, const std::filesystem::path& dir)
    -> bool;

}  // namespace smoke::runner
