#pragma once

#include <filesystem>
#include <map>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "smoke/suite/feature_detector.hpp"
#include "smoke/suite/suite_declarations.hpp"
#include "smoke/suite/suite_definition.hpp"

namespace smoke::suite {

struct BuiltInSuite {
  std::string_view id;
  std::string_view label;
  std::string_view description;
  int weight;
  auto (*detect)(const FeatureDetector&) -> bool;
};

// Suites shipped with the runner, in display order.
auto BuiltInSuites() -> std::span<const BuiltInSuite>;

auto IsBuiltInSuite(std::string_view id) -> bool;

// Resolves the set of runnable suites. Nothing is cached: every Detect()
// re-evaluates the detector and the filesystem.
class SuiteRegistry {
 public:
  SuiteRegistry(
      const FeatureDetector& detector, std::filesystem::path runner_dir,
      std::vector<SuiteDeclaration> declarations = {});

  // Built-in suites plus declared suites whose spec exists on disk. A
  // declared suite with the id of a built-in one is ignored.
  [[nodiscard]] auto Detect() const -> std::map<std::string, SuiteDefinition>;

  // Spec file or directory for a suite, or nullopt when the id is unknown or
  // no candidate exists. Candidates, in order:
  //   1. spec_path from the declaration
  //   2. <provider>/playwright/suites/<dash-id>.spec.ts,
  //      <provider>/tests/playwright/<dash-id>.spec.ts
  //   3. <provider>/playwright/suites/<dash-id>/
  //   4. <runner>/suites/<dash-id>.spec.ts, <runner>/suites/<dash-id>/
  [[nodiscard]] auto GetSpecPath(std::string_view id) const
      -> std::optional<std::filesystem::path>;

  [[nodiscard]] auto RunnerDir() const -> const std::filesystem::path& {
    return runner_dir_;
  }

 private:
  [[nodiscard]] auto FindDeclaration(std::string_view id) const
      -> const SuiteDeclaration*;
  [[nodiscard]] auto ResolveSpecLocator(
      std::string_view id, const SuiteDeclaration* decl) const
      -> std::optional<std::filesystem::path>;

  const FeatureDetector& detector_;
  std::filesystem::path runner_dir_;
  std::vector<SuiteDeclaration> declarations_;
};

}  // namespace smoke::suite
