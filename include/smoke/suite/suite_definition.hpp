#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

namespace smoke::suite {

enum class SuiteOrigin : uint8_t {
  kBuiltIn,
  kDeclared,  // From a provider's smoke.suites.yml
};

auto ToString(SuiteOrigin origin) -> std::string_view;

struct SuiteDefinition {
  std::string id;  // lower_snake_case, stable across runs
  std::string label;
  std::string description;
  int weight = 0;
  // Capability flags that must all be present for a declared suite.
  std::vector<std::string> dependencies;
  // Resolved spec file or directory. Empty when nothing was found.
  std::filesystem::path spec_locator;
  bool detected = false;
  std::string provider_id;
  SuiteOrigin origin = SuiteOrigin::kBuiltIn;
  // Per-suite fields from the feature detector, forwarded to the bridge file.
  nlohmann::json metadata = nlohmann::json::object();
};

}  // namespace smoke::suite
