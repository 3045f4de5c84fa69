#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "smoke/common/diagnostic.hpp"
#include "smoke/config/project_config.hpp"

namespace smoke::suite {

// One entry of a smoke.suites.yml file:
//
//   agency_seo:
//     label: SEO Checks
//     description: Validates meta tags.
//     weight: 20
//     dependencies: [metatag]
//     spec_path: tests/playwright/seo.spec.ts
struct SuiteDeclaration {
  std::string id;
  std::string label;
  std::string description;
  int weight = 0;
  std::vector<std::string> dependencies;
  // Explicit spec location, already resolved against provider_root.
  std::optional<std::filesystem::path> spec_path;
  std::string provider_id;
  std::filesystem::path provider_root;
};

// Parse one declaration file. Entries that are not maps are skipped.
auto ParseDeclarations(
    const std::filesystem::path& file, std::string_view provider_id,
    const std::filesystem::path& provider_root)
    -> Result<std::vector<SuiteDeclaration>>;

// Collect declarations from every provider root holding a smoke.suites.yml.
// Unreadable files are logged and skipped. When two providers declare the
// same id the later provider wins. Sorted by id.
auto DiscoverDeclarations(const std::vector<config::SuiteProvider>& providers)
    -> std::vector<SuiteDeclaration>;

}  // namespace smoke::suite
