#include "smoke/suite/suite_registry.hpp"

#include <algorithm>
#include <array>
#include <exception>
#include <filesystem>
#include <initializer_list>
#include <map>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <spdlog/spdlog.h>

#include "smoke/common/constants.hpp"
#include "smoke/common/string_utils.hpp"
#include "smoke/suite/feature_detector.hpp"
#include "smoke/suite/suite_declarations.hpp"
#include "smoke/suite/suite_definition.hpp"

namespace smoke::suite {

namespace fs = std::filesystem;

namespace {

auto Always(const FeatureDetector& /*detector*/) -> bool {
  return true;
}

constexpr std::array<BuiltInSuite, 9> kBuiltInSuites = {{
    {.id = "core_pages",
     .label = "Core Pages",
     .description =
         "Homepage, login, and critical pages return 200 with no PHP errors.",
     .weight = -100,
     .detect = Always},
    {.id = "auth",
     .label = "Authentication",
     .description = "Login form works, invalid credentials show errors, "
                    "password reset exists.",
     .weight = -90,
     .detect = Always},
    {.id = "webform",
     .label = "Webform",
     .description = "Submits the configured webform and confirms it works.",
     .weight = -80,
     .detect =
         [](const FeatureDetector& d) { return d.HasCapability("webform"); }},
    {.id = "commerce",
     .label = "Commerce",
     .description = "Product catalog accessible, cart exists, checkout flow "
                    "intact.",
     .weight = -70,
     .detect =
         [](const FeatureDetector& d) { return d.HasCapability("commerce"); }},
    {.id = "search",
     .label = "Search",
     .description = "Search page loads and contains a search form.",
     .weight = -60,
     .detect =
         [](const FeatureDetector& d) {
           return d.HasCapability("search_api") || d.HasCapability("search");
         }},
    {.id = "health",
     .label = "Health",
     .description = "Admin status report, cron, CSS/JS assets, PHP error log, "
                    "cache headers.",
     .weight = -50,
     .detect = Always},
    {.id = "sitemap",
     .label = "Sitemap",
     .description = "XML sitemap exists, returns valid XML, contains URLs.",
     .weight = -40,
     .detect =
         [](const FeatureDetector& d) {
           return d.HasCapability("simple_sitemap") ||
                  d.HasCapability("xmlsitemap");
         }},
    {.id = "content",
     .label = "Content",
     .description = "Creates a test page, verifies it renders, deletes it.",
     .weight = -30,
     .detect =
         [](const FeatureDetector& d) {
           return d.HasCapability("content_type:page");
         }},
    {.id = "accessibility",
     .label = "Accessibility",
     .description = "WCAG 2.1 AA axe-core scan on homepage and login page.",
     .weight = -20,
     .detect = Always},
}};

auto FirstExisting(std::initializer_list<fs::path> candidates)
    -> std::optional<fs::path> {
  for (const auto& candidate : candidates) {
    if (fs::exists(candidate)) {
      return candidate;
    }
  }
  return std::nullopt;
}

auto FirstDirectory(const fs::path& candidate) -> std::optional<fs::path> {
  if (fs::is_directory(candidate)) {
    return candidate;
  }
  return std::nullopt;
}

}  // namespace

auto ToString(SuiteOrigin origin) -> std::string_view {
  switch (origin) {
    case SuiteOrigin::kBuiltIn:
      return "built-in";
    case SuiteOrigin::kDeclared:
      return "declared";
  }
  return "unknown";
}

auto BuiltInSuites() -> std::span<const BuiltInSuite> {
  return kBuiltInSuites;
}

auto IsBuiltInSuite(std::string_view id) -> bool {
  return std::ranges::any_of(
      kBuiltInSuites, [&](const BuiltInSuite& s) { return s.id == id; });
}

SuiteRegistry::SuiteRegistry(
    const FeatureDetector& detector, fs::path runner_dir,
    std::vector<SuiteDeclaration> declarations)
    : detector_(detector),
      runner_dir_(std::move(runner_dir)),
      declarations_(std::move(declarations)) {
}

auto SuiteRegistry::FindDeclaration(std::string_view id) const
    -> const SuiteDeclaration* {
  if (IsBuiltInSuite(id)) {
    return nullptr;
  }
  auto it = std::ranges::find_if(declarations_, [&](const auto& decl) {
    return decl.id == id;
  });
  return it == declarations_.end() ? nullptr : &*it;
}

auto SuiteRegistry::ResolveSpecLocator(
    std::string_view id, const SuiteDeclaration* decl) const
    -> std::optional<fs::path> {
  const std::string dash = common::DashCase(id);
  const std::string spec_file = dash + std::string(kSpecSuffix);

  if (decl != nullptr) {
    if (decl->spec_path && fs::exists(*decl->spec_path)) {
      return *decl->spec_path;
    }
    const fs::path& root = decl->provider_root;
    if (auto found = FirstExisting(
            {root / "playwright" / kRunnerSuitesDir / spec_file,
             root / "tests" / "playwright" / spec_file})) {
      return found;
    }
    if (auto found =
            FirstDirectory(root / "playwright" / kRunnerSuitesDir / dash)) {
      return found;
    }
  }

  fs::path base = runner_dir_ / kRunnerSuitesDir;
  if (fs::exists(base / spec_file)) {
    return base / spec_file;
  }
  return FirstDirectory(base / dash);
}

auto SuiteRegistry::GetSpecPath(std::string_view id) const
    -> std::optional<fs::path> {
  const SuiteDeclaration* decl = FindDeclaration(id);
  if (decl == nullptr && !IsBuiltInSuite(id)) {
    return std::nullopt;
  }
  return ResolveSpecLocator(id, decl);
}

auto SuiteRegistry::Detect() const -> std::map<std::string, SuiteDefinition> {
  std::map<std::string, SuiteDefinition> suites;

  for (const auto& builtin : kBuiltInSuites) {
    SuiteDefinition def{
        .id = std::string(builtin.id),
        .label = std::string(builtin.label),
        .description = std::string(builtin.description),
        .weight = builtin.weight,
        .dependencies = {},
        .spec_locator = ResolveSpecLocator(builtin.id, nullptr)
                            .value_or(fs::path{}),
        .detected = false,
        .provider_id = "smoke",
        .origin = SuiteOrigin::kBuiltIn,
    };
    try {
      def.detected = builtin.detect(detector_);
      def.metadata = detector_.SuiteMetadata(builtin.id);
    } catch (const std::exception& e) {
      spdlog::warn("detection failed for suite '{}': {}", builtin.id, e.what());
      def.detected = false;
    }
    suites.emplace(def.id, std::move(def));
  }

  for (const auto& decl : declarations_) {
    if (suites.contains(decl.id)) {
      spdlog::debug(
          "declared suite '{}' from '{}' shadowed by built-in suite", decl.id,
          decl.provider_id);
      continue;
    }
    auto spec = ResolveSpecLocator(decl.id, &decl);
    if (!spec) {
      spdlog::debug("declared suite '{}' has no spec file, skipping", decl.id);
      continue;
    }

    SuiteDefinition def{
        .id = decl.id,
        .label = decl.label,
        .description = decl.description,
        .weight = decl.weight,
        .dependencies = decl.dependencies,
        .spec_locator = *spec,
        .detected = false,
        .provider_id = decl.provider_id,
        .origin = SuiteOrigin::kDeclared,
    };
    try {
      def.detected = std::ranges::all_of(
          decl.dependencies,
          [&](const std::string& dep) { return detector_.HasCapability(dep); });
      def.metadata = detector_.SuiteMetadata(decl.id);
    } catch (const std::exception& e) {
      spdlog::warn("detection failed for suite '{}': {}", decl.id, e.what());
      def.detected = false;
    }
    suites.emplace(def.id, std::move(def));
  }

  return suites;
}

}  // namespace smoke::suite
