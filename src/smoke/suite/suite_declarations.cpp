#include "smoke/suite/suite_declarations.hpp"

#include <expected>
#include <filesystem>
#include <map>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <fmt/core.h>
#include <spdlog/spdlog.h>
#include <yaml-cpp/yaml.h>

#include "smoke/common/constants.hpp"
#include "smoke/common/diagnostic.hpp"
#include "smoke/common/string_utils.hpp"
#include "smoke/config/project_config.hpp"

namespace smoke::suite {

namespace fs = std::filesystem;

namespace {

auto ReadDependencies(const YAML::Node& node) -> std::vector<std::string> {
  std::vector<std::string> deps;
  if (!node) {
    return deps;
  }
  if (node.IsScalar()) {
    deps.push_back(node.as<std::string>());
    return deps;
  }
  for (const auto& dep : node) {
    deps.push_back(dep.as<std::string>());
  }
  return deps;
}

auto ParseEntry(
    const std::string& id, const YAML::Node& node,
    std::string_view provider_id, const fs::path& provider_root)
    -> SuiteDeclaration {
  SuiteDeclaration decl{
      .id = id,
      .label = node["label"] ? node["label"].as<std::string>()
                             : common::HumanizeId(id),
      .description =
          node["description"] ? node["description"].as<std::string>() : "",
      .weight = node["weight"] ? node["weight"].as<int>() : 0,
      .dependencies = ReadDependencies(node["dependencies"]),
      .spec_path = std::nullopt,
      .provider_id = std::string(provider_id),
      .provider_root = provider_root,
  };

  if (node["spec_path"]) {
    auto spec = node["spec_path"].as<std::string>();
    if (!spec.empty()) {
      decl.spec_path = provider_root / spec;
    }
  }
  return decl;
}

}  // namespace

auto ParseDeclarations(
    const fs::path& file, std::string_view provider_id,
    const fs::path& provider_root) -> Result<std::vector<SuiteDeclaration>> {
  YAML::Node root;
  try {
    root = YAML::LoadFile(file.string());
  } catch (const YAML::Exception& e) {
    return std::unexpected(
        Diagnostic::HostError(
            fmt::format("{}: YAML parse error: {}", file.string(), e.what())));
  }

  std::vector<SuiteDeclaration> decls;
  if (!root.IsMap()) {
    return decls;
  }

  try {
    for (const auto& entry : root) {
      if (!entry.second.IsMap()) {
        continue;
      }
      decls.push_back(
          ParseEntry(
              entry.first.as<std::string>(), entry.second, provider_id,
              provider_root));
    }
  } catch (const YAML::Exception& e) {
    return std::unexpected(
        Diagnostic::HostError(
            fmt::format(
                "{}: invalid suite entry: {}", file.string(), e.what())));
  }
  return decls;
}

auto DiscoverDeclarations(const std::vector<config::SuiteProvider>& providers)
    -> std::vector<SuiteDeclaration> {
  std::map<std::string, SuiteDeclaration> by_id;

  for (const auto& provider : providers) {
    fs::path file = provider.root / kDeclarationFileName;
    if (!fs::exists(file)) {
      spdlog::debug(
          "provider '{}' has no {}", provider.name, kDeclarationFileName);
      continue;
    }

    auto decls = ParseDeclarations(file, provider.name, provider.root);
    if (!decls) {
      spdlog::warn(
          "Failed to parse {}: {}", file.string(),
          decls.error().primary.message);
      continue;
    }
    for (auto& decl : *decls) {
      by_id.insert_or_assign(decl.id, std::move(decl));
    }
  }

  std::vector<SuiteDeclaration> result;
  result.reserve(by_id.size());
  for (auto& [id, decl] : by_id) {
    result.push_back(std::move(decl));
  }
  return result;
}

}  // namespace smoke::suite
