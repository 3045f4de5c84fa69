#include "smoke/state/state_store.hpp"

#include <filesystem>
#include <fstream>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

#include <fmt/core.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace smoke::state {

namespace fs = std::filesystem;

JsonFileStateStore::JsonFileStateStore(fs::path path)
    : path_(std::move(path)) {
}

auto JsonFileStateStore::Load() const -> nlohmann::json {
  std::ifstream in(path_);
  if (!in) {
    return nlohmann::json::object();
  }
  try {
    auto doc = nlohmann::json::parse(in);
    if (doc.is_object()) {
      return doc;
    }
    spdlog::warn(
        "{}: state file is not a JSON object, ignoring", path_.string());
  } catch (const nlohmann::json::exception& e) {
    spdlog::warn("{}: unreadable state file: {}", path_.string(), e.what());
  }
  return nlohmann::json::object();
}

void JsonFileStateStore::Save(const nlohmann::json& doc) const {
  if (path_.has_parent_path()) {
    fs::create_directories(path_.parent_path());
  }
  std::ofstream out(path_, std::ios::trunc);
  if (!out) {
    throw std::runtime_error(
        fmt::format("cannot write state file {}", path_.string()));
  }
  // Runner output is not guaranteed to be valid UTF-8.
  out << doc.dump(2, ' ', false, nlohmann::json::error_handler_t::replace)
      << "\n";
  if (!out) {
    throw std::runtime_error(
        fmt::format("failed writing state file {}", path_.string()));
  }
}

auto JsonFileStateStore::Get(std::string_view key) const
    -> std::optional<nlohmann::json> {
  auto doc = Load();
  auto it = doc.find(std::string(key));
  if (it == doc.end()) {
    return std::nullopt;
  }
  return *it;
}

void JsonFileStateStore::Set(std::string_view key, nlohmann::json value) {
  auto doc = Load();
  doc[std::string(key)] = std::move(value);
  Save(doc);
}

void JsonFileStateStore::Delete(std::string_view key) {
  auto doc = Load();
  if (doc.erase(std::string(key)) > 0) {
    Save(doc);
  }
}

}  // namespace smoke::state
