#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace smoke::state {

// Persistent key-value store shared between invocations.
class StateStore {
 public:
  StateStore() = default;
  virtual ~StateStore() = default;
  StateStore(const StateStore&) = delete;
  auto operator=(const StateStore&) -> StateStore& = delete;
  StateStore(StateStore&&) = delete;
  auto operator=(StateStore&&) -> StateStore& = delete;

  [[nodiscard]] virtual auto Get(std::string_view key) const
      -> std::optional<nlohmann::json> = 0;
  virtual void Set(std::string_view key, nlohmann::json value) = 0;
  virtual void Delete(std::string_view key) = 0;
};

// All keys live in one JSON object file. Every write rewrites the whole file
// and creates missing parent directories. A corrupt file reads as empty.
class JsonFileStateStore final : public StateStore {
 public:
  explicit JsonFileStateStore(std::filesystem::path path);

  [[nodiscard]] auto Get(std::string_view key) const
      -> std::optional<nlohmann::json> override;
  void Set(std::string_view key, nlohmann::json value) override;
  void Delete(std::string_view key) override;

  [[nodiscard]] auto Path() const -> const std::filesystem::path& {
    return path_;
  }

 private:
  [[nodiscard]] auto Load() const -> nlohmann::json;
  void Save(const nlohmann::json& doc) const;

  std::filesystem::path path_;
};

}  // namespace smoke::state
