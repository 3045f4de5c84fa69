#pragma once

#include <string>
#include <string_view>

#include "smoke/state/state_store.hpp"

namespace smoke::state {

// Holds the password of the local bot account used by the auth suite.
class SecretStore {
 public:
  SecretStore() = default;
  virtual ~SecretStore() = default;
  SecretStore(const SecretStore&) = delete;
  auto operator=(const SecretStore&) -> SecretStore& = delete;
  SecretStore(SecretStore&&) = delete;
  auto operator=(SecretStore&&) -> SecretStore& = delete;

  // Empty when no password has been stored.
  [[nodiscard]] virtual auto BotPassword() const -> std::string = 0;
  virtual void SetBotPassword(std::string_view password) = 0;
};

// Keeps the password under the smoke.bot_password state key.
class StateSecretStore final : public SecretStore {
 public:
  explicit StateSecretStore(StateStore& store) : store_(store) {
  }

  [[nodiscard]] auto BotPassword() const -> std::string override;
  void SetBotPassword(std::string_view password) override;

 private:
  StateStore& store_;
};

}  // namespace smoke::state
