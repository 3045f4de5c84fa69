#include "smoke/state/secret_store.hpp"

#include <string>
#include <string_view>

#include "smoke/common/constants.hpp"

namespace smoke::state {

auto StateSecretStore::BotPassword() const -> std::string {
  auto value = store_.Get(kStateBotPassword);
  if (!value || !value->is_string()) {
    return "";
  }
  return value->get<std::string>();
}

void StateSecretStore::SetBotPassword(std::string_view password) {
  store_.Set(kStateBotPassword, std::string(password));
}

}  // namespace smoke::state
