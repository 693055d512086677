#include <warden/account/redelegation_guard.hpp>

#include <spdlog/spdlog.h>

#include <exception>

using namespace warden::schema;

namespace warden::account {

redelegation_guard::redelegation_guard(account_state_t& state,
                                       module_manager& manager,
                                       module_directory& directory,
                                       execution_host& host)
    : state_{state}, manager_{manager}, directory_{directory}, host_{host} {}

bool redelegation_guard::redelegated() const {
  return state_.delegation_target.has_value() &&
         *state_.delegation_target != host_.delegation_target();
}

void redelegation_guard::notify_uninstall(const address_t& address) {
  try {
    resolve<warden::account::module>(directory_, address)->on_uninstall({});
  } catch (const std::exception& ex) {
    spdlog::warn("Ignoring uninstall failure of {} during purge: {}",
                 to_hex(address), ex.what());
  }
}

void redelegation_guard::purge() {
  auto validators = state_.registry.list(module_type_t::validator);
  auto executors = state_.registry.list(module_type_t::executor);
  spdlog::info("Purging {} validator(s), {} executor(s) and {} hook",
               validators.size(), executors.size(),
               state_.hook ? "the" : "no");

  for (const auto& validator : validators) {
    notify_uninstall(validator);
  }
  for (const auto& executor : executors) {
    notify_uninstall(executor);
  }
  if (state_.hook) {
    notify_uninstall(*state_.hook);
  }

  manager_.reset();
  state_.delegation_target = host_.delegation_target();
}

}  // namespace warden::account
