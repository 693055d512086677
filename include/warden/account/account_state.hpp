#pragma once

#include <warden/account/module_registry.hpp>
#include <warden/schema/account_snapshot.hpp>
#include <warden/schema/fallback_handler.hpp>
#include <warden/schema/primitives.hpp>

#include <map>
#include <optional>

namespace warden::account {

/// Everything the account remembers between invocations. Only the module
/// manager writes to it; the engines read it.
struct account_state_t final {
  module_registry registry;
  std::optional<warden::schema::address_t> hook;
  std::map<warden::schema::selector_t, warden::schema::fallback_handler_t>
      fallbacks;
  bool initialized{};
  std::optional<warden::schema::address_t> delegation_target;
};

warden::schema::account_snapshot_t make_snapshot(const account_state_t& state);
account_state_t make_state(const warden::schema::account_snapshot_t& snapshot);

}  // namespace warden::account
