#include <warden/account/account_state.hpp>

using namespace warden::schema;

namespace warden::account {

account_snapshot_t make_snapshot(const account_state_t& state) {
  auto snapshot = account_snapshot_t{};
  for (const auto type : state.registry.categories()) {
    snapshot.modules.emplace_back(type, state.registry.list(type));
  }
  snapshot.hook = state.hook;
  for (const auto& [selector, handler] : state.fallbacks) {
    snapshot.fallbacks.emplace_back(selector, handler);
  }
  snapshot.initialized = state.initialized;
  snapshot.delegation_target = state.delegation_target;
  return snapshot;
}

account_state_t make_state(const account_snapshot_t& snapshot) {
  auto state = account_state_t{};
  for (const auto& [type, modules] : snapshot.modules) {
    for (const auto& module : modules) {
      state.registry.add(type, module);
    }
  }
  state.hook = snapshot.hook;
  for (const auto& [selector, handler] : snapshot.fallbacks) {
    state.fallbacks.insert_or_assign(selector, handler);
  }
  state.initialized = snapshot.initialized;
  state.delegation_target = snapshot.delegation_target;
  return state;
}

}  // namespace warden::account
