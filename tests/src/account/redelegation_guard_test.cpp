#include <gtest/gtest.h>
#include <warden/account/module_manager.hpp>
#include <warden/account/redelegation_guard.hpp>
#include <warden/schema/fallback_handler.hpp>
#include <warden/testing/common.hpp>
#include <warden/testing/fake_host.hpp>
#include <warden/testing/fake_modules.hpp>

#include <memory>
#include <vector>

namespace {

using warden::schema::module_type_t;
using warden::testing::make_module_address;

class redelegation_guard_test : public ::testing::Test {
 protected:
  redelegation_guard_test()
      : registry{std::make_shared<warden::testing::fake_registry>()},
        manager{state, directory, events, registry},
        guard{state, manager, directory, host} {
    host.set_delegation_target(make_module_address(0xD1));
  }

  std::shared_ptr<warden::testing::fake_module> install(
      const module_type_t type,
      const uint8_t seed,
      const warden::schema::bytes_t& init = {}) {
    auto module = directory.add(make_module_address(seed), {type});
    manager.install(type, make_module_address(seed),
                    warden::schema::make_bytes_view(init));
    return module;
  }

  warden::account::account_state_t state;
  warden::testing::fake_directory directory;
  warden::testing::fake_host host;
  warden::schema::event_log_t events;
  std::shared_ptr<warden::testing::fake_registry> registry;
  warden::account::module_manager manager;
  warden::account::redelegation_guard guard;
};

}  // namespace

TEST_F(redelegation_guard_test, detects_changed_delegation_target) {
  EXPECT_FALSE(guard.redelegated());

  state.delegation_target = make_module_address(0xD1);
  EXPECT_FALSE(guard.redelegated());

  host.set_delegation_target(make_module_address(0xD2));
  EXPECT_TRUE(guard.redelegated());
}

TEST_F(redelegation_guard_test, purge_strips_trust_bearing_modules) {
  auto first = install(module_type_t::validator, 0x01);
  auto second = install(module_type_t::validator, 0x02);
  second->throw_on_uninstall = true;
  auto executor = install(module_type_t::executor, 0x03);
  auto hook = install(module_type_t::hook, 0x04);
  state.initialized = true;
  host.set_delegation_target(make_module_address(0xD2));

  guard.purge();

  EXPECT_EQ(first->uninstalls.size(), 1u);
  EXPECT_EQ(second->uninstalls.size(), 1u);
  EXPECT_EQ(executor->uninstalls.size(), 1u);
  EXPECT_EQ(hook->uninstalls.size(), 1u);
  EXPECT_TRUE(state.registry.empty(module_type_t::validator));
  EXPECT_TRUE(state.registry.empty(module_type_t::executor));
  EXPECT_FALSE(state.hook.has_value());
  EXPECT_EQ(state.delegation_target, make_module_address(0xD2));
  EXPECT_TRUE(state.initialized);
  EXPECT_FALSE(guard.redelegated());
}

TEST_F(redelegation_guard_test, purge_keeps_pre_validation_hooks_and_fallbacks) {
  auto pre_hook = install(module_type_t::pre_validation_hook_signature, 0x05);
  install(module_type_t::fallback, 0x06,
          {0x12, 0x34, 0x56, 0x78,
           static_cast<uint8_t>(warden::schema::call_type_t::single)});

  guard.purge();

  EXPECT_TRUE(pre_hook->uninstalls.empty());
  EXPECT_EQ(state.registry.list(module_type_t::pre_validation_hook_signature),
            (std::vector<warden::schema::address_t>{make_module_address(0x05)}));
  EXPECT_EQ(state.fallbacks.size(), 1u);
}

TEST_F(redelegation_guard_test, purge_of_empty_account_records_target) {
  guard.purge();
  EXPECT_EQ(state.delegation_target, make_module_address(0xD1));
}
