#include <gtest/gtest.h>
#include <warden/account/module_manager.hpp>
#include <warden/account/operation_selector.hpp>
#include <warden/common/error.hpp>
#include <warden/testing/common.hpp>
#include <warden/testing/fake_modules.hpp>

#include <memory>
#include <variant>

namespace {

using warden::schema::account_error_code;
using warden::schema::module_type_t;
using warden::testing::make_module_address;

class module_manager_test : public ::testing::Test {
 protected:
  module_manager_test()
      : registry{std::make_shared<warden::testing::fake_registry>()},
        manager{state, directory, events, registry} {}

  account_error_code install_error(const module_type_t type,
                                   const warden::schema::address_t& module,
                                   const warden::schema::bytes_t& data = {}) {
    try {
      manager.install(type, module, warden::schema::make_bytes_view(data));
    } catch (const warden::common::account_error& ex) {
      return ex.code();
    }
    ADD_FAILURE() << "install unexpectedly succeeded";
    return account_error_code::execution_failed;
  }

  account_error_code uninstall_error(const module_type_t type,
                                     const warden::schema::address_t& module,
                                     const warden::schema::bytes_t& data = {}) {
    try {
      manager.uninstall(type, module, warden::schema::make_bytes_view(data));
    } catch (const warden::common::account_error& ex) {
      return ex.code();
    }
    ADD_FAILURE() << "uninstall unexpectedly succeeded";
    return account_error_code::execution_failed;
  }

  static warden::schema::bytes_t fallback_init(
      const warden::schema::selector_t& selector,
      const warden::schema::call_type_t call_type,
      const warden::schema::bytes_t& handler_init = {}) {
    auto data = warden::schema::bytes_t{std::begin(selector), std::end(selector)};
    data.push_back(static_cast<uint8_t>(call_type));
    data.insert(std::end(data), std::begin(handler_init), std::end(handler_init));
    return data;
  }

  warden::account::account_state_t state;
  warden::testing::fake_directory directory;
  warden::schema::event_log_t events;
  std::shared_ptr<warden::testing::fake_registry> registry;
  warden::account::module_manager manager;
};

}  // namespace

TEST_F(module_manager_test, installs_validator_and_emits_event) {
  auto validator = directory.add(make_module_address(0x01),
                                 {module_type_t::validator});
  auto init = warden::schema::bytes_t{0x42};
  manager.install(module_type_t::validator, make_module_address(0x01),
                  warden::schema::make_bytes_view(init));

  EXPECT_TRUE(manager.is_installed(module_type_t::validator,
                                   make_module_address(0x01), {}));
  ASSERT_EQ(validator->installs.size(), 1u);
  EXPECT_EQ(validator->installs[0], init);
  ASSERT_EQ(events.size(), 1u);
  const auto& event = std::get<warden::schema::module_installed_t>(events[0]);
  EXPECT_EQ(event.module_type, module_type_t::validator);
  EXPECT_EQ(event.module, make_module_address(0x01));
}

TEST_F(module_manager_test, unknown_category_is_unsupported) {
  directory.add(make_module_address(0x01), {module_type_t::validator});
  EXPECT_EQ(install_error(static_cast<module_type_t>(5),
                          make_module_address(0x01)),
            account_error_code::unsupported_module_type);
  EXPECT_EQ(uninstall_error(static_cast<module_type_t>(77),
                            make_module_address(0x01)),
            account_error_code::unsupported_module_type);
  EXPECT_FALSE(manager.is_installed(static_cast<module_type_t>(5),
                                    make_module_address(0x01), {}));
  EXPECT_TRUE(events.empty());
}

TEST_F(module_manager_test, type_mismatch_fails_even_when_registry_allows) {
  directory.add(make_module_address(0x01), {module_type_t::executor});
  EXPECT_EQ(install_error(module_type_t::validator, make_module_address(0x01)),
            account_error_code::mismatch_module_type_id);
  EXPECT_TRUE(registry->queries.empty());
  EXPECT_TRUE(state.registry.empty(module_type_t::validator));
}

TEST_F(module_manager_test, type_mismatch_fails_even_when_registry_denies) {
  directory.add(make_module_address(0x01), {module_type_t::executor});
  registry->denied.insert(make_module_address(0x01));
  EXPECT_EQ(install_error(module_type_t::validator, make_module_address(0x01)),
            account_error_code::mismatch_module_type_id);
}

TEST_F(module_manager_test, registry_can_veto_install) {
  directory.add(make_module_address(0x01), {module_type_t::validator});
  registry->denied.insert(make_module_address(0x01));
  EXPECT_EQ(install_error(module_type_t::validator, make_module_address(0x01)),
            account_error_code::module_rejected_by_registry);
  ASSERT_EQ(registry->queries.size(), 1u);
  EXPECT_EQ(registry->queries[0].second, module_type_t::validator);
}

TEST_F(module_manager_test, zero_and_unknown_addresses_are_rejected) {
  EXPECT_EQ(install_error(module_type_t::validator,
                          warden::schema::make_zero_address()),
            account_error_code::module_address_invalid);
  EXPECT_EQ(install_error(module_type_t::validator, make_module_address(0x09)),
            account_error_code::invalid_module);
}

TEST_F(module_manager_test, duplicate_install_fails_per_category) {
  directory.add(make_module_address(0x01),
                {module_type_t::validator, module_type_t::executor});
  manager.install(module_type_t::validator, make_module_address(0x01), {});
  EXPECT_EQ(install_error(module_type_t::validator, make_module_address(0x01)),
            account_error_code::module_already_installed);

  manager.install(module_type_t::executor, make_module_address(0x01), {});
  EXPECT_TRUE(manager.is_installed(module_type_t::executor,
                                   make_module_address(0x01), {}));
}

TEST_F(module_manager_test, only_one_hook_at_a_time) {
  directory.add(make_module_address(0x01), {module_type_t::hook});
  directory.add(make_module_address(0x02), {module_type_t::hook});
  manager.install(module_type_t::hook, make_module_address(0x01), {});
  EXPECT_EQ(install_error(module_type_t::hook, make_module_address(0x02)),
            account_error_code::hook_already_installed);
  EXPECT_EQ(state.hook, make_module_address(0x01));
}

TEST_F(module_manager_test, fallback_install_routes_selector) {
  auto handler = directory.add(make_module_address(0x01),
                               {module_type_t::fallback});
  auto selector = warden::schema::make_selector(0x12345678);
  manager.install(module_type_t::fallback, make_module_address(0x01),
                  warden::schema::make_bytes_view(fallback_init(
                      selector, warden::schema::call_type_t::static_call,
                      {0x77})));

  ASSERT_TRUE(state.fallbacks.contains(selector));
  EXPECT_EQ(state.fallbacks.at(selector).call_type,
            warden::schema::call_type_t::static_call);
  ASSERT_EQ(handler->installs.size(), 1u);
  EXPECT_EQ(handler->installs[0], (warden::schema::bytes_t{0x77}));

  auto context = warden::schema::bytes_t{std::begin(selector), std::end(selector)};
  EXPECT_TRUE(manager.is_installed(module_type_t::fallback,
                                   make_module_address(0x01),
                                   warden::schema::make_bytes_view(context)));
  EXPECT_FALSE(manager.is_installed(module_type_t::fallback,
                                    make_module_address(0x01), {}));
}

TEST_F(module_manager_test, fallback_install_rules) {
  directory.add(make_module_address(0x01), {module_type_t::fallback});
  directory.add(make_module_address(0x02), {module_type_t::fallback});
  auto selector = warden::schema::make_selector(0x12345678);

  EXPECT_EQ(install_error(module_type_t::fallback, make_module_address(0x01),
                          fallback_init(selector,
                                        warden::schema::call_type_t::batch)),
            account_error_code::fallback_call_type_invalid);
  EXPECT_EQ(install_error(module_type_t::fallback, make_module_address(0x01),
                          fallback_init(warden::schema::selector_t{},
                                        warden::schema::call_type_t::single)),
            account_error_code::fallback_selector_forbidden);
  EXPECT_EQ(install_error(module_type_t::fallback, make_module_address(0x01),
                          fallback_init(warden::account::install_module_selector(),
                                        warden::schema::call_type_t::single)),
            account_error_code::fallback_selector_forbidden);

  manager.install(module_type_t::fallback, make_module_address(0x01),
                  warden::schema::make_bytes_view(fallback_init(
                      selector, warden::schema::call_type_t::single)));
  EXPECT_EQ(install_error(module_type_t::fallback, make_module_address(0x02),
                          fallback_init(selector,
                                        warden::schema::call_type_t::single)),
            account_error_code::fallback_selector_already_used);
}

TEST_F(module_manager_test, uninstall_is_symmetric) {
  auto validator = directory.add(make_module_address(0x01),
                                 {module_type_t::validator});
  manager.install(module_type_t::validator, make_module_address(0x01), {});
  auto deinit = warden::schema::bytes_t{0x99};
  manager.uninstall(module_type_t::validator, make_module_address(0x01),
                    warden::schema::make_bytes_view(deinit));

  EXPECT_FALSE(manager.is_installed(module_type_t::validator,
                                    make_module_address(0x01), {}));
  ASSERT_EQ(validator->uninstalls.size(), 1u);
  EXPECT_EQ(validator->uninstalls[0], deinit);
  ASSERT_EQ(events.size(), 2u);
  EXPECT_TRUE(std::holds_alternative<warden::schema::module_uninstalled_t>(
      events[1]));
}

TEST_F(module_manager_test, uninstalling_missing_module_fails) {
  directory.add(make_module_address(0x01),
                {module_type_t::validator, module_type_t::hook,
                 module_type_t::fallback});
  EXPECT_EQ(uninstall_error(module_type_t::validator, make_module_address(0x01)),
            account_error_code::module_not_installed);
  EXPECT_EQ(uninstall_error(module_type_t::hook, make_module_address(0x01)),
            account_error_code::module_not_installed);
  EXPECT_EQ(uninstall_error(module_type_t::fallback, make_module_address(0x01),
                            {0x01, 0x02, 0x03, 0x04}),
            account_error_code::module_not_installed);
}

TEST_F(module_manager_test, fallback_uninstall_strips_selector) {
  auto handler = directory.add(make_module_address(0x01),
                               {module_type_t::fallback});
  auto selector = warden::schema::make_selector(0x0a0b0c0d);
  manager.install(module_type_t::fallback, make_module_address(0x01),
                  warden::schema::make_bytes_view(fallback_init(
                      selector, warden::schema::call_type_t::single)));

  auto deinit = warden::schema::bytes_t{0x0a, 0x0b, 0x0c, 0x0d, 0x55};
  manager.uninstall(module_type_t::fallback, make_module_address(0x01),
                    warden::schema::make_bytes_view(deinit));
  EXPECT_FALSE(state.fallbacks.contains(selector));
  ASSERT_EQ(handler->uninstalls.size(), 1u);
  EXPECT_EQ(handler->uninstalls[0], (warden::schema::bytes_t{0x55}));
}

TEST_F(module_manager_test, pre_validation_hooks_keep_registration_order) {
  for (uint8_t seed = 3; seed > 0; --seed) {
    directory.add(make_module_address(seed),
                  {module_type_t::pre_validation_hook_operation});
    manager.install(module_type_t::pre_validation_hook_operation,
                    make_module_address(seed), {});
  }
  auto hooks = state.registry.list(module_type_t::pre_validation_hook_operation);
  ASSERT_EQ(hooks.size(), 3u);
  EXPECT_EQ(hooks[0], make_module_address(3));
  EXPECT_EQ(hooks[2], make_module_address(1));
}

TEST_F(module_manager_test, supports_exactly_the_named_categories) {
  for (auto id = uint32_t{0}; id < 16; ++id) {
    auto expected = id == 1 || id == 2 || id == 3 || id == 4 || id == 8 ||
                    id == 9;
    EXPECT_EQ(warden::account::module_manager::supports_module(
                  static_cast<module_type_t>(id)),
              expected)
        << "module type " << id;
  }
}
