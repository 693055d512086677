#include <gtest/gtest.h>
#include <warden/account/hook_wrapper.hpp>
#include <warden/common/error.hpp>
#include <warden/testing/common.hpp>
#include <warden/testing/fake_modules.hpp>

#include <optional>
#include <stdexcept>
#include <vector>

namespace {

using warden::schema::module_type_t;
using warden::testing::make_module_address;

warden::account::call_context_t make_context() {
  return warden::account::call_context_t{make_module_address(0x0E),
                                         make_module_address(0x5E), 7,
                                         {0x01, 0x02}};
}

}  // namespace

TEST(hook_wrapper, passthrough_without_hook) {
  auto directory = warden::testing::fake_directory{};
  auto events = warden::schema::event_log_t{};
  auto ran = false;

  auto result = warden::account::with_hook(std::nullopt, directory, events,
                                           make_context(), [&] {
                                             ran = true;
                                             return 42;
                                           });
  EXPECT_TRUE(ran);
  EXPECT_EQ(result, 42);
}

TEST(hook_wrapper, brackets_body_with_pre_and_post_check) {
  auto directory = warden::testing::fake_directory{};
  auto events = warden::schema::event_log_t{};
  auto hook = directory.add(make_module_address(0x11), {module_type_t::hook});
  hook->token = {0x0F, 0x0E};

  auto pre_checks_seen_by_body = std::size_t{};
  warden::account::with_hook(make_module_address(0x11), directory, events,
                             make_context(), [&] {
                               pre_checks_seen_by_body = hook->pre_checks.size();
                               EXPECT_TRUE(hook->post_checks.empty());
                             });

  EXPECT_EQ(pre_checks_seen_by_body, 1u);
  ASSERT_EQ(hook->pre_checks.size(), 1u);
  EXPECT_EQ(hook->pre_checks[0].sender, make_module_address(0x0E));
  EXPECT_EQ(hook->pre_checks[0].target, make_module_address(0x5E));
  EXPECT_EQ(hook->pre_checks[0].value, 7);
  EXPECT_EQ(hook->pre_checks[0].data, (warden::schema::bytes_t{0x01, 0x02}));

  ASSERT_EQ(hook->post_checks.size(), 1u);
  EXPECT_EQ(hook->post_checks[0].first, (warden::schema::bytes_t{0x0F, 0x0E}));
  EXPECT_TRUE(hook->post_checks[0].second.failed_units.empty());
}

TEST(hook_wrapper, post_check_learns_failed_units_of_this_call_only) {
  auto directory = warden::testing::fake_directory{};
  auto events = warden::schema::event_log_t{
      warden::schema::try_execute_unsuccessful_t{9, {}}};
  auto hook = directory.add(make_module_address(0x11), {module_type_t::hook});

  warden::account::with_hook(
      make_module_address(0x11), directory, events, make_context(), [&] {
        events.emplace_back(warden::schema::try_execute_unsuccessful_t{1, {}});
        events.emplace_back(warden::schema::module_installed_t{});
        events.emplace_back(warden::schema::try_execute_unsuccessful_t{3, {}});
      });

  ASSERT_EQ(hook->post_checks.size(), 1u);
  EXPECT_EQ(hook->post_checks[0].second.failed_units,
            (std::vector<uint64_t>{1, 3}));
}

TEST(hook_wrapper, failed_delegate_call_reports_unit_zero) {
  auto events = warden::schema::event_log_t{
      warden::schema::try_delegate_call_unsuccessful_t{{0x01}, {0x02}}};
  auto outcome = warden::account::collect_outcome(events, 0);
  EXPECT_EQ(outcome.failed_units, (std::vector<uint64_t>{0}));
}

TEST(hook_wrapper, body_failure_skips_post_check) {
  auto directory = warden::testing::fake_directory{};
  auto events = warden::schema::event_log_t{};
  auto hook = directory.add(make_module_address(0x11), {module_type_t::hook});

  EXPECT_THROW(warden::account::with_hook(
                   make_module_address(0x11), directory, events,
                   make_context(),
                   [] { throw warden::common::revert_error{{0xDE, 0xAD}}; }),
               warden::common::revert_error);
  EXPECT_EQ(hook->pre_checks.size(), 1u);
  EXPECT_TRUE(hook->post_checks.empty());
}

TEST(hook_wrapper, pre_check_failure_prevents_body) {
  auto directory = warden::testing::fake_directory{};
  auto events = warden::schema::event_log_t{};
  auto hook = directory.add(make_module_address(0x11), {module_type_t::hook});
  hook->throw_on_pre_check = true;
  auto ran = false;

  EXPECT_THROW(warden::account::with_hook(make_module_address(0x11), directory,
                                          events, make_context(),
                                          [&] { ran = true; }),
               std::runtime_error);
  EXPECT_FALSE(ran);
  EXPECT_TRUE(hook->post_checks.empty());
}
