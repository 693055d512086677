#include <gtest/gtest.h>
#include <warden/account/account.hpp>
#include <warden/schema/execution_mode.hpp>

#include <array>

TEST(execution_mode, decode_splits_fields) {
  auto mode = warden::schema::execution_mode_t{};
  mode[0] = 0x01;
  mode[1] = 0x01;
  mode[6] = 0xAA;
  mode[9] = 0xBB;
  mode[10] = 0xCC;
  mode[31] = 0xDD;

  auto decoded = warden::schema::decode_mode(mode);
  EXPECT_EQ(decoded.call_type, warden::schema::call_type_t::batch);
  EXPECT_EQ(decoded.exec_type, warden::schema::exec_type_t::try_exec);
  EXPECT_EQ(decoded.selector[0], 0xAA);
  EXPECT_EQ(decoded.selector[3], 0xBB);
  EXPECT_EQ(decoded.payload[0], 0xCC);
  EXPECT_EQ(decoded.payload[21], 0xDD);
  EXPECT_EQ(warden::schema::encode_mode(decoded), mode);
}

TEST(execution_mode, unknown_bytes_decode_without_error) {
  auto mode = warden::schema::execution_mode_t{};
  mode[0] = 0x42;
  mode[1] = 0x07;
  auto decoded = warden::schema::decode_mode(mode);
  EXPECT_EQ(static_cast<uint8_t>(decoded.call_type), 0x42);
  EXPECT_FALSE(warden::schema::is_supported_call_type(decoded.call_type));
  EXPECT_FALSE(warden::schema::is_supported_exec_type(decoded.exec_type));
}

TEST(execution_mode, supports_exactly_six_combinations) {
  auto supported = 0;
  for (auto call = 0; call < 256; ++call) {
    for (auto exec = 0; exec < 256; ++exec) {
      auto mode = warden::schema::execution_mode_t{};
      mode[0] = static_cast<uint8_t>(call);
      mode[1] = static_cast<uint8_t>(exec);
      if (warden::account::account::supports_execution_mode(mode)) {
        ++supported;
      }
    }
  }
  EXPECT_EQ(supported, 6);
}

TEST(execution_mode, static_call_is_not_an_execution_mode) {
  auto mode = warden::schema::encode_mode(
      warden::schema::call_type_t::static_call,
      warden::schema::exec_type_t::default_exec);
  EXPECT_FALSE(warden::account::account::supports_execution_mode(mode));
}

TEST(execution_mode, selector_and_payload_do_not_affect_support) {
  auto selector = warden::schema::mode_selector_t{0x01, 0x02, 0x03, 0x04};
  auto payload = warden::schema::mode_payload_t{};
  payload.fill(0xEE);
  auto mode = warden::schema::encode_mode(
      warden::schema::call_type_t::delegate_call,
      warden::schema::exec_type_t::try_exec, selector, payload);
  EXPECT_TRUE(warden::account::account::supports_execution_mode(mode));
}
