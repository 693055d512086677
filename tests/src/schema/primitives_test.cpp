#include <gtest/gtest.h>
#include <warden/schema/primitives.hpp>
#include <warden/schema/user_operation.hpp>

TEST(primitives, make_hash32_from_hex_string_decodes) {
  auto hash = warden::schema::make_hash32(
      std::string_view{"0x0102030405060708090a0b0c0d0e0f10"
                       "1112131415161718191a1b1c1d1e1f20"});
  EXPECT_EQ(hash[0], 0x01);
  EXPECT_EQ(hash[31], 0x20);
}

TEST(primitives, try_make_address_rejects_wrong_length) {
  EXPECT_FALSE(warden::schema::try_make_address(std::string_view{"0x0102"}));
  EXPECT_FALSE(warden::schema::try_make_address(std::string_view{"zz"}));
  auto address = warden::schema::try_make_address(
      std::string_view{"0x0000000071727De22E5E9d8BAf0edAc6f37da032"});
  ASSERT_TRUE(address.has_value());
  EXPECT_EQ(warden::schema::to_hex(*address),
            "0x0000000071727de22e5e9d8baf0edac6f37da032");
}

TEST(primitives, is_zero_detects_zero_address) {
  EXPECT_TRUE(warden::schema::is_zero(warden::schema::make_zero_address()));
  auto address = warden::schema::make_zero_address();
  address[19] = 1;
  EXPECT_FALSE(warden::schema::is_zero(address));
}

TEST(primitives, selector_is_big_endian) {
  auto selector = warden::schema::make_selector(0x1626ba7e);
  EXPECT_EQ(selector, (warden::schema::selector_t{0x16, 0x26, 0xba, 0x7e}));
  EXPECT_EQ(warden::schema::selector_value(selector), 0x1626ba7eu);
}

TEST(primitives, try_make_selector_needs_four_bytes) {
  auto short_input = warden::schema::bytes_t{0x01, 0x02, 0x03};
  EXPECT_FALSE(warden::schema::try_make_selector(
      warden::schema::make_bytes_view(short_input)));
  auto long_input = warden::schema::bytes_t{0x01, 0x02, 0x03, 0x04, 0x05};
  auto selector = warden::schema::try_make_selector(
      warden::schema::make_bytes_view(long_input));
  ASSERT_TRUE(selector.has_value());
  EXPECT_EQ(*selector, (warden::schema::selector_t{0x01, 0x02, 0x03, 0x04}));
}

TEST(primitives, to_word_left_pads_value) {
  auto word = warden::schema::to_word(warden::schema::amount_t{0x0102});
  EXPECT_EQ(word[29], 0x00);
  EXPECT_EQ(word[30], 0x01);
  EXPECT_EQ(word[31], 0x02);
  EXPECT_EQ(warden::schema::from_word(
                warden::schema::bytes_view_t{word.data(), word.size()}),
            warden::schema::amount_t{0x0102});
}

TEST(primitives, nonce_carries_validator_in_high_bits) {
  auto validator = warden::schema::make_zero_address();
  validator.fill(0x5A);
  auto nonce = warden::schema::make_nonce(validator, 7, 42);
  EXPECT_EQ(warden::schema::address_from_high_bits(nonce), validator);
  EXPECT_EQ(static_cast<uint64_t>(nonce & 0xFFFFFFFFFFFFFFFFull), 42u);
  EXPECT_EQ(static_cast<uint32_t>((nonce >> 64) & 0xFFFFFFFFu), 7u);
}

TEST(primitives, base64_pads_partial_groups) {
  EXPECT_EQ(warden::schema::to_base64(
                warden::schema::bytes_t{0x01, 0x02, 0x03, 0xFE, 0xFF}),
            "AQID/v8=");
  EXPECT_EQ(warden::schema::to_base64(warden::schema::bytes_t{0xFF}), "/w==");
  EXPECT_EQ(warden::schema::to_base64(warden::schema::bytes_t{}), "");
}
