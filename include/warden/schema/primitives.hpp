#pragma once
#include <array>
#include <boost/endian/buffers.hpp>
#include <boost/multiprecision/cpp_int.hpp>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace warden::schema {

using bytes_t = std::vector<uint8_t>;
using bytes_view_t = std::span<const uint8_t>;
using hash32_t = std::array<uint8_t, 32>;
using address_t = std::array<uint8_t, 20>;
using selector_t = std::array<uint8_t, 4>;
using amount_t = boost::multiprecision::uint256_t;
using sequence_t = boost::multiprecision::uint256_t;
using validation_data_t = boost::multiprecision::uint256_t;

bytes_t make_bytes(const bytes_view_t& bytes);
bytes_t make_bytes(const std::string& bytes);
bytes_t make_bytes(const std::string_view& bytes);

bytes_view_t make_bytes_view(const bytes_t& bytes);
bytes_view_t make_bytes_view(const std::string& bytes);
bytes_view_t make_bytes_view(const std::string_view& bytes);

hash32_t make_hash32(const bytes_t& bytes);
hash32_t make_hash32(const bytes_view_t& bytes);
hash32_t make_hash32(const std::string_view& hex);
std::optional<hash32_t> try_make_hash32(const std::string_view& hex);

address_t make_address(const std::string_view& hex);
std::optional<address_t> try_make_address(const std::string_view& hex);
std::optional<address_t> try_make_address(const bytes_view_t& bytes);
address_t make_zero_address();
bool is_zero(const address_t& address);

selector_t make_selector(uint32_t value);
uint32_t selector_value(const selector_t& selector);
std::optional<selector_t> try_make_selector(const bytes_view_t& bytes);

/// Big-endian 32-byte word of a 256-bit value.
hash32_t to_word(const boost::multiprecision::uint256_t& value);
boost::multiprecision::uint256_t from_word(const bytes_view_t& word);

/// Upper 160 bits of a 256-bit word interpreted as an address.
address_t address_from_high_bits(const boost::multiprecision::uint256_t& word);

std::string to_hex(const bytes_view_t& bytes);
std::string to_hex(const address_t& address);
std::optional<bytes_t> try_from_hex(const std::string_view hex);

std::string to_base64(const bytes_view_t& bytes);
std::string to_base64(const bytes_t& bytes);

}  // namespace warden::schema

template <class... Ts>
struct overloaded : Ts... {
  using Ts::operator()...;
};
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;
