#include <warden/common/critical.hpp>
#include <warden/schema/primitives.hpp>

#include <algorithm>
#include <iterator>
#include <string_view>

namespace warden::schema {

namespace {

std::string_view normalize_hex(std::string_view input) {
  if (input.size() >= 2 && input[0] == '0' &&
      (input[1] == 'x' || input[1] == 'X')) {
    input.remove_prefix(2);
  }
  return input;
}

std::optional<uint8_t> hex_nibble(const char c) {
  if (c >= '0' && c <= '9') {
    return static_cast<uint8_t>(c - '0');
  }
  if (c >= 'a' && c <= 'f') {
    return static_cast<uint8_t>(c - 'a' + 10);
  }
  if (c >= 'A' && c <= 'F') {
    return static_cast<uint8_t>(c - 'A' + 10);
  }
  return std::nullopt;
}

std::optional<bytes_t> try_from_hex_internal(std::string_view hex) {
  hex = normalize_hex(hex);
  if ((hex.size() % 2) != 0) {
    return std::nullopt;
  }

  auto decoded = bytes_t{};
  decoded.reserve(hex.size() / 2);
  for (size_t i = 0; i < hex.size(); i += 2) {
    auto high = hex_nibble(hex[i]);
    auto low = hex_nibble(hex[i + 1]);
    if (!high || !low) {
      return std::nullopt;
    }
    decoded.push_back(static_cast<uint8_t>((*high << 4u) | *low));
  }
  return decoded;
}

template <std::size_t N>
std::optional<std::array<uint8_t, N>> try_make_fixed(const bytes_view_t& bytes) {
  if (bytes.size() != N) {
    return std::nullopt;
  }
  auto out = std::array<uint8_t, N>{};
  std::copy(std::begin(bytes), std::end(bytes), std::begin(out));
  return out;
}

}  // namespace

bytes_t make_bytes(const bytes_view_t& bytes) {
  return bytes_t{std::begin(bytes), std::end(bytes)};
}

bytes_t make_bytes(const std::string& bytes) {
  return bytes_t{std::begin(bytes), std::end(bytes)};
}

bytes_t make_bytes(const std::string_view& bytes) {
  return bytes_t{std::begin(bytes), std::end(bytes)};
}

bytes_view_t make_bytes_view(const bytes_t& bytes) {
  return bytes_view_t{bytes};
}

bytes_view_t make_bytes_view(const std::string& bytes) {
  return bytes_view_t{reinterpret_cast<const uint8_t*>(bytes.c_str()),
                      bytes.size()};
}

bytes_view_t make_bytes_view(const std::string_view& bytes) {
  return bytes_view_t{reinterpret_cast<const uint8_t*>(bytes.data()),
                      bytes.size()};
}

hash32_t make_hash32(const bytes_t& bytes) {
  return make_hash32(bytes_view_t{bytes.data(), bytes.size()});
}

hash32_t make_hash32(const bytes_view_t& bytes) {
  auto hash = try_make_fixed<32>(bytes);
  if (!hash) {
    warden::common::critical("make_hash32 expected exactly 32 bytes");
  }
  return *hash;
}

hash32_t make_hash32(const std::string_view& hex) {
  auto hash = try_make_hash32(hex);
  if (!hash) {
    warden::common::critical("make_hash32 expected 32 hex-encoded bytes");
  }
  return *hash;
}

std::optional<hash32_t> try_make_hash32(const std::string_view& hex) {
  auto decoded = try_from_hex_internal(hex);
  if (!decoded) {
    return std::nullopt;
  }
  return try_make_fixed<32>(bytes_view_t{decoded->data(), decoded->size()});
}

address_t make_address(const std::string_view& hex) {
  auto address = try_make_address(hex);
  if (!address) {
    warden::common::critical("make_address expected 20 hex-encoded bytes");
  }
  return *address;
}

std::optional<address_t> try_make_address(const std::string_view& hex) {
  auto decoded = try_from_hex_internal(hex);
  if (!decoded) {
    return std::nullopt;
  }
  return try_make_fixed<20>(bytes_view_t{decoded->data(), decoded->size()});
}

std::optional<address_t> try_make_address(const bytes_view_t& bytes) {
  return try_make_fixed<20>(bytes);
}

address_t make_zero_address() {
  return {};
}

bool is_zero(const address_t& address) {
  return std::all_of(std::begin(address), std::end(address),
                     [](const uint8_t byte) { return byte == 0; });
}

selector_t make_selector(const uint32_t value) {
  auto buffer = boost::endian::big_uint32_buf_t{value};
  auto selector = selector_t{};
  std::copy_n(buffer.data(), selector.size(), std::begin(selector));
  return selector;
}

uint32_t selector_value(const selector_t& selector) {
  auto buffer = boost::endian::big_uint32_buf_t{};
  std::copy_n(std::begin(selector), selector.size(),
              reinterpret_cast<uint8_t*>(buffer.data()));
  return buffer.value();
}

std::optional<selector_t> try_make_selector(const bytes_view_t& bytes) {
  if (bytes.size() < 4) {
    return std::nullopt;
  }
  return try_make_fixed<4>(bytes.first(4));
}

hash32_t to_word(const boost::multiprecision::uint256_t& value) {
  auto significant = bytes_t{};
  boost::multiprecision::export_bits(value, std::back_inserter(significant), 8);
  auto word = hash32_t{};
  std::copy(std::begin(significant), std::end(significant),
            std::end(word) - static_cast<std::ptrdiff_t>(significant.size()));
  return word;
}

boost::multiprecision::uint256_t from_word(const bytes_view_t& word) {
  auto value = boost::multiprecision::uint256_t{};
  boost::multiprecision::import_bits(value, std::begin(word), std::end(word), 8);
  return value;
}

address_t address_from_high_bits(const boost::multiprecision::uint256_t& word) {
  auto bytes = to_word(word);
  auto address = address_t{};
  std::copy_n(std::begin(bytes), address.size(), std::begin(address));
  return address;
}

std::string to_hex(const bytes_view_t& bytes) {
  static constexpr auto kHex = std::string_view{"0123456789abcdef"};
  auto out = std::string{};
  out.resize(bytes.size() * 2);
  for (std::size_t i = 0; i < bytes.size(); ++i) {
    out[(2 * i)] = kHex[(bytes[i] >> 4u) & 0x0Fu];
    out[(2 * i) + 1] = kHex[bytes[i] & 0x0Fu];
  }
  return out;
}

std::string to_hex(const address_t& address) {
  return "0x" + to_hex(bytes_view_t{address.data(), address.size()});
}

std::optional<bytes_t> try_from_hex(const std::string_view hex) {
  return try_from_hex_internal(hex);
}

std::string to_base64(const bytes_view_t& bytes) {
  static constexpr auto kTable =
      "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";
  auto out = std::string{};
  out.reserve(((bytes.size() + 2) / 3) * 4);

  auto index = size_t{0};
  while ((index + 3) <= bytes.size()) {
    auto value = (static_cast<uint32_t>(bytes[index]) << 16u) |
                 (static_cast<uint32_t>(bytes[index + 1]) << 8u) |
                 static_cast<uint32_t>(bytes[index + 2]);
    out.push_back(kTable[(value >> 18u) & 0x3Fu]);
    out.push_back(kTable[(value >> 12u) & 0x3Fu]);
    out.push_back(kTable[(value >> 6u) & 0x3Fu]);
    out.push_back(kTable[value & 0x3Fu]);
    index += 3;
  }

  if (index < bytes.size()) {
    auto value = static_cast<uint32_t>(bytes[index]) << 16u;
    out.push_back(kTable[(value >> 18u) & 0x3Fu]);
    if ((index + 1) < bytes.size()) {
      value |= static_cast<uint32_t>(bytes[index + 1]) << 8u;
      out.push_back(kTable[(value >> 12u) & 0x3Fu]);
      out.push_back(kTable[(value >> 6u) & 0x3Fu]);
      out.push_back('=');
    } else {
      out.push_back(kTable[(value >> 12u) & 0x3Fu]);
      out.push_back('=');
      out.push_back('=');
    }
  }

  return out;
}

std::string to_base64(const bytes_t& bytes) {
  return to_base64(bytes_view_t{bytes.data(), bytes.size()});
}

}  // namespace warden::schema
