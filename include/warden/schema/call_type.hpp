#pragma once

#include <warden/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: call type.
// First byte of an execution mode. Values outside the named set decode
// without error and are rejected by the dispatch engine.
namespace warden::schema {

enum class call_type_t : uint8_t {
  single = 0x00,
  batch = 0x01,
  static_call = 0xFE,
  delegate_call = 0xFF
};

inline constexpr auto kCallTypeMappings = std::array{
    std::pair<std::string_view, call_type_t>{"single", call_type_t::single},
    std::pair<std::string_view, call_type_t>{"batch", call_type_t::batch},
    std::pair<std::string_view, call_type_t>{"static_call",
                                             call_type_t::static_call},
    std::pair<std::string_view, call_type_t>{"delegate_call",
                                             call_type_t::delegate_call}};

template <>
inline std::optional<call_type_t> try_from_string<call_type_t>(
    const std::string_view value) {
  return from_string(value, kCallTypeMappings);
}

inline constexpr std::string_view to_string(const call_type_t value) {
  return to_string(value, kCallTypeMappings).value_or("unknown");
}

}  // namespace warden::schema
