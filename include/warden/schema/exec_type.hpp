#pragma once

#include <warden/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: exec type.
// Second byte of an execution mode; selects whether a failing unit aborts
// the request or is reported and skipped.
namespace warden::schema {

enum class exec_type_t : uint8_t { default_exec = 0x00, try_exec = 0x01 };

inline constexpr auto kExecTypeMappings = std::array{
    std::pair<std::string_view, exec_type_t>{"default",
                                             exec_type_t::default_exec},
    std::pair<std::string_view, exec_type_t>{"try", exec_type_t::try_exec}};

template <>
inline std::optional<exec_type_t> try_from_string<exec_type_t>(
    const std::string_view value) {
  return from_string(value, kExecTypeMappings);
}

inline constexpr std::string_view to_string(const exec_type_t value) {
  return to_string(value, kExecTypeMappings).value_or("unknown");
}

}  // namespace warden::schema
