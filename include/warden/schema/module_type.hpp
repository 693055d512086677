#pragma once

#include <warden/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: module type.
// Category under which a module is installed. Any 32-bit value can be
// requested; only the named categories are supported.
namespace warden::schema {

enum class module_type_t : uint32_t {
  validator = 1,
  executor = 2,
  fallback = 3,
  hook = 4,
  pre_validation_hook_signature = 8,
  pre_validation_hook_operation = 9
};

inline constexpr auto kModuleTypeMappings = std::array{
    std::pair<std::string_view, module_type_t>{"validator",
                                               module_type_t::validator},
    std::pair<std::string_view, module_type_t>{"executor",
                                               module_type_t::executor},
    std::pair<std::string_view, module_type_t>{"fallback",
                                               module_type_t::fallback},
    std::pair<std::string_view, module_type_t>{"hook", module_type_t::hook},
    std::pair<std::string_view, module_type_t>{
        "pre_validation_hook_signature",
        module_type_t::pre_validation_hook_signature},
    std::pair<std::string_view, module_type_t>{
        "pre_validation_hook_operation",
        module_type_t::pre_validation_hook_operation}};

template <>
inline std::optional<module_type_t> try_from_string<module_type_t>(
    const std::string_view value) {
  return from_string(value, kModuleTypeMappings);
}

inline constexpr std::string_view to_string(const module_type_t value) {
  return to_string(value, kModuleTypeMappings).value_or("unknown");
}

inline constexpr uint32_t to_id(const module_type_t value) {
  return static_cast<uint32_t>(value);
}

}  // namespace warden::schema
