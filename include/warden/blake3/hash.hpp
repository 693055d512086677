#pragma once
#include <warden/schema/primitives.hpp>
#include <cstdint>
#include <initializer_list>
#include <span>
#include <string_view>

namespace warden::blake3 {

warden::schema::hash32_t hash(const std::string_view& str);
warden::schema::hash32_t hash(const std::span<const uint8_t>& bytes);

/// Hash of the concatenation of `parts`, in order.
warden::schema::hash32_t hash(
    std::initializer_list<std::span<const uint8_t>> parts);

}  // namespace warden::blake3
