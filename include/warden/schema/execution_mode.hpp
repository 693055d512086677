#pragma once

#include <warden/schema/call_type.hpp>
#include <warden/schema/exec_type.hpp>
#include <warden/schema/primitives.hpp>

#include <array>
#include <cstdint>

namespace warden::schema {

/// 32-byte mode descriptor:
/// [0] call type, [1] exec type, [2..6) unused, [6..10) mode selector,
/// [10..32) mode payload.
using execution_mode_t = std::array<uint8_t, 32>;

using mode_selector_t = std::array<uint8_t, 4>;
using mode_payload_t = std::array<uint8_t, 22>;

struct decoded_mode_t final {
  call_type_t call_type{call_type_t::single};
  exec_type_t exec_type{exec_type_t::default_exec};
  std::array<uint8_t, 4> unused{};
  mode_selector_t selector{};
  mode_payload_t payload{};
};

/// Total over the encoding space; unknown call/exec bytes are preserved.
decoded_mode_t decode_mode(const execution_mode_t& mode);

execution_mode_t encode_mode(const decoded_mode_t& decoded);

execution_mode_t encode_mode(call_type_t call_type,
                             exec_type_t exec_type,
                             const mode_selector_t& selector = {},
                             const mode_payload_t& payload = {});

bool is_supported_call_type(call_type_t call_type);
bool is_supported_exec_type(exec_type_t exec_type);

}  // namespace warden::schema
