#pragma once

#include <warden/schema/execution.hpp>
#include <warden/schema/primitives.hpp>

#include <vector>

// Payload layouts of the three call types:
//   single   target(20) || value(32, big-endian) || call_data
//   batch    SCALE vector<execution_t>
//   delegate target(20) || call_data
// Decoders throw account_error(malformed_calldata) on short or corrupt input.
namespace warden::account {

struct delegate_execution_t final {
  warden::schema::address_t target{};
  warden::schema::bytes_t call_data;
};

warden::schema::bytes_t encode_single(
    const warden::schema::execution_t& execution);
warden::schema::execution_t decode_single(
    const warden::schema::bytes_view_t& payload);

warden::schema::bytes_t encode_batch(
    const std::vector<warden::schema::execution_t>& executions);
std::vector<warden::schema::execution_t> decode_batch(
    const warden::schema::bytes_view_t& payload);

warden::schema::bytes_t encode_delegate(
    const delegate_execution_t& execution);
delegate_execution_t decode_delegate(
    const warden::schema::bytes_view_t& payload);

}  // namespace warden::account
