#pragma once
#include <warden/schema/primitives.hpp>

// Schema type: user operation.
// Packed operation handed to the account by the entry point. The upper 160
// bits of `nonce` select the validator.
namespace warden::schema {

template <uint16_t Version>
struct user_operation;

template <>
struct user_operation<1> final {
  address_t sender{};
  sequence_t nonce{};
  bytes_t init_code;
  bytes_t call_data;
  hash32_t account_gas_limits{};
  amount_t pre_verification_gas{};
  hash32_t gas_fees{};
  bytes_t paymaster_and_data;
  bytes_t signature;
};

using user_operation_t = user_operation<1>;

/// Nonce whose upper 160 bits select `validator`; `key` and `sequence` fill
/// the low 96 bits.
sequence_t make_nonce(const address_t& validator,
                      uint32_t key = 0,
                      uint64_t sequence = 0);

}  // namespace warden::schema
