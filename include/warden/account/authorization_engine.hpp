#pragma once

#include <warden/account/account_state.hpp>
#include <warden/account/module_directory.hpp>
#include <warden/schema/primitives.hpp>
#include <warden/schema/user_operation.hpp>

namespace warden::account {

/// Picks the validator for a request, runs the pre-validation pipeline and
/// returns the validator's verdict. Rejections are sentinel values, never
/// exceptions.
///
/// While the account is uninitialized and has no validator, a request
/// naming an unknown validator falls back to checking that the account's
/// own key signed the challenge.
class authorization_engine final {
 public:
  authorization_engine(const account_state_t& state,
                       module_directory& directory,
                       const warden::schema::address_t& self);

  /// Validator = upper 160 bits of `op.nonce`.
  warden::schema::validation_data_t validate_user_op(
      const warden::schema::user_operation_t& op,
      const warden::schema::hash32_t& op_hash,
      const warden::schema::amount_t& missing_funds) const;

  /// Validator = first 20 bytes of `signature`; the rest is handed on.
  warden::schema::selector_t is_valid_signature(
      const warden::schema::address_t& sender,
      const warden::schema::hash32_t& hash,
      const warden::schema::bytes_view_t& signature) const;

  bool bootstrap_available() const;

 private:
  /// False for malformed signatures as well as foreign signers.
  bool is_self_signature(const warden::schema::hash32_t& challenge,
                         const warden::schema::bytes_view_t& signature) const;

  const account_state_t& state_;
  module_directory& directory_;
  warden::schema::address_t self_;
};

}  // namespace warden::account
