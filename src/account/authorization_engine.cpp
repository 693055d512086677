#include <warden/account/authorization_engine.hpp>
#include <warden/common/error.hpp>
#include <warden/crypto/recover.hpp>
#include <warden/schema/validation_data.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <utility>

using namespace warden::schema;

namespace warden::account {

namespace {

inline constexpr auto kValidatorPrefixSize = std::size_t{20};

}  // namespace

authorization_engine::authorization_engine(const account_state_t& state,
                                           module_directory& directory,
                                           const address_t& self)
    : state_{state}, directory_{directory}, self_{self} {}

bool authorization_engine::bootstrap_available() const {
  return !state_.initialized &&
         state_.registry.empty(module_type_t::validator);
}

bool authorization_engine::is_self_signature(
    const hash32_t& challenge,
    const bytes_view_t& signature) const {
  auto signer = warden::crypto::recover_signer(
      warden::crypto::signed_message_hash(challenge), signature);
  if (!signer) {
    spdlog::debug("Bootstrap signature is malformed");
    return false;
  }
  return *signer == self_;
}

validation_data_t authorization_engine::validate_user_op(
    const user_operation_t& op,
    const hash32_t& op_hash,
    const amount_t& missing_funds) const {
  auto validator = address_from_high_bits(op.nonce);

  if (!state_.registry.contains(module_type_t::validator, validator)) {
    if (!bootstrap_available()) {
      spdlog::debug("Validator {} is not installed", to_hex(validator));
      return kValidationFailed;
    }
    spdlog::debug("No validator installed, checking self signature");
    return is_self_signature(op_hash, make_bytes_view(op.signature))
               ? kValidationSuccess
               : kValidationFailed;
  }

  auto request = op;
  auto hash = op_hash;
  for (const auto& address :
       state_.registry.list(module_type_t::pre_validation_hook_operation)) {
    auto hook = resolve<pre_validation_hook_module>(directory_, address);
    auto [rewritten_hash, rewritten_signature] =
        hook->transform_operation(request, missing_funds, hash);
    hash = rewritten_hash;
    request.signature = std::move(rewritten_signature);
  }

  spdlog::debug("Delegating user operation to validator {}",
                to_hex(validator));
  return resolve<validator_module>(directory_, validator)
      ->validate_user_op(request, hash);
}

selector_t authorization_engine::is_valid_signature(
    const address_t& sender,
    const hash32_t& hash,
    const bytes_view_t& signature) const {
  auto validator = try_make_address(
      signature.first(std::min(signature.size(), kValidatorPrefixSize)));
  if (!validator) {
    throw warden::common::account_error{
        account_error_code::malformed_calldata,
        "signature must start with a 20-byte validator address"};
  }
  auto inner = signature.subspan(kValidatorPrefixSize);

  if (!state_.registry.contains(module_type_t::validator, *validator)) {
    if (!bootstrap_available()) {
      throw warden::common::account_error{account_error_code::invalid_module,
                                          to_hex(*validator)};
    }
    spdlog::debug("No validator installed, checking self signature");
    return is_self_signature(hash, inner) ? kSignatureMagicValue
                                          : kSignatureFailedValue;
  }

  auto current_hash = hash;
  auto current_signature = make_bytes(inner);
  for (const auto& address :
       state_.registry.list(module_type_t::pre_validation_hook_signature)) {
    auto hook = resolve<pre_validation_hook_module>(directory_, address);
    auto [rewritten_hash, rewritten_signature] = hook->transform_signature(
        sender, current_hash, make_bytes_view(current_signature));
    current_hash = rewritten_hash;
    current_signature = std::move(rewritten_signature);
  }

  return resolve<validator_module>(directory_, *validator)
      ->is_valid_signature_with_sender(sender, current_hash,
                                       make_bytes_view(current_signature));
}

}  // namespace warden::account
