#pragma once

#include <warden/schema/module_type.hpp>
#include <warden/schema/primitives.hpp>
#include <warden/schema/user_operation.hpp>

#include <cstdint>
#include <utility>
#include <vector>

namespace warden::account {

/// What a hook module observes before a privileged operation runs.
struct call_context_t final {
  warden::schema::address_t sender{};
  warden::schema::address_t target{};
  warden::schema::amount_t value{};
  warden::schema::bytes_t data;
};

/// Batch indices that failed under TRY. Empty means full success.
struct hook_outcome_t final {
  std::vector<uint64_t> failed_units;
};

/// Installable unit of account behaviour. Every category derives from it
/// virtually so one object may serve several categories.
class module {
 public:
  virtual ~module() = default;

  virtual void on_install(const warden::schema::bytes_view_t& data) = 0;
  virtual void on_uninstall(const warden::schema::bytes_view_t& data) = 0;

  /// Self-reported category support, checked before every install.
  virtual bool is_module_type(warden::schema::module_type_t type) const = 0;
};

class validator_module : public virtual module {
 public:
  /// Raw verdict: 0 success, 1 failure, anything else module specific.
  virtual warden::schema::validation_data_t validate_user_op(
      const warden::schema::user_operation_t& op,
      const warden::schema::hash32_t& op_hash) = 0;

  /// ERC-1271 style verdict for an off-band signature.
  virtual warden::schema::selector_t is_valid_signature_with_sender(
      const warden::schema::address_t& sender,
      const warden::schema::hash32_t& hash,
      const warden::schema::bytes_view_t& signature) = 0;
};

/// Executors drive execute_from_executor; they need no extra surface.
class executor_module : public virtual module {};

class hook_module : public virtual module {
 public:
  /// Returns an opaque token handed back to post_check.
  virtual warden::schema::bytes_t pre_check(const call_context_t& context) = 0;

  virtual void post_check(const warden::schema::bytes_view_t& token,
                          const hook_outcome_t& outcome) = 0;
};

/// Fallback handlers are reached through the execution host, never called
/// directly by the account.
class fallback_module : public virtual module {};

class pre_validation_hook_module : public virtual module {
 public:
  using signature_request_t =
      std::pair<warden::schema::hash32_t, warden::schema::bytes_t>;

  /// Rewrite `(hash, signature)` on the direct-signature path.
  virtual signature_request_t transform_signature(
      const warden::schema::address_t& sender,
      const warden::schema::hash32_t& hash,
      const warden::schema::bytes_view_t& signature) = 0;

  /// Rewrite `(op_hash, signature)` on the transaction path.
  virtual signature_request_t transform_operation(
      const warden::schema::user_operation_t& op,
      const warden::schema::amount_t& missing_funds,
      const warden::schema::hash32_t& op_hash) = 0;
};

}  // namespace warden::account
