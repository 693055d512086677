#pragma once

#include <warden/account/account_config.hpp>
#include <warden/account/account_state.hpp>
#include <warden/account/authorization_engine.hpp>
#include <warden/account/execution_engine.hpp>
#include <warden/account/execution_host.hpp>
#include <warden/account/module_directory.hpp>
#include <warden/account/module_manager.hpp>
#include <warden/account/redelegation_guard.hpp>
#include <warden/schema/account_event.hpp>
#include <warden/schema/account_snapshot.hpp>
#include <warden/schema/bootstrap_config.hpp>
#include <warden/schema/execution_mode.hpp>
#include <warden/schema/fallback_handler.hpp>
#include <warden/schema/module_type.hpp>
#include <warden/schema/primitives.hpp>
#include <warden/schema/user_operation.hpp>

#include <optional>
#include <string_view>
#include <type_traits>
#include <vector>

namespace warden::account {

/// Modular smart account.
///
/// Every public mutating operation is atomic: on failure the module
/// bookkeeping, the host's side-effect journal and the event log are put back
/// as they were when the operation was entered, and the error propagates.
class account final {
 public:
  /// Records the host's current delegation target, so a redelegation before
  /// `initialize_account` is purged there.
  account(account_config_t config,
          module_directory& directory,
          execution_host& host);

  account(const account&) = delete;
  account& operator=(const account&) = delete;

  static std::string_view account_id();

  /// One-time setup. Purges trust first when the recorded delegation target
  /// no longer matches the host.
  void initialize_account(const warden::schema::address_t& caller,
                          const warden::schema::bootstrap_config_t& config);

  /// Entry point only. Pays `missing_funds` to the entry point, then returns
  /// the verdict of the validator selected by `op.nonce`.
  warden::schema::validation_data_t validate_user_op(
      const warden::schema::address_t& caller,
      const warden::schema::user_operation_t& op,
      const warden::schema::hash32_t& op_hash,
      const warden::schema::amount_t& missing_funds);

  warden::schema::selector_t is_valid_signature(
      const warden::schema::address_t& sender,
      const warden::schema::hash32_t& hash,
      const warden::schema::bytes_view_t& signature) const;

  void execute(const warden::schema::address_t& caller,
               const warden::schema::execution_mode_t& mode,
               const warden::schema::bytes_view_t& execution_data);

  std::vector<warden::schema::bytes_t> execute_from_executor(
      const warden::schema::address_t& caller,
      const warden::schema::execution_mode_t& mode,
      const warden::schema::bytes_view_t& execution_data);

  /// Entry point only. `op.call_data` is an encoded `account_call_t` run as
  /// a call from the account to itself.
  void execute_user_op(const warden::schema::address_t& caller,
                       const warden::schema::user_operation_t& op,
                       const warden::schema::hash32_t& op_hash);

  void install_module(const warden::schema::address_t& caller,
                      warden::schema::module_type_t type,
                      const warden::schema::address_t& module,
                      const warden::schema::bytes_view_t& init_data);

  void uninstall_module(const warden::schema::address_t& caller,
                        warden::schema::module_type_t type,
                        const warden::schema::address_t& module,
                        const warden::schema::bytes_view_t& deinit_data);

  bool is_module_installed(warden::schema::module_type_t type,
                           const warden::schema::address_t& module,
                           const warden::schema::bytes_view_t& context) const;

  static bool supports_module(warden::schema::module_type_t type);
  static bool supports_execution_mode(
      const warden::schema::execution_mode_t& mode);

  /// Route an unknown operation to the fallback handler registered for its
  /// leading selector.
  warden::schema::bytes_t fallback(const warden::schema::address_t& caller,
                                   const warden::schema::amount_t& value,
                                   const warden::schema::bytes_view_t& data);

  void on_redelegation(const warden::schema::address_t& caller);

  std::vector<warden::schema::address_t> validators() const;
  std::vector<warden::schema::address_t> executors() const;
  std::vector<warden::schema::address_t> pre_validation_hooks(
      warden::schema::module_type_t type) const;
  std::optional<warden::schema::address_t> active_hook() const;
  std::optional<warden::schema::fallback_handler_t> fallback_handler(
      const warden::schema::selector_t& selector) const;
  const warden::schema::address_t& entry_point() const;
  const warden::schema::address_t& self() const;
  bool is_initialized() const;

  const warden::schema::event_log_t& events() const;
  warden::schema::event_log_t take_events();

  warden::schema::account_snapshot_t snapshot() const;
  void restore(const warden::schema::account_snapshot_t& snapshot);

 private:
  void require_entry_point(const warden::schema::address_t& caller) const;
  void require_entry_point_or_self(
      const warden::schema::address_t& caller) const;

  call_context_t make_context(const warden::schema::address_t& caller,
                              const warden::schema::amount_t& value,
                              warden::schema::bytes_t data) const;

  template <typename Body>
  auto atomically(Body&& body) -> std::invoke_result_t<Body>;

  account_config_t config_;
  module_directory& directory_;
  execution_host& host_;
  account_state_t state_;
  warden::schema::event_log_t events_;
  module_manager manager_;
  authorization_engine authorizer_;
  execution_engine executor_;
  redelegation_guard guard_;
};

}  // namespace warden::account
