#pragma once

#include <warden/account/account_state.hpp>
#include <warden/account/execution_host.hpp>
#include <warden/account/module_directory.hpp>
#include <warden/account/module_manager.hpp>

namespace warden::account {

/// Strips trust-bearing modules when the account's delegation target moves.
class redelegation_guard final {
 public:
  redelegation_guard(account_state_t& state,
                     module_manager& manager,
                     module_directory& directory,
                     execution_host& host);

  /// True when a delegation target was recorded and the host now reports
  /// a different one.
  bool redelegated() const;

  /// Best effort: every validator, executor and the hook gets
  /// `on_uninstall`, failures are logged and skipped. Afterwards those slots
  /// are empty and the current delegation target is recorded. Pre-validation
  /// hooks, fallback handlers and the initialized flag are left untouched.
  void purge();

 private:
  void notify_uninstall(const warden::schema::address_t& address);

  account_state_t& state_;
  module_manager& manager_;
  module_directory& directory_;
  execution_host& host_;
};

}  // namespace warden::account
