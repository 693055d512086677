#pragma once

#include <warden/account/account_state.hpp>
#include <warden/account/attestation_registry.hpp>
#include <warden/account/module_directory.hpp>
#include <warden/schema/account_event.hpp>
#include <warden/schema/module_type.hpp>
#include <warden/schema/primitives.hpp>

#include <memory>

namespace warden::account {

/// Module lifecycle router: the only component that mutates module
/// bookkeeping in `account_state_t`.
///
/// Installation checks, in order: the category is supported, the address is
/// non-zero and resolvable, the module reports the requested category, the
/// attestation registry accepts `(module, type)`. The category installer then
/// records the module and calls its `on_install`.
class module_manager final {
 public:
  module_manager(account_state_t& state,
                 module_directory& directory,
                 warden::schema::event_log_t& events,
                 std::shared_ptr<attestation_registry> registry);

  /// Fallback `init_data` is `selector(4) || call_type(1) || handler_init`.
  void install(warden::schema::module_type_t type,
               const warden::schema::address_t& module,
               const warden::schema::bytes_view_t& init_data);

  /// Fallback `deinit_data` is `selector(4) || handler_deinit`.
  void uninstall(warden::schema::module_type_t type,
                 const warden::schema::address_t& module,
                 const warden::schema::bytes_view_t& deinit_data);

  /// For the fallback category `context` carries the 4-byte selector.
  bool is_installed(warden::schema::module_type_t type,
                    const warden::schema::address_t& module,
                    const warden::schema::bytes_view_t& context) const;

  static bool supports_module(warden::schema::module_type_t type);

  /// Fails with module_rejected_by_registry unless the attestation registry
  /// (when configured) accepts `(module, type)`.
  void require_attested(const warden::schema::address_t& module,
                        warden::schema::module_type_t type) const;

  /// Empty the validator and executor sets and the hook slot without
  /// calling into any module.
  void reset();

 private:
  void install_into_set(warden::schema::module_type_t type,
                        const warden::schema::address_t& address,
                        module& impl,
                        const warden::schema::bytes_view_t& init_data);
  void install_hook(const warden::schema::address_t& address,
                    module& impl,
                    const warden::schema::bytes_view_t& init_data);
  void install_fallback(const warden::schema::address_t& address,
                        module& impl,
                        const warden::schema::bytes_view_t& init_data);

  void uninstall_from_set(warden::schema::module_type_t type,
                          const warden::schema::address_t& address,
                          const warden::schema::bytes_view_t& deinit_data);
  void uninstall_hook(const warden::schema::address_t& address,
                      const warden::schema::bytes_view_t& deinit_data);
  void uninstall_fallback(const warden::schema::address_t& address,
                          const warden::schema::bytes_view_t& deinit_data);

  account_state_t& state_;
  module_directory& directory_;
  warden::schema::event_log_t& events_;
  std::shared_ptr<attestation_registry> registry_;
};

}  // namespace warden::account
