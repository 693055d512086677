#include <warden/account/module_manager.hpp>
#include <warden/account/operation_selector.hpp>
#include <warden/common/error.hpp>

#include <spdlog/spdlog.h>

#include <string>
#include <utility>

using namespace warden::schema;

namespace warden::account {

namespace {

using warden::common::account_error;

inline constexpr auto kSelectorSize = std::size_t{4};

[[noreturn]] void fail(const account_error_code code,
                       const address_t& module) {
  throw account_error{code, to_hex(module)};
}

}  // namespace

module_manager::module_manager(account_state_t& state,
                               module_directory& directory,
                               event_log_t& events,
                               std::shared_ptr<attestation_registry> registry)
    : state_{state},
      directory_{directory},
      events_{events},
      registry_{std::move(registry)} {}

bool module_manager::supports_module(const module_type_t type) {
  return is_named(type, kModuleTypeMappings);
}

void module_manager::require_attested(const address_t& module,
                                      const module_type_t type) const {
  if (registry_ && !registry_->authorize(module, type)) {
    spdlog::warn("Attestation registry rejected {} as {}", to_hex(module),
                 to_string(type));
    fail(account_error_code::module_rejected_by_registry, module);
  }
}

void module_manager::install(const module_type_t type,
                             const address_t& module,
                             const bytes_view_t& init_data) {
  if (!supports_module(type)) {
    throw account_error{account_error_code::unsupported_module_type,
                        std::to_string(to_id(type))};
  }
  if (is_zero(module)) {
    fail(account_error_code::module_address_invalid, module);
  }
  auto impl = resolve<warden::account::module>(directory_, module);
  if (!impl->is_module_type(type)) {
    fail(account_error_code::mismatch_module_type_id, module);
  }
  require_attested(module, type);

  switch (type) {
    case module_type_t::validator:
    case module_type_t::executor:
    case module_type_t::pre_validation_hook_signature:
    case module_type_t::pre_validation_hook_operation:
      install_into_set(type, module, *impl, init_data);
      break;
    case module_type_t::hook:
      install_hook(module, *impl, init_data);
      break;
    case module_type_t::fallback:
      install_fallback(module, *impl, init_data);
      break;
  }

  spdlog::info("Installed {} module {}", to_string(type), to_hex(module));
  events_.emplace_back(module_installed_t{type, module});
}

void module_manager::uninstall(const module_type_t type,
                               const address_t& module,
                               const bytes_view_t& deinit_data) {
  if (!supports_module(type)) {
    throw account_error{account_error_code::unsupported_module_type,
                        std::to_string(to_id(type))};
  }

  switch (type) {
    case module_type_t::validator:
    case module_type_t::executor:
    case module_type_t::pre_validation_hook_signature:
    case module_type_t::pre_validation_hook_operation:
      uninstall_from_set(type, module, deinit_data);
      break;
    case module_type_t::hook:
      uninstall_hook(module, deinit_data);
      break;
    case module_type_t::fallback:
      uninstall_fallback(module, deinit_data);
      break;
  }

  spdlog::info("Uninstalled {} module {}", to_string(type), to_hex(module));
  events_.emplace_back(module_uninstalled_t{type, module});
}

bool module_manager::is_installed(const module_type_t type,
                                  const address_t& module,
                                  const bytes_view_t& context) const {
  switch (type) {
    case module_type_t::validator:
    case module_type_t::executor:
    case module_type_t::pre_validation_hook_signature:
    case module_type_t::pre_validation_hook_operation:
      return state_.registry.contains(type, module);
    case module_type_t::hook:
      return state_.hook == module;
    case module_type_t::fallback: {
      auto selector = try_make_selector(context);
      if (!selector) {
        return false;
      }
      auto it = state_.fallbacks.find(*selector);
      return it != std::end(state_.fallbacks) && it->second.handler == module;
    }
  }
  return false;
}

void module_manager::reset() {
  state_.registry.clear(module_type_t::validator);
  state_.registry.clear(module_type_t::executor);
  state_.hook.reset();
}

void module_manager::install_into_set(const module_type_t type,
                                      const address_t& address,
                                      module& impl,
                                      const bytes_view_t& init_data) {
  if (!state_.registry.add(type, address)) {
    fail(account_error_code::module_already_installed, address);
  }
  impl.on_install(init_data);
}

void module_manager::install_hook(const address_t& address,
                                  module& impl,
                                  const bytes_view_t& init_data) {
  if (state_.hook) {
    fail(account_error_code::hook_already_installed, *state_.hook);
  }
  state_.hook = address;
  impl.on_install(init_data);
}

void module_manager::install_fallback(const address_t& address,
                                      module& impl,
                                      const bytes_view_t& init_data) {
  if (init_data.size() < kSelectorSize + 1) {
    throw account_error{account_error_code::malformed_calldata,
                        "fallback init data needs selector and call type"};
  }
  auto selector = *try_make_selector(init_data);
  auto call_type = static_cast<call_type_t>(init_data[kSelectorSize]);
  if (call_type != call_type_t::single &&
      call_type != call_type_t::static_call) {
    fail(account_error_code::fallback_call_type_invalid, address);
  }
  if (is_forbidden_fallback_selector(selector)) {
    throw account_error{
        account_error_code::fallback_selector_forbidden,
        to_hex(bytes_view_t{selector.data(), selector.size()})};
  }
  if (state_.fallbacks.contains(selector)) {
    throw account_error{
        account_error_code::fallback_selector_already_used,
        to_hex(bytes_view_t{selector.data(), selector.size()})};
  }
  state_.fallbacks.emplace(selector, fallback_handler_t{address, call_type});
  impl.on_install(init_data.subspan(kSelectorSize + 1));
}

void module_manager::uninstall_from_set(const module_type_t type,
                                        const address_t& address,
                                        const bytes_view_t& deinit_data) {
  if (!state_.registry.remove(type, address)) {
    fail(account_error_code::module_not_installed, address);
  }
  resolve<warden::account::module>(directory_, address)
      ->on_uninstall(deinit_data);
}

void module_manager::uninstall_hook(const address_t& address,
                                    const bytes_view_t& deinit_data) {
  if (state_.hook != address) {
    fail(account_error_code::module_not_installed, address);
  }
  state_.hook.reset();
  resolve<warden::account::module>(directory_, address)
      ->on_uninstall(deinit_data);
}

void module_manager::uninstall_fallback(const address_t& address,
                                        const bytes_view_t& deinit_data) {
  auto selector = try_make_selector(deinit_data);
  if (!selector) {
    throw account_error{account_error_code::malformed_calldata,
                        "fallback deinit data needs a selector"};
  }
  auto it = state_.fallbacks.find(*selector);
  if (it == std::end(state_.fallbacks) || it->second.handler != address) {
    fail(account_error_code::module_not_installed, address);
  }
  state_.fallbacks.erase(it);
  resolve<warden::account::module>(directory_, address)
      ->on_uninstall(deinit_data.subspan(kSelectorSize));
}

}  // namespace warden::account
