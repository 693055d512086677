#include <warden/account/account.hpp>
#include <warden/account/hook_wrapper.hpp>
#include <warden/account/operation_selector.hpp>
#include <warden/common/error.hpp>
#include <warden/schema/account_call.hpp>
#include <warden/schema/encoding/scale/encoder.hpp>
#include <warden/schema/validation_data.hpp>

#include <spdlog/spdlog.h>

#include <exception>
#include <iterator>
#include <utility>
#include <variant>

using namespace warden::schema;

namespace warden::account {

namespace {

using encoder_t = warden::schema::encoding::encoder<
    warden::schema::encoding::scale_encoder_tag>;
using warden::common::account_error;

inline constexpr auto kAccountId = std::string_view{"warden.account.1.0.0"};

bytes_t encode_call(const account_call_t& call) {
  auto encoder = encoder_t{};
  return encoder.encode(call);
}

}  // namespace

account::account(account_config_t config,
                 module_directory& directory,
                 execution_host& host)
    : config_{std::move(config)},
      directory_{directory},
      host_{host},
      manager_{state_, directory_, events_, config_.registry},
      authorizer_{state_, directory_, config_.self},
      executor_{host_, events_},
      guard_{state_, manager_, directory_, host_} {
  state_.delegation_target = host_.delegation_target();
}

template <typename Body>
auto account::atomically(Body&& body) -> std::invoke_result_t<Body> {
  auto saved_state = state_;
  auto first_event = events_.size();
  auto checkpoint = host_.checkpoint();
  try {
    return std::forward<Body>(body)();
  } catch (...) {
    state_ = std::move(saved_state);
    events_.erase(std::begin(events_) + static_cast<std::ptrdiff_t>(first_event),
                  std::end(events_));
    host_.rollback(checkpoint);
    throw;
  }
}

std::string_view account::account_id() {
  return kAccountId;
}

void account::require_entry_point(const address_t& caller) const {
  if (caller != config_.entry_point) {
    throw account_error{account_error_code::caller_not_entry_point,
                        to_hex(caller)};
  }
}

void account::require_entry_point_or_self(const address_t& caller) const {
  if (caller != config_.entry_point && caller != config_.self) {
    throw account_error{account_error_code::caller_not_entry_point_or_self,
                        to_hex(caller)};
  }
}

call_context_t account::make_context(const address_t& caller,
                                     const amount_t& value,
                                     bytes_t data) const {
  return call_context_t{caller, config_.self, value, std::move(data)};
}

void account::initialize_account(const address_t& caller,
                                 const bootstrap_config_t& config) {
  require_entry_point_or_self(caller);
  atomically([&] {
    if (state_.initialized) {
      throw account_error{account_error_code::account_already_initialized};
    }
    if (guard_.redelegated()) {
      spdlog::info("Delegation target changed since last initialization");
      guard_.purge();
    }
    for (const auto& entry : config.modules) {
      manager_.install(entry.module_type, entry.module,
                       make_bytes_view(entry.init_data));
    }
    state_.initialized = true;
    state_.delegation_target = host_.delegation_target();
    spdlog::info("Initialized account {} with {} module(s)",
                 to_hex(config_.self), config.modules.size());
  });
}

validation_data_t account::validate_user_op(const address_t& caller,
                                            const user_operation_t& op,
                                            const hash32_t& op_hash,
                                            const amount_t& missing_funds) {
  require_entry_point(caller);
  return atomically([&] {
    if (missing_funds != 0) {
      auto paid = host_.call(config_.entry_point, missing_funds, {});
      if (!paid.success) {
        spdlog::warn("Prefund of {} to the entry point failed",
                     missing_funds.str());
      }
    }
    return authorizer_.validate_user_op(op, op_hash, missing_funds);
  });
}

selector_t account::is_valid_signature(const address_t& sender,
                                       const hash32_t& hash,
                                       const bytes_view_t& signature) const {
  return authorizer_.is_valid_signature(sender, hash, signature);
}

void account::execute(const address_t& caller,
                      const execution_mode_t& mode,
                      const bytes_view_t& execution_data) {
  require_entry_point_or_self(caller);
  atomically([&] {
    auto context = make_context(
        caller, 0,
        encode_call(execute_call_t{mode, make_bytes(execution_data)}));
    with_hook(state_.hook, directory_, events_, context, [&] {
      executor_.execute(mode, execution_data);
    });
  });
}

std::vector<bytes_t> account::execute_from_executor(
    const address_t& caller,
    const execution_mode_t& mode,
    const bytes_view_t& execution_data) {
  if (!state_.registry.contains(module_type_t::executor, caller)) {
    throw account_error{account_error_code::invalid_module, to_hex(caller)};
  }
  manager_.require_attested(caller, module_type_t::executor);
  return atomically([&] {
    auto context = make_context(caller, 0,
                                encode_call(execute_from_executor_call_t{
                                    mode, make_bytes(execution_data)}));
    return with_hook(state_.hook, directory_, events_, context, [&] {
      return executor_.execute(mode, execution_data);
    });
  });
}

void account::execute_user_op(const address_t& caller,
                              const user_operation_t& op,
                              const hash32_t& op_hash) {
  require_entry_point(caller);
  spdlog::debug("Executing user operation {}",
                to_hex(bytes_view_t{op_hash.data(), op_hash.size()}));
  atomically([&] {
    try {
      auto encoder = encoder_t{};
      auto call =
          encoder.try_decode<account_call_t>(make_bytes_view(op.call_data));
      if (!call) {
        throw account_error{account_error_code::malformed_calldata,
                            "user operation call data is not an account call"};
      }
      std::visit(
          overloaded{
              [&](const execute_call_t& c) {
                execute(config_.self, c.mode, make_bytes_view(c.execution_data));
              },
              [&](const execute_from_executor_call_t& c) {
                execute_from_executor(config_.self, c.mode,
                                      make_bytes_view(c.execution_data));
              },
              [&](const install_module_call_t& c) {
                install_module(config_.self, c.module_type, c.module,
                               make_bytes_view(c.init_data));
              },
              [&](const uninstall_module_call_t& c) {
                uninstall_module(config_.self, c.module_type, c.module,
                                 make_bytes_view(c.deinit_data));
              },
          },
          *call);
    } catch (const std::exception& ex) {
      throw account_error{account_error_code::execution_failed, ex.what()};
    }
  });
}

void account::install_module(const address_t& caller,
                             const module_type_t type,
                             const address_t& module,
                             const bytes_view_t& init_data) {
  require_entry_point_or_self(caller);
  atomically([&] {
    auto context = make_context(
        caller, 0,
        encode_call(install_module_call_t{type, module, make_bytes(init_data)}));
    with_hook(state_.hook, directory_, events_, context,
              [&] { manager_.install(type, module, init_data); });
  });
}

void account::uninstall_module(const address_t& caller,
                               const module_type_t type,
                               const address_t& module,
                               const bytes_view_t& deinit_data) {
  require_entry_point_or_self(caller);
  atomically([&] {
    auto context = make_context(caller, 0,
                                encode_call(uninstall_module_call_t{
                                    type, module, make_bytes(deinit_data)}));
    with_hook(state_.hook, directory_, events_, context,
              [&] { manager_.uninstall(type, module, deinit_data); });
  });
}

bool account::is_module_installed(const module_type_t type,
                                  const address_t& module,
                                  const bytes_view_t& context) const {
  return manager_.is_installed(type, module, context);
}

bool account::supports_module(const module_type_t type) {
  return module_manager::supports_module(type);
}

bool account::supports_execution_mode(const execution_mode_t& mode) {
  auto decoded = decode_mode(mode);
  return is_supported_call_type(decoded.call_type) &&
         is_supported_exec_type(decoded.exec_type);
}

bytes_t account::fallback(const address_t& caller,
                          const amount_t& value,
                          const bytes_view_t& data) {
  return atomically([&] {
    auto context = make_context(caller, value, make_bytes(data));
    return with_hook(state_.hook, directory_, events_, context, [&] {
      auto selector = try_make_selector(data);
      if (!selector) {
        throw account_error{account_error_code::missing_fallback_handler,
                            "call data shorter than a selector"};
      }
      auto route = state_.fallbacks.find(*selector);
      if (route == std::end(state_.fallbacks)) {
        if (is_token_receiver_selector(*selector)) {
          return bytes_t{std::begin(*selector), std::end(*selector)};
        }
        throw account_error{
            account_error_code::missing_fallback_handler,
            to_hex(bytes_view_t{selector->data(), selector->size()})};
      }

      // Handlers learn the original caller from the trailing 20 bytes.
      auto forwarded = make_bytes(data);
      forwarded.insert(std::end(forwarded), std::begin(caller), std::end(caller));
      const auto& handler = route->second;
      auto result = handler.call_type == call_type_t::static_call
                        ? host_.static_call(handler.handler,
                                            make_bytes_view(forwarded))
                        : host_.call(handler.handler, 0,
                                     make_bytes_view(forwarded));
      if (!result.success) {
        throw warden::common::revert_error{std::move(result.return_data)};
      }
      return std::move(result.return_data);
    });
  });
}

void account::on_redelegation(const address_t& caller) {
  require_entry_point_or_self(caller);
  atomically([&] { guard_.purge(); });
}

std::vector<address_t> account::validators() const {
  return state_.registry.list(module_type_t::validator);
}

std::vector<address_t> account::executors() const {
  return state_.registry.list(module_type_t::executor);
}

std::vector<address_t> account::pre_validation_hooks(
    const module_type_t type) const {
  if (type != module_type_t::pre_validation_hook_signature &&
      type != module_type_t::pre_validation_hook_operation) {
    return {};
  }
  return state_.registry.list(type);
}

std::optional<address_t> account::active_hook() const {
  return state_.hook;
}

std::optional<fallback_handler_t> account::fallback_handler(
    const selector_t& selector) const {
  auto it = state_.fallbacks.find(selector);
  if (it == std::end(state_.fallbacks)) {
    return std::nullopt;
  }
  return it->second;
}

const address_t& account::entry_point() const {
  return config_.entry_point;
}

const address_t& account::self() const {
  return config_.self;
}

bool account::is_initialized() const {
  return state_.initialized;
}

const event_log_t& account::events() const {
  return events_;
}

event_log_t account::take_events() {
  auto taken = std::move(events_);
  events_.clear();
  return taken;
}

account_snapshot_t account::snapshot() const {
  return make_snapshot(state_);
}

void account::restore(const account_snapshot_t& snapshot) {
  state_ = make_state(snapshot);
  spdlog::info("Restored account {} from snapshot", to_hex(config_.self));
}

}  // namespace warden::account
