#pragma once

#include <warden/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <string_view>

namespace warden::schema {

enum class account_error_code : uint32_t {
  unsupported_call_type = 1,
  unsupported_exec_type = 2,
  unsupported_module_type = 3,
  mismatch_module_type_id = 4,
  invalid_module = 5,
  execution_failed = 6,
  caller_not_entry_point = 10,
  caller_not_entry_point_or_self = 11,
  module_already_installed = 20,
  module_not_installed = 21,
  module_address_invalid = 22,
  hook_already_installed = 23,
  fallback_selector_forbidden = 24,
  fallback_selector_already_used = 25,
  fallback_call_type_invalid = 26,
  missing_fallback_handler = 27,
  module_rejected_by_registry = 28,
  account_already_initialized = 31,
  malformed_calldata = 32,
};

inline constexpr auto kAccountErrorCodeMappings = std::array{
    std::pair<std::string_view, account_error_code>{
        "UnsupportedCallType", account_error_code::unsupported_call_type},
    std::pair<std::string_view, account_error_code>{
        "UnsupportedExecType", account_error_code::unsupported_exec_type},
    std::pair<std::string_view, account_error_code>{
        "UnsupportedModuleType", account_error_code::unsupported_module_type},
    std::pair<std::string_view, account_error_code>{
        "MismatchModuleTypeId", account_error_code::mismatch_module_type_id},
    std::pair<std::string_view, account_error_code>{
        "InvalidModule", account_error_code::invalid_module},
    std::pair<std::string_view, account_error_code>{
        "ExecutionFailed", account_error_code::execution_failed},
    std::pair<std::string_view, account_error_code>{
        "CallerNotEntryPoint", account_error_code::caller_not_entry_point},
    std::pair<std::string_view, account_error_code>{
        "CallerNotEntryPointOrSelf",
        account_error_code::caller_not_entry_point_or_self},
    std::pair<std::string_view, account_error_code>{
        "ModuleAlreadyInstalled", account_error_code::module_already_installed},
    std::pair<std::string_view, account_error_code>{
        "ModuleNotInstalled", account_error_code::module_not_installed},
    std::pair<std::string_view, account_error_code>{
        "ModuleAddressInvalid", account_error_code::module_address_invalid},
    std::pair<std::string_view, account_error_code>{
        "HookAlreadyInstalled", account_error_code::hook_already_installed},
    std::pair<std::string_view, account_error_code>{
        "FallbackSelectorForbidden",
        account_error_code::fallback_selector_forbidden},
    std::pair<std::string_view, account_error_code>{
        "FallbackSelectorAlreadyUsed",
        account_error_code::fallback_selector_already_used},
    std::pair<std::string_view, account_error_code>{
        "FallbackCallTypeInvalid",
        account_error_code::fallback_call_type_invalid},
    std::pair<std::string_view, account_error_code>{
        "MissingFallbackHandler", account_error_code::missing_fallback_handler},
    std::pair<std::string_view, account_error_code>{
        "ModuleRejectedByRegistry",
        account_error_code::module_rejected_by_registry},
    std::pair<std::string_view, account_error_code>{
        "AccountAlreadyInitialized",
        account_error_code::account_already_initialized},
    std::pair<std::string_view, account_error_code>{
        "MalformedCalldata", account_error_code::malformed_calldata}};

inline constexpr std::string_view to_string(const account_error_code value) {
  return to_string(value, kAccountErrorCodeMappings).value_or("Unknown");
}

}  // namespace warden::schema
