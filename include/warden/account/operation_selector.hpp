#pragma once

#include <warden/schema/primitives.hpp>

#include <string_view>

namespace warden::account {

/// First four bytes of blake3(signature), e.g.
/// operation_selector("installModule(uint256,address,bytes)").
warden::schema::selector_t operation_selector(std::string_view signature);

warden::schema::selector_t install_module_selector();
warden::schema::selector_t uninstall_module_selector();

/// Selectors that no fallback handler may claim.
bool is_forbidden_fallback_selector(const warden::schema::selector_t& selector);

/// Token-receiver callbacks answered with their own selector when no
/// fallback handler claims them.
bool is_token_receiver_selector(const warden::schema::selector_t& selector);

}  // namespace warden::account
