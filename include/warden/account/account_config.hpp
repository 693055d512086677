#pragma once

#include <warden/account/attestation_registry.hpp>
#include <warden/schema/primitives.hpp>

#include <memory>

namespace warden::account {

/// Canonical entry point 0x0000000071727De22E5E9d8BAf0edAc6f37da032.
inline constexpr auto kDefaultEntryPoint = warden::schema::address_t{
    0x00, 0x00, 0x00, 0x00, 0x71, 0x72, 0x7d, 0xe2, 0x2e, 0x5e,
    0x9d, 0x8b, 0xaf, 0x0e, 0xda, 0xc6, 0xf3, 0x7d, 0xa0, 0x32};

struct account_config_t final {
  /// The account's own address; also the signer accepted by the bootstrap
  /// self-signature check.
  warden::schema::address_t self{};
  /// The coordinator allowed to drive user operations.
  warden::schema::address_t entry_point{kDefaultEntryPoint};
  /// Optional. Without one every module passes the attestation gate.
  std::shared_ptr<attestation_registry> registry;
};

}  // namespace warden::account
