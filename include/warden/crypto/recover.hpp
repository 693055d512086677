#pragma once

#include <warden/schema/primitives.hpp>

#include <optional>

namespace warden::crypto {

/// Domain-separated digest that account owners sign off-band:
/// blake3("\x19Warden Signed Message:\n32" || challenge).
warden::schema::hash32_t signed_message_hash(
    const warden::schema::hash32_t& challenge);

/// Address of an uncompressed secp256k1 public key (64 bytes x||y, or 65
/// bytes with the 0x04 prefix): last 20 bytes of blake3(x||y).
std::optional<warden::schema::address_t> address_from_public_key(
    const warden::schema::bytes_view_t& public_key);

/// Recover the signing address from a 65-byte `r || s || v` signature over
/// `digest`. `v` may be 0, 1, 27 or 28. Returns std::nullopt for malformed
/// signatures.
std::optional<warden::schema::address_t> recover_signer(
    const warden::schema::hash32_t& digest,
    const warden::schema::bytes_view_t& signature);

std::optional<warden::schema::address_t> address_from_private_key(
    const warden::schema::hash32_t& private_key);

/// Produce a recoverable low-s signature (`v` = 27 or 28) over `digest`.
std::optional<warden::schema::bytes_t> sign_digest(
    const warden::schema::hash32_t& private_key,
    const warden::schema::hash32_t& digest);

}  // namespace warden::crypto
