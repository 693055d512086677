#include <warden/blake3/hash.hpp>
#include <warden/crypto/recover.hpp>

#include <openssl/bn.h>
#include <openssl/core_names.h>
#include <openssl/ec.h>
#include <openssl/evp.h>
#include <openssl/obj_mac.h>
#include <openssl/param_build.h>

#include <algorithm>
#include <array>
#include <memory>
#include <string_view>
#include <vector>

namespace warden::crypto {

namespace {

using bn_ctx_ptr = std::unique_ptr<BN_CTX, decltype(&BN_CTX_free)>;
using bignum_ptr = std::unique_ptr<BIGNUM, decltype(&BN_free)>;
using ec_group_ptr = std::unique_ptr<EC_GROUP, decltype(&EC_GROUP_free)>;
using ec_point_ptr = std::unique_ptr<EC_POINT, decltype(&EC_POINT_free)>;
using ecdsa_sig_ptr = std::unique_ptr<ECDSA_SIG, decltype(&ECDSA_SIG_free)>;
using evp_pkey_ctx_ptr =
    std::unique_ptr<EVP_PKEY_CTX, decltype(&EVP_PKEY_CTX_free)>;
using evp_pkey_ptr = std::unique_ptr<EVP_PKEY, decltype(&EVP_PKEY_free)>;
using param_bld_ptr =
    std::unique_ptr<OSSL_PARAM_BLD, decltype(&OSSL_PARAM_BLD_free)>;
using params_ptr = std::unique_ptr<OSSL_PARAM, decltype(&OSSL_PARAM_free)>;

inline constexpr auto kSignedMessagePrefix =
    std::string_view{"\x19Warden Signed Message:\n32"};
inline constexpr auto kUncompressedPointSize = std::size_t{65};

bignum_ptr make_bignum(const uint8_t* data, const std::size_t size) {
  return bignum_ptr{BN_bin2bn(data, static_cast<int>(size), nullptr), BN_free};
}

bignum_ptr make_bignum() {
  return bignum_ptr{BN_new(), BN_free};
}

ec_group_ptr make_secp256k1_group() {
  return ec_group_ptr{EC_GROUP_new_by_curve_name(NID_secp256k1),
                      EC_GROUP_free};
}

std::optional<std::array<uint8_t, kUncompressedPointSize>> serialize_point(
    const EC_GROUP* group,
    const EC_POINT* point,
    BN_CTX* ctx) {
  auto out = std::array<uint8_t, kUncompressedPointSize>{};
  if (EC_POINT_point2oct(group, point, POINT_CONVERSION_UNCOMPRESSED,
                         out.data(), out.size(), ctx) != out.size()) {
    return std::nullopt;
  }
  return out;
}

std::optional<std::array<uint8_t, kUncompressedPointSize>> public_key_of(
    const warden::schema::hash32_t& private_key) {
  auto ctx = bn_ctx_ptr{BN_CTX_new(), BN_CTX_free};
  auto group = make_secp256k1_group();
  if (!ctx || !group) {
    return std::nullopt;
  }
  const auto* order = EC_GROUP_get0_order(group.get());
  auto secret = make_bignum(private_key.data(), private_key.size());
  if (!secret || BN_is_zero(secret.get()) ||
      BN_cmp(secret.get(), order) >= 0) {
    return std::nullopt;
  }
  auto point = ec_point_ptr{EC_POINT_new(group.get()), EC_POINT_free};
  if (!point || EC_POINT_mul(group.get(), point.get(), secret.get(), nullptr,
                             nullptr, ctx.get()) != 1) {
    return std::nullopt;
  }
  return serialize_point(group.get(), point.get(), ctx.get());
}

evp_pkey_ptr make_signing_key(
    const warden::schema::hash32_t& private_key,
    const std::array<uint8_t, kUncompressedPointSize>& public_key) {
  auto failed = evp_pkey_ptr{nullptr, EVP_PKEY_free};
  auto secret = make_bignum(private_key.data(), private_key.size());
  auto builder = param_bld_ptr{OSSL_PARAM_BLD_new(), OSSL_PARAM_BLD_free};
  if (!secret || !builder) {
    return failed;
  }
  if (OSSL_PARAM_BLD_push_utf8_string(builder.get(), OSSL_PKEY_PARAM_GROUP_NAME,
                                      "secp256k1", 0) != 1 ||
      OSSL_PARAM_BLD_push_BN(builder.get(), OSSL_PKEY_PARAM_PRIV_KEY,
                             secret.get()) != 1 ||
      OSSL_PARAM_BLD_push_octet_string(builder.get(), OSSL_PKEY_PARAM_PUB_KEY,
                                       public_key.data(),
                                       public_key.size()) != 1) {
    return failed;
  }
  auto params =
      params_ptr{OSSL_PARAM_BLD_to_param(builder.get()), OSSL_PARAM_free};
  auto key_ctx = evp_pkey_ctx_ptr{
      EVP_PKEY_CTX_new_from_name(nullptr, "EC", nullptr), EVP_PKEY_CTX_free};
  if (!params || !key_ctx || EVP_PKEY_fromdata_init(key_ctx.get()) != 1) {
    return failed;
  }
  auto* raw_pkey = static_cast<EVP_PKEY*>(nullptr);
  if (EVP_PKEY_fromdata(key_ctx.get(), &raw_pkey, EVP_PKEY_KEYPAIR,
                        params.get()) != 1) {
    return failed;
  }
  return evp_pkey_ptr{raw_pkey, EVP_PKEY_free};
}

}  // namespace

warden::schema::hash32_t signed_message_hash(
    const warden::schema::hash32_t& challenge) {
  return warden::blake3::hash(
      {warden::schema::make_bytes_view(kSignedMessagePrefix),
       warden::schema::bytes_view_t{challenge.data(), challenge.size()}});
}

std::optional<warden::schema::address_t> address_from_public_key(
    const warden::schema::bytes_view_t& public_key) {
  auto coordinates = public_key;
  if (coordinates.size() == kUncompressedPointSize) {
    if (coordinates[0] != POINT_CONVERSION_UNCOMPRESSED) {
      return std::nullopt;
    }
    coordinates = coordinates.subspan(1);
  }
  if (coordinates.size() != kUncompressedPointSize - 1) {
    return std::nullopt;
  }
  auto digest = warden::blake3::hash(coordinates);
  auto address = warden::schema::address_t{};
  std::copy(std::end(digest) - static_cast<std::ptrdiff_t>(address.size()),
            std::end(digest), std::begin(address));
  return address;
}

std::optional<warden::schema::address_t> recover_signer(
    const warden::schema::hash32_t& digest,
    const warden::schema::bytes_view_t& signature) {
  if (signature.size() != 65) {
    return std::nullopt;
  }
  auto recovery_id = signature[64];
  if (recovery_id >= 27) {
    recovery_id = static_cast<uint8_t>(recovery_id - 27);
  }
  if (recovery_id > 1) {
    return std::nullopt;
  }

  auto ctx = bn_ctx_ptr{BN_CTX_new(), BN_CTX_free};
  auto group = make_secp256k1_group();
  if (!ctx || !group) {
    return std::nullopt;
  }
  const auto* order = EC_GROUP_get0_order(group.get());

  auto r = make_bignum(signature.data(), 32);
  auto s = make_bignum(signature.data() + 32, 32);
  if (!r || !s || BN_is_zero(r.get()) || BN_is_zero(s.get()) ||
      BN_cmp(r.get(), order) >= 0 || BN_cmp(s.get(), order) >= 0) {
    return std::nullopt;
  }

  // R.x is r; the r + n forms behind v 2 and 3 are not accepted.
  auto big_r = ec_point_ptr{EC_POINT_new(group.get()), EC_POINT_free};
  if (!big_r ||
      EC_POINT_set_compressed_coordinates(group.get(), big_r.get(), r.get(),
                                          recovery_id, ctx.get()) != 1) {
    return std::nullopt;
  }

  // Q = r^-1 (s R - e G) = (-e r^-1) G + (s r^-1) R
  auto e = make_bignum(digest.data(), digest.size());
  auto r_inverse =
      bignum_ptr{BN_mod_inverse(nullptr, r.get(), order, ctx.get()), BN_free};
  auto u1 = make_bignum();
  auto u2 = make_bignum();
  if (!e || !r_inverse || !u1 || !u2 ||
      BN_mod_mul(u1.get(), e.get(), r_inverse.get(), order, ctx.get()) != 1 ||
      BN_mod_mul(u2.get(), s.get(), r_inverse.get(), order, ctx.get()) != 1) {
    return std::nullopt;
  }
  if (!BN_is_zero(u1.get()) && BN_sub(u1.get(), order, u1.get()) != 1) {
    return std::nullopt;
  }

  auto q = ec_point_ptr{EC_POINT_new(group.get()), EC_POINT_free};
  if (!q || EC_POINT_mul(group.get(), q.get(), u1.get(), big_r.get(), u2.get(),
                         ctx.get()) != 1) {
    return std::nullopt;
  }
  if (EC_POINT_is_at_infinity(group.get(), q.get()) == 1) {
    return std::nullopt;
  }
  auto encoded = serialize_point(group.get(), q.get(), ctx.get());
  if (!encoded) {
    return std::nullopt;
  }
  return address_from_public_key(
      warden::schema::bytes_view_t{encoded->data(), encoded->size()});
}

std::optional<warden::schema::address_t> address_from_private_key(
    const warden::schema::hash32_t& private_key) {
  auto public_key = public_key_of(private_key);
  if (!public_key) {
    return std::nullopt;
  }
  return address_from_public_key(
      warden::schema::bytes_view_t{public_key->data(), public_key->size()});
}

std::optional<warden::schema::bytes_t> sign_digest(
    const warden::schema::hash32_t& private_key,
    const warden::schema::hash32_t& digest) {
  auto public_key = public_key_of(private_key);
  if (!public_key) {
    return std::nullopt;
  }
  auto expected = address_from_public_key(
      warden::schema::bytes_view_t{public_key->data(), public_key->size()});
  auto pkey = make_signing_key(private_key, *public_key);
  if (!pkey || !expected) {
    return std::nullopt;
  }

  auto sign_ctx = evp_pkey_ctx_ptr{
      EVP_PKEY_CTX_new_from_pkey(nullptr, pkey.get(), nullptr),
      EVP_PKEY_CTX_free};
  if (!sign_ctx || EVP_PKEY_sign_init(sign_ctx.get()) != 1) {
    return std::nullopt;
  }
  auto der_size = std::size_t{};
  if (EVP_PKEY_sign(sign_ctx.get(), nullptr, &der_size, digest.data(),
                    digest.size()) != 1) {
    return std::nullopt;
  }
  auto der = std::vector<uint8_t>(der_size);
  if (EVP_PKEY_sign(sign_ctx.get(), der.data(), &der_size, digest.data(),
                    digest.size()) != 1) {
    return std::nullopt;
  }

  const auto* der_ptr = static_cast<const unsigned char*>(der.data());
  auto ecdsa_sig = ecdsa_sig_ptr{
      d2i_ECDSA_SIG(nullptr, &der_ptr, static_cast<long>(der_size)),
      ECDSA_SIG_free};
  if (!ecdsa_sig) {
    return std::nullopt;
  }
  const auto* r = static_cast<const BIGNUM*>(nullptr);
  const auto* s = static_cast<const BIGNUM*>(nullptr);
  ECDSA_SIG_get0(ecdsa_sig.get(), &r, &s);

  auto group = make_secp256k1_group();
  if (!group) {
    return std::nullopt;
  }
  const auto* order = EC_GROUP_get0_order(group.get());
  auto half_order = make_bignum();
  auto low_s = bignum_ptr{BN_dup(s), BN_free};
  if (!half_order || !low_s || BN_rshift1(half_order.get(), order) != 1) {
    return std::nullopt;
  }
  if (BN_cmp(low_s.get(), half_order.get()) > 0 &&
      BN_sub(low_s.get(), order, low_s.get()) != 1) {
    return std::nullopt;
  }

  auto signature = warden::schema::bytes_t(65);
  if (BN_bn2binpad(r, signature.data(), 32) != 32 ||
      BN_bn2binpad(low_s.get(), signature.data() + 32, 32) != 32) {
    return std::nullopt;
  }
  for (auto v = uint8_t{27}; v <= 28; ++v) {
    signature[64] = v;
    auto recovered = recover_signer(
        digest, warden::schema::bytes_view_t{signature.data(), signature.size()});
    if (recovered == expected) {
      return signature;
    }
  }
  return std::nullopt;
}

}  // namespace warden::crypto
