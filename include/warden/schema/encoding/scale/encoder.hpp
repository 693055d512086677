#pragma once
#include <warden/common/critical.hpp>
#include <warden/schema/encoding/encoder.hpp>
#include <warden/schema/encoding/scale/account_call.hpp>
#include <warden/schema/encoding/scale/account_snapshot.hpp>
#include <warden/schema/encoding/scale/bootstrap_config.hpp>
#include <warden/schema/encoding/scale/execution.hpp>
#include <warden/schema/encoding/scale/fallback_handler.hpp>
#include <warden/schema/encoding/scale/module_type.hpp>
#include <iterator>
#include <scale/scale.hpp>

namespace warden::schema::encoding {

struct scale_encoder_tag {};

template <>
struct encoder<scale_encoder_tag> final {
  template <typename T>
  warden::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, warden::schema::bytes_t& out);

  /// Decode bytes the library produced itself; malformed input is fatal.
  template <typename T>
  T decode(const warden::schema::bytes_view_t& bytes);

  /// Decode caller-supplied bytes.
  template <typename T>
  std::optional<T> try_decode(const warden::schema::bytes_view_t& bytes);
};

template <typename T>
warden::schema::bytes_t encoder<scale_encoder_tag>::encode(const T& obj) {
  auto encoded = ::scale::impl::memory::encode(obj);
  if (!encoded) {
    warden::common::critical("failed to encode SCALE object");
  }
  return encoded.value();
}

template <typename T>
void encoder<scale_encoder_tag>::encode(const T& obj,
                                        warden::schema::bytes_t& out) {
  auto encoded = encode(obj);
  out.insert(std::end(out), std::begin(encoded), std::end(encoded));
}

template <typename T>
T encoder<scale_encoder_tag>::decode(
    const warden::schema::bytes_view_t& bytes) {
  auto decoded = ::scale::impl::memory::decode<T>(bytes);
  if (!decoded) {
    warden::common::critical("failed to decode SCALE bytes");
  }
  return decoded.value();
}

template <typename T>
std::optional<T> encoder<scale_encoder_tag>::try_decode(
    const warden::schema::bytes_view_t& bytes) {
  auto decoded = ::scale::impl::memory::decode<T>(bytes);
  if (!decoded) {
    return std::nullopt;
  }
  return decoded.value();
}

}  // namespace warden::schema::encoding
