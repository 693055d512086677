#include <warden/account/execution_codec.hpp>
#include <warden/common/error.hpp>
#include <warden/schema/encoding/scale/encoder.hpp>

#include <iterator>
#include <string_view>
#include <utility>

using namespace warden::schema;

namespace warden::account {

namespace {

using encoder_t = warden::schema::encoding::encoder<
    warden::schema::encoding::scale_encoder_tag>;

inline constexpr auto kAddressSize = std::size_t{20};
inline constexpr auto kWordSize = std::size_t{32};

[[noreturn]] void malformed(const std::string_view what) {
  throw warden::common::account_error{account_error_code::malformed_calldata,
                                      what};
}

}  // namespace

bytes_t encode_single(const execution_t& execution) {
  auto payload = bytes_t{};
  payload.reserve(kAddressSize + kWordSize + execution.call_data.size());
  payload.insert(std::end(payload), std::begin(execution.target),
                 std::end(execution.target));
  auto value = to_word(execution.value);
  payload.insert(std::end(payload), std::begin(value), std::end(value));
  payload.insert(std::end(payload), std::begin(execution.call_data),
                 std::end(execution.call_data));
  return payload;
}

execution_t decode_single(const bytes_view_t& payload) {
  if (payload.size() < kAddressSize + kWordSize) {
    malformed("single execution payload shorter than 52 bytes");
  }
  auto execution = execution_t{};
  auto target = try_make_address(payload.first(kAddressSize));
  execution.target = *target;
  execution.value = from_word(payload.subspan(kAddressSize, kWordSize));
  execution.call_data = make_bytes(payload.subspan(kAddressSize + kWordSize));
  return execution;
}

bytes_t encode_batch(const std::vector<execution_t>& executions) {
  auto encoder = encoder_t{};
  return encoder.encode(executions);
}

std::vector<execution_t> decode_batch(const bytes_view_t& payload) {
  auto encoder = encoder_t{};
  auto decoded = encoder.try_decode<std::vector<execution_t>>(payload);
  if (!decoded) {
    malformed("batch execution payload is not a SCALE execution list");
  }
  return std::move(*decoded);
}

bytes_t encode_delegate(const delegate_execution_t& execution) {
  auto payload = bytes_t{};
  payload.reserve(kAddressSize + execution.call_data.size());
  payload.insert(std::end(payload), std::begin(execution.target),
                 std::end(execution.target));
  payload.insert(std::end(payload), std::begin(execution.call_data),
                 std::end(execution.call_data));
  return payload;
}

delegate_execution_t decode_delegate(const bytes_view_t& payload) {
  if (payload.size() < kAddressSize) {
    malformed("delegate execution payload shorter than 20 bytes");
  }
  auto execution = delegate_execution_t{};
  execution.target = *try_make_address(payload.first(kAddressSize));
  execution.call_data = make_bytes(payload.subspan(kAddressSize));
  return execution;
}

}  // namespace warden::account
