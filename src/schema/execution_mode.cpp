#include <warden/schema/execution_mode.hpp>

#include <algorithm>
#include <iterator>

namespace warden::schema {

namespace {

inline constexpr auto kCallTypeOffset = std::size_t{0};
inline constexpr auto kExecTypeOffset = std::size_t{1};
inline constexpr auto kUnusedOffset = std::size_t{2};
inline constexpr auto kSelectorOffset = std::size_t{6};
inline constexpr auto kPayloadOffset = std::size_t{10};

}  // namespace

decoded_mode_t decode_mode(const execution_mode_t& mode) {
  auto decoded = decoded_mode_t{};
  decoded.call_type = static_cast<call_type_t>(mode[kCallTypeOffset]);
  decoded.exec_type = static_cast<exec_type_t>(mode[kExecTypeOffset]);
  std::copy_n(std::begin(mode) + kUnusedOffset, decoded.unused.size(),
              std::begin(decoded.unused));
  std::copy_n(std::begin(mode) + kSelectorOffset, decoded.selector.size(),
              std::begin(decoded.selector));
  std::copy_n(std::begin(mode) + kPayloadOffset, decoded.payload.size(),
              std::begin(decoded.payload));
  return decoded;
}

execution_mode_t encode_mode(const decoded_mode_t& decoded) {
  auto mode = execution_mode_t{};
  mode[kCallTypeOffset] = static_cast<uint8_t>(decoded.call_type);
  mode[kExecTypeOffset] = static_cast<uint8_t>(decoded.exec_type);
  std::copy(std::begin(decoded.unused), std::end(decoded.unused),
            std::begin(mode) + kUnusedOffset);
  std::copy(std::begin(decoded.selector), std::end(decoded.selector),
            std::begin(mode) + kSelectorOffset);
  std::copy(std::begin(decoded.payload), std::end(decoded.payload),
            std::begin(mode) + kPayloadOffset);
  return mode;
}

execution_mode_t encode_mode(const call_type_t call_type,
                             const exec_type_t exec_type,
                             const mode_selector_t& selector,
                             const mode_payload_t& payload) {
  return encode_mode(decoded_mode_t{.call_type = call_type,
                                    .exec_type = exec_type,
                                    .unused = {},
                                    .selector = selector,
                                    .payload = payload});
}

bool is_supported_call_type(const call_type_t call_type) {
  switch (call_type) {
    case call_type_t::single:
    case call_type_t::batch:
    case call_type_t::delegate_call:
      return true;
    case call_type_t::static_call:
      return false;
  }
  return false;
}

bool is_supported_exec_type(const exec_type_t exec_type) {
  switch (exec_type) {
    case exec_type_t::default_exec:
    case exec_type_t::try_exec:
      return true;
  }
  return false;
}

}  // namespace warden::schema
