#pragma once
#include <warden/schema/primitives.hpp>

#include <cstdint>

namespace warden::schema {

inline const auto kValidationSuccess = validation_data_t{0};
inline const auto kValidationFailed = validation_data_t{1};

/// ERC-1271 verdicts.
inline constexpr auto kSignatureMagicValue = selector_t{0x16, 0x26, 0xba, 0x7e};
inline constexpr auto kSignatureFailedValue =
    selector_t{0xff, 0xff, 0xff, 0xff};

/// Conventional layout of a validator verdict:
/// bit 0..159 authorizer (1 = signature failure), 160..207 valid_until,
/// 208..255 valid_after. A zero valid_until means "no expiry".
struct validation_window_t final {
  bool signature_failed{};
  uint64_t valid_until{};
  uint64_t valid_after{};
};

validation_data_t pack_validation_data(const validation_window_t& window);
validation_window_t unpack_validation_data(const validation_data_t& data);

}  // namespace warden::schema
