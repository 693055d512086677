#include <warden/schema/validation_data.hpp>

namespace warden::schema {

namespace {

inline constexpr auto kValidUntilShift = 160u;
inline constexpr auto kValidAfterShift = 208u;
inline const auto kTimestampMask = validation_data_t{0xFFFFFFFFFFFFull};
inline const auto kAuthorizerMask =
    (validation_data_t{1} << kValidUntilShift) - 1;

}  // namespace

validation_data_t pack_validation_data(const validation_window_t& window) {
  auto packed = validation_data_t{window.signature_failed ? 1u : 0u};
  packed |= (validation_data_t{window.valid_until} & kTimestampMask)
            << kValidUntilShift;
  packed |= (validation_data_t{window.valid_after} & kTimestampMask)
            << kValidAfterShift;
  return packed;
}

validation_window_t unpack_validation_data(const validation_data_t& data) {
  auto window = validation_window_t{};
  window.signature_failed = (data & kAuthorizerMask) == 1;
  window.valid_until = static_cast<uint64_t>((data >> kValidUntilShift) &
                                             kTimestampMask);
  window.valid_after = static_cast<uint64_t>((data >> kValidAfterShift) &
                                             kTimestampMask);
  return window;
}

}  // namespace warden::schema
