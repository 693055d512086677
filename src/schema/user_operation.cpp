#include <warden/schema/user_operation.hpp>

namespace warden::schema {

sequence_t make_nonce(const address_t& validator,
                      const uint32_t key,
                      const uint64_t sequence) {
  auto nonce = from_word(bytes_view_t{validator.data(), validator.size()});
  nonce <<= 96;
  nonce |= sequence_t{key} << 64;
  nonce |= sequence_t{sequence};
  return nonce;
}

}  // namespace warden::schema
