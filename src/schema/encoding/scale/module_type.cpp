#include <warden/schema/encoding/scale/module_type.hpp>

#include <cstdint>

using namespace warden::schema;

namespace warden::schema::encoding::scale {

void encode(module_type_t&& o, ::scale::Encoder& encoder) {
  encode(static_cast<uint32_t>(o), encoder);
}

void decode(module_type_t&& o, ::scale::Decoder& decoder) {
  auto raw = uint32_t{};
  decode(raw, decoder);
  o = static_cast<module_type_t>(raw);
}

void encode(call_type_t&& o, ::scale::Encoder& encoder) {
  encode(static_cast<uint8_t>(o), encoder);
}

void decode(call_type_t&& o, ::scale::Decoder& decoder) {
  auto raw = uint8_t{};
  decode(raw, decoder);
  o = static_cast<call_type_t>(raw);
}

}  // namespace warden::schema::encoding::scale
