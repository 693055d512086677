#include <warden/schema/encoding/scale/fallback_handler.hpp>
#include <warden/schema/encoding/scale/module_type.hpp>

#include <utility>

using namespace warden::schema;

namespace warden::schema::encoding::scale {

void encode(fallback_handler_t&& o, ::scale::Encoder& encoder) {
  encode(o.handler, encoder);
  encode(call_type_t{o.call_type}, encoder);
}

void decode(fallback_handler_t&& o, ::scale::Decoder& decoder) {
  decode(o.handler, decoder);
  decode(std::move(o.call_type), decoder);
}

}  // namespace warden::schema::encoding::scale
