#include <warden/schema/encoding/scale/execution.hpp>

using namespace warden::schema;

namespace warden::schema::encoding::scale {

void encode(execution<1>&& o, ::scale::Encoder& encoder) {
  encode(o.target, encoder);
  encode(o.value, encoder);
  encode(o.call_data, encoder);
}

void decode(execution<1>&& o, ::scale::Decoder& decoder) {
  decode(o.target, decoder);
  decode(o.value, decoder);
  decode(o.call_data, decoder);
}

}  // namespace warden::schema::encoding::scale
