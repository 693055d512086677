#include <warden/schema/encoding/scale/account_snapshot.hpp>
#include <warden/schema/encoding/scale/fallback_handler.hpp>
#include <warden/schema/encoding/scale/module_type.hpp>

using namespace warden::schema;

namespace warden::schema::encoding::scale {

void encode(account_snapshot<1>&& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.modules, encoder);
  encode(o.hook, encoder);
  encode(o.fallbacks, encoder);
  encode(o.initialized, encoder);
  encode(o.delegation_target, encoder);
}

void decode(account_snapshot<1>&& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.modules, decoder);
  decode(o.hook, decoder);
  decode(o.fallbacks, decoder);
  decode(o.initialized, decoder);
  decode(o.delegation_target, decoder);
}

}  // namespace warden::schema::encoding::scale
