#include <warden/schema/encoding/scale/bootstrap_config.hpp>
#include <warden/schema/encoding/scale/module_type.hpp>

#include <utility>

using namespace warden::schema;

namespace warden::schema::encoding::scale {

void encode(module_install_t&& o, ::scale::Encoder& encoder) {
  encode(module_type_t{o.module_type}, encoder);
  encode(o.module, encoder);
  encode(o.init_data, encoder);
}

void decode(module_install_t&& o, ::scale::Decoder& decoder) {
  decode(std::move(o.module_type), decoder);
  decode(o.module, decoder);
  decode(o.init_data, decoder);
}

void encode(bootstrap_config_t&& o, ::scale::Encoder& encoder) {
  encode(o.modules, encoder);
}

void decode(bootstrap_config_t&& o, ::scale::Decoder& decoder) {
  decode(o.modules, decoder);
}

}  // namespace warden::schema::encoding::scale
