#pragma once
#include <warden/schema/bootstrap_config.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace warden::schema::encoding::scale {

void encode(module_install_t&& o, ::scale::Encoder& encoder);
void decode(module_install_t&& o, ::scale::Decoder& decoder);

void encode(bootstrap_config_t&& o, ::scale::Encoder& encoder);
void decode(bootstrap_config_t&& o, ::scale::Decoder& decoder);

}  // namespace warden::schema::encoding::scale
