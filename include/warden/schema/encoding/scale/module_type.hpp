#pragma once
#include <warden/schema/call_type.hpp>
#include <warden/schema/module_type.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace warden::schema::encoding::scale {

void encode(module_type_t&& o, ::scale::Encoder& encoder);
void decode(module_type_t&& o, ::scale::Decoder& decoder);

void encode(call_type_t&& o, ::scale::Encoder& encoder);
void decode(call_type_t&& o, ::scale::Decoder& decoder);

}  // namespace warden::schema::encoding::scale
