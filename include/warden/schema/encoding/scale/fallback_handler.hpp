#pragma once
#include <warden/schema/fallback_handler.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace warden::schema::encoding::scale {

void encode(fallback_handler_t&& o, ::scale::Encoder& encoder);
void decode(fallback_handler_t&& o, ::scale::Decoder& decoder);

}  // namespace warden::schema::encoding::scale
