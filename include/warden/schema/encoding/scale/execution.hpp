#pragma once
#include <warden/schema/execution.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace warden::schema::encoding::scale {

void encode(execution<1>&& o, ::scale::Encoder& encoder);
void decode(execution<1>&& o, ::scale::Decoder& decoder);

}  // namespace warden::schema::encoding::scale
