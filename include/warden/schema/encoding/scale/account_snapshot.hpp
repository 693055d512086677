#pragma once
#include <warden/schema/account_snapshot.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace warden::schema::encoding::scale {

void encode(account_snapshot<1>&& o, ::scale::Encoder& encoder);
void decode(account_snapshot<1>&& o, ::scale::Decoder& decoder);

}  // namespace warden::schema::encoding::scale
