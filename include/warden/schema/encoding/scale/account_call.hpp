#pragma once
#include <warden/schema/account_call.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace warden::schema::encoding::scale {

void encode(execute_call_t&& o, ::scale::Encoder& encoder);
void decode(execute_call_t&& o, ::scale::Decoder& decoder);

void encode(execute_from_executor_call_t&& o, ::scale::Encoder& encoder);
void decode(execute_from_executor_call_t&& o, ::scale::Decoder& decoder);

void encode(install_module_call_t&& o, ::scale::Encoder& encoder);
void decode(install_module_call_t&& o, ::scale::Decoder& decoder);

void encode(uninstall_module_call_t&& o, ::scale::Encoder& encoder);
void decode(uninstall_module_call_t&& o, ::scale::Decoder& decoder);

}  // namespace warden::schema::encoding::scale
