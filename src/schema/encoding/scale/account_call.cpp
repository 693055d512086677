#include <warden/schema/encoding/scale/account_call.hpp>
#include <warden/schema/encoding/scale/module_type.hpp>

#include <utility>

using namespace warden::schema;

namespace warden::schema::encoding::scale {

void encode(execute_call_t&& o, ::scale::Encoder& encoder) {
  encode(o.mode, encoder);
  encode(o.execution_data, encoder);
}

void decode(execute_call_t&& o, ::scale::Decoder& decoder) {
  decode(o.mode, decoder);
  decode(o.execution_data, decoder);
}

void encode(execute_from_executor_call_t&& o, ::scale::Encoder& encoder) {
  encode(o.mode, encoder);
  encode(o.execution_data, encoder);
}

void decode(execute_from_executor_call_t&& o, ::scale::Decoder& decoder) {
  decode(o.mode, decoder);
  decode(o.execution_data, decoder);
}

void encode(install_module_call_t&& o, ::scale::Encoder& encoder) {
  encode(module_type_t{o.module_type}, encoder);
  encode(o.module, encoder);
  encode(o.init_data, encoder);
}

void decode(install_module_call_t&& o, ::scale::Decoder& decoder) {
  decode(std::move(o.module_type), decoder);
  decode(o.module, decoder);
  decode(o.init_data, decoder);
}

void encode(uninstall_module_call_t&& o, ::scale::Encoder& encoder) {
  encode(module_type_t{o.module_type}, encoder);
  encode(o.module, encoder);
  encode(o.deinit_data, encoder);
}

void decode(uninstall_module_call_t&& o, ::scale::Decoder& decoder) {
  decode(std::move(o.module_type), decoder);
  decode(o.module, decoder);
  decode(o.deinit_data, decoder);
}

}  // namespace warden::schema::encoding::scale
