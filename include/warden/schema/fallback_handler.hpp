#pragma once
#include <warden/schema/call_type.hpp>
#include <warden/schema/primitives.hpp>

namespace warden::schema {

/// Route for one fallback selector. `call_type` is single or static_call.
struct fallback_handler_t final {
  address_t handler{};
  call_type_t call_type{call_type_t::single};
};

}  // namespace warden::schema
