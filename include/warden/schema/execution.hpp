#pragma once
#include <warden/schema/primitives.hpp>

// Schema type: execution.
// One unit of work: call `target` with `value` and `call_data`.
namespace warden::schema {

template <uint16_t Version>
struct execution;

template <>
struct execution<1> final {
  address_t target{};
  amount_t value{};
  bytes_t call_data;
};

using execution_t = execution<1>;

}  // namespace warden::schema
