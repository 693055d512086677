#pragma once
#include <warden/schema/primitives.hpp>

namespace warden::schema {

/// Outcome of one host call: success flag plus raw return data.
struct call_result_t final {
  bool success{};
  bytes_t return_data;
};

}  // namespace warden::schema
