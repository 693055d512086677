#pragma once
#include <warden/schema/execution_mode.hpp>
#include <warden/schema/module_type.hpp>
#include <warden/schema/primitives.hpp>

#include <variant>

// Schema type: account call.
// The account's own operation surface. Encoded, it is the payload of a
// user operation and the data a hook module observes.
namespace warden::schema {

struct execute_call_t final {
  execution_mode_t mode{};
  bytes_t execution_data;
};

struct execute_from_executor_call_t final {
  execution_mode_t mode{};
  bytes_t execution_data;
};

struct install_module_call_t final {
  module_type_t module_type{};
  address_t module{};
  bytes_t init_data;
};

struct uninstall_module_call_t final {
  module_type_t module_type{};
  address_t module{};
  bytes_t deinit_data;
};

using account_call_t = std::variant<execute_call_t,
                                    execute_from_executor_call_t,
                                    install_module_call_t,
                                    uninstall_module_call_t>;

}  // namespace warden::schema
