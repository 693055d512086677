#pragma once
#include <warden/schema/module_type.hpp>
#include <warden/schema/primitives.hpp>

#include <cstdint>
#include <variant>
#include <vector>

namespace warden::schema {

struct module_installed_t final {
  module_type_t module_type{};
  address_t module{};
};

struct module_uninstalled_t final {
  module_type_t module_type{};
  address_t module{};
};

struct try_execute_unsuccessful_t final {
  uint64_t index{};
  bytes_t return_data;
};

struct try_delegate_call_unsuccessful_t final {
  bytes_t call_data;
  bytes_t return_data;
};

using account_event_t = std::variant<module_installed_t,
                                     module_uninstalled_t,
                                     try_execute_unsuccessful_t,
                                     try_delegate_call_unsuccessful_t>;

using event_log_t = std::vector<account_event_t>;

}  // namespace warden::schema
