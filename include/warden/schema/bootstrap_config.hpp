#pragma once
#include <warden/schema/module_type.hpp>
#include <warden/schema/primitives.hpp>

#include <vector>

namespace warden::schema {

struct module_install_t final {
  module_type_t module_type{};
  address_t module{};
  bytes_t init_data;
};

/// Modules installed, in order, by one-time account initialization.
struct bootstrap_config_t final {
  std::vector<module_install_t> modules;
};

}  // namespace warden::schema
