#pragma once

#include <warden/schema/module_type.hpp>
#include <warden/schema/primitives.hpp>

namespace warden::account {

/// External gate consulted before module installation and before an
/// executor drives execution.
class attestation_registry {
 public:
  virtual ~attestation_registry() = default;

  virtual bool authorize(const warden::schema::address_t& module,
                         warden::schema::module_type_t type) = 0;
};

}  // namespace warden::account
