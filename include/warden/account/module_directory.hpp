#pragma once

#include <warden/account/module.hpp>
#include <warden/common/error.hpp>
#include <warden/schema/primitives.hpp>

#include <memory>

namespace warden::account {

/// Resolves a module address to the object that implements it.
class module_directory {
 public:
  virtual ~module_directory() = default;

  /// nullptr when nothing lives at `address`.
  virtual std::shared_ptr<module> find(
      const warden::schema::address_t& address) = 0;
};

/// Resolve `address` as a `Module`, failing with invalid_module when the
/// address is unknown or does not implement that interface.
template <typename Module>
std::shared_ptr<Module> resolve(module_directory& directory,
                                const warden::schema::address_t& address) {
  auto found = std::dynamic_pointer_cast<Module>(directory.find(address));
  if (!found) {
    throw warden::common::account_error{
        warden::schema::account_error_code::invalid_module,
        warden::schema::to_hex(address)};
  }
  return found;
}

}  // namespace warden::account
