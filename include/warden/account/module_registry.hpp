#pragma once

#include <warden/schema/module_type.hpp>
#include <warden/schema/primitives.hpp>

#include <map>
#include <vector>

namespace warden::account {

/// Category -> insertion-ordered set of module addresses. Categories are
/// independent; one address may appear in several of them.
class module_registry final {
 public:
  bool contains(warden::schema::module_type_t type,
                const warden::schema::address_t& module) const;

  /// False when `module` is already present in `type`.
  bool add(warden::schema::module_type_t type,
           const warden::schema::address_t& module);

  /// False when `module` was not present in `type`.
  bool remove(warden::schema::module_type_t type,
              const warden::schema::address_t& module);

  /// Members of `type` in insertion order.
  std::vector<warden::schema::address_t> list(
      warden::schema::module_type_t type) const;

  void clear(warden::schema::module_type_t type);
  bool empty(warden::schema::module_type_t type) const;

  /// Every non-empty category, ordered by type id.
  std::vector<warden::schema::module_type_t> categories() const;

 private:
  std::map<warden::schema::module_type_t,
           std::vector<warden::schema::address_t>>
      modules_;
};

}  // namespace warden::account
