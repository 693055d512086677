#pragma once
#include <warden/schema/fallback_handler.hpp>
#include <warden/schema/module_type.hpp>
#include <warden/schema/primitives.hpp>

#include <optional>
#include <utility>
#include <vector>

namespace warden::schema {

template <uint16_t Version>
struct account_snapshot;

/// Persistable image of an account's module bookkeeping.
template <>
struct account_snapshot<1> final {
  uint16_t version{1};
  std::vector<std::pair<module_type_t, std::vector<address_t>>> modules;
  std::optional<address_t> hook;
  std::vector<std::pair<selector_t, fallback_handler_t>> fallbacks;
  bool initialized{};
  std::optional<address_t> delegation_target;
};

using account_snapshot_t = account_snapshot<1>;

}  // namespace warden::schema
