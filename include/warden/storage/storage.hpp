#pragma once
#include <warden/schema/account_snapshot.hpp>
#include <warden/schema/primitives.hpp>
#include <optional>
#include <string_view>
#include <vector>

namespace warden::storage {

using key_value_entry_t =
    std::pair<warden::schema::bytes_t, warden::schema::bytes_t>;

template <typename Library>
struct storage {
  /// Decode and return value at key, or std::nullopt when missing.
  template <typename T, typename Encoder>
  std::optional<T> get(Encoder& encoder,
                       const warden::schema::bytes_view_t& key);

  /// Encode and persist value at key.
  template <typename T, typename Encoder>
  void put(Encoder& encoder,
           const warden::schema::bytes_view_t& key,
           const T& value);

  /// Load the module bookkeeping persisted for `account`.
  std::optional<warden::schema::account_snapshot_t> load_account_snapshot(
      const warden::schema::address_t& account) const;

  /// Persist the module bookkeeping of `account`, replacing any prior image.
  void save_account_snapshot(
      const warden::schema::address_t& account,
      const warden::schema::account_snapshot_t& snapshot) const;

  /// Addresses of every account with a persisted snapshot, in key order.
  std::vector<warden::schema::address_t> list_accounts() const;

  /// Return all key-value pairs that share the provided key prefix.
  std::vector<key_value_entry_t> list_by_prefix(
      const warden::schema::bytes_view_t& prefix) const;
};

/// Construct a concrete storage backend rooted at filesystem path.
template <typename Library>
storage<Library> make_storage(const std::string_view& path);

}  // namespace warden::storage
