#pragma once
#include <rocksdb/db.h>
#include <rocksdb/iterator.h>
#include <rocksdb/options.h>
#include <rocksdb/slice.h>
#include <spdlog/spdlog.h>
#include <warden/common/critical.hpp>
#include <warden/storage/storage.hpp>
#include <iterator>
#include <memory>
#include <string>
#include <string_view>

namespace warden::storage {

struct rocksdb_storage_tag {};

template <>
struct storage<rocksdb_storage_tag> final {
  std::unique_ptr<ROCKSDB_NAMESPACE::DB> database;

  template <typename T, typename Encoder>
  std::optional<T> get(Encoder& encoder,
                       const warden::schema::bytes_view_t& key);

  template <typename T, typename Encoder>
  void put(Encoder& encoder,
           const warden::schema::bytes_view_t& key,
           const T& value);

  std::optional<warden::schema::account_snapshot_t> load_account_snapshot(
      const warden::schema::address_t& account) const;
  void save_account_snapshot(
      const warden::schema::address_t& account,
      const warden::schema::account_snapshot_t& snapshot) const;
  std::vector<warden::schema::address_t> list_accounts() const;
  std::vector<key_value_entry_t> list_by_prefix(
      const warden::schema::bytes_view_t& prefix) const;
};

template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path);

template <typename T, typename Encoder>
std::optional<T> storage<rocksdb_storage_tag>::get(
    Encoder& encoder,
    const warden::schema::bytes_view_t& key) {
  if (!database) {
    warden::common::critical("RocksDB database is not initialized");
  }
  auto key_slice = ROCKSDB_NAMESPACE::Slice{
      reinterpret_cast<const char*>(key.data()), key.size()};
  auto value = std::string{};
  auto status =
      database->Get(ROCKSDB_NAMESPACE::ReadOptions{}, key_slice, &value);
  if (!status.ok()) {
    if (status.IsNotFound()) {
      return std::nullopt;
    } else {
      spdlog::error("Failed to get value from RocksDB: {}", status.ToString());
      warden::common::critical("Failed to get value from RocksDB");
    }
  }
  return {encoder.template decode<T>(warden::schema::bytes_view_t{
      reinterpret_cast<const uint8_t*>(value.data()), value.size()})};
}

template <typename T, typename Encoder>
void storage<rocksdb_storage_tag>::put(Encoder& encoder,
                                       const warden::schema::bytes_view_t& key,
                                       const T& value) {
  if (!database) {
    warden::common::critical("RocksDB database is not initialized");
  }
  auto encoded_value = encoder.encode(value);
  auto key_slice = ROCKSDB_NAMESPACE::Slice{
      reinterpret_cast<const char*>(key.data()), key.size()};
  auto value_slice = ROCKSDB_NAMESPACE::Slice{
      reinterpret_cast<const char*>(encoded_value.data()),
      encoded_value.size()};
  auto status =
      database->Put(ROCKSDB_NAMESPACE::WriteOptions{}, key_slice, value_slice);
  if (!status.ok()) {
    spdlog::error("Failed to put value into RocksDB: {}", status.ToString());
    warden::common::critical("Failed to put value into RocksDB");
  }
}

}  // namespace warden::storage
