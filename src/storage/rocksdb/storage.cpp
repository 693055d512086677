#include <warden/common/critical.hpp>
#include <warden/schema/encoding/scale/encoder.hpp>
#include <warden/storage/rocksdb/storage.hpp>

#include <string>

using namespace warden::schema;

namespace warden::storage {

namespace {

using encoder_t = encoding::encoder<encoding::scale_encoder_tag>;

// Account snapshots live under "ACCT|SNAPSHOT|" followed by the raw 20-byte
// account address, so a prefix scan yields accounts in address order.
inline constexpr auto kAccountSnapshotPrefix =
    std::string_view{"ACCT|SNAPSHOT|"};

std::string make_account_snapshot_key(const address_t& account) {
  auto key = std::string{kAccountSnapshotPrefix};
  key.append(reinterpret_cast<const char*>(account.data()), account.size());
  return key;
}

std::optional<address_t> parse_account_snapshot_key(std::string_view key) {
  if (!key.starts_with(kAccountSnapshotPrefix)) {
    return std::nullopt;
  }
  key.remove_prefix(kAccountSnapshotPrefix.size());
  return try_make_address(make_bytes_view(key));
}

bytes_t to_bytes(const ROCKSDB_NAMESPACE::Slice& slice) {
  return {reinterpret_cast<const uint8_t*>(slice.data()),
          reinterpret_cast<const uint8_t*>(slice.data()) + slice.size()};
}

void require_open(const storage<rocksdb_storage_tag>& store) {
  if (!store.database) {
    warden::common::critical("account store is not open");
  }
}

}  // namespace

template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path) {
  auto store = storage<rocksdb_storage_tag>();

  // Snapshots are small and rewritten whole on every save.
  auto options = ROCKSDB_NAMESPACE::Options{};
  options.create_if_missing = true;
  options.OptimizeForSmallDb();

  ROCKSDB_NAMESPACE::DB* database{nullptr};
  auto status =
      ROCKSDB_NAMESPACE::DB::Open(options, std::string{path}, &database);
  if (!status.ok()) {
    spdlog::error("Failed to open account store at {}: {}", path,
                  status.ToString());
    warden::common::critical("failed to open account store");
  }
  store.database.reset(database);
  spdlog::info("Opened account store at {} ({} account(s))", path,
               store.list_accounts().size());

  return store;
}

std::optional<account_snapshot_t>
storage<rocksdb_storage_tag>::load_account_snapshot(
    const address_t& account) const {
  require_open(*this);
  auto raw_value = std::string{};
  auto status = database->Get(ROCKSDB_NAMESPACE::ReadOptions{},
                              make_account_snapshot_key(account), &raw_value);
  if (status.IsNotFound()) {
    spdlog::debug("No snapshot stored for {}", to_hex(account));
    return std::nullopt;
  }
  if (!status.ok()) {
    spdlog::error("Failed to load snapshot of {}: {}", to_hex(account),
                  status.ToString());
    warden::common::critical("failed to load account snapshot");
  }

  auto encoder = encoder_t{};
  auto decoded = encoder.try_decode<account_snapshot_t>(make_bytes_view(raw_value));
  if (!decoded) {
    spdlog::error("Stored snapshot of {} does not decode", to_hex(account));
    warden::common::critical("failed to decode account snapshot");
  }
  return decoded;
}

void storage<rocksdb_storage_tag>::save_account_snapshot(
    const address_t& account,
    const account_snapshot_t& snapshot) const {
  require_open(*this);
  auto encoder = encoder_t{};
  auto encoded = encoder.encode(snapshot);
  auto status = database->Put(
      ROCKSDB_NAMESPACE::WriteOptions{}, make_account_snapshot_key(account),
      ROCKSDB_NAMESPACE::Slice{reinterpret_cast<const char*>(encoded.data()),
                               encoded.size()});
  if (!status.ok()) {
    spdlog::error("Failed to save snapshot of {}: {}", to_hex(account),
                  status.ToString());
    warden::common::critical("failed to persist account snapshot");
  }
  spdlog::debug("Saved snapshot of {} ({} bytes)", to_hex(account),
                encoded.size());
}

std::vector<address_t> storage<rocksdb_storage_tag>::list_accounts() const {
  auto accounts = std::vector<address_t>{};
  for (const auto& [key, value] :
       list_by_prefix(make_bytes_view(kAccountSnapshotPrefix))) {
    auto account = parse_account_snapshot_key(
        std::string_view{reinterpret_cast<const char*>(key.data()), key.size()});
    if (!account) {
      spdlog::warn("Skipping malformed account snapshot key");
      continue;
    }
    accounts.push_back(*account);
  }
  return accounts;
}

std::vector<key_value_entry_t> storage<rocksdb_storage_tag>::list_by_prefix(
    const bytes_view_t& prefix) const {
  require_open(*this);
  auto entries = std::vector<key_value_entry_t>{};
  auto prefix_slice = ROCKSDB_NAMESPACE::Slice{
      reinterpret_cast<const char*>(prefix.data()), prefix.size()};

  auto iterator = std::unique_ptr<ROCKSDB_NAMESPACE::Iterator>{
      database->NewIterator(ROCKSDB_NAMESPACE::ReadOptions{})};
  for (iterator->Seek(prefix_slice);
       iterator->Valid() && iterator->key().starts_with(prefix_slice);
       iterator->Next()) {
    entries.push_back(
        key_value_entry_t{to_bytes(iterator->key()), to_bytes(iterator->value())});
  }
  return entries;
}

}  // namespace warden::storage
