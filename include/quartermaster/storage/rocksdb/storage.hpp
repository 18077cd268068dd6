#pragma once
#include <rocksdb/db.h>
#include <rocksdb/iterator.h>
#include <rocksdb/options.h>
#include <rocksdb/slice.h>
#include <rocksdb/write_batch.h>
#include <spdlog/spdlog.h>
#include <quartermaster/common/critical.hpp>
#include <quartermaster/schema/operation_result.hpp>
#include <quartermaster/schema/encoding/scale/encoder.hpp>
#include <quartermaster/storage/storage.hpp>
#include <iterator>
#include <memory>
#include <scale/scale.hpp>
#include <string_view>

namespace quartermaster::storage {

inline constexpr auto kPersistenceCodespace =
    std::string_view{"quartermaster.storage"};

/// Keys are `<collection>|<rest>`; everything up to and including the first
/// `|` names the collection and is the RocksDB prefix.
inline constexpr char kCollectionSeparator = '|';

namespace detail {

using encoder_t = quartermaster::schema::encoding::encoder<
    quartermaster::schema::encoding::scale_encoder_tag>;

inline constexpr auto kSessionStateKey = std::string_view{"SYS|APP|SESSION"};

inline quartermaster::schema::bytes_t to_bytes(
    const ROCKSDB_NAMESPACE::Slice& slice) {
  return {reinterpret_cast<const uint8_t*>(slice.data()),
          reinterpret_cast<const uint8_t*>(slice.data()) + slice.size()};
}

inline ROCKSDB_NAMESPACE::Slice to_slice(
    const quartermaster::schema::bytes_view_t& bytes) {
  return ROCKSDB_NAMESPACE::Slice{reinterpret_cast<const char*>(bytes.data()),
                                  bytes.size()};
}

}  // namespace detail

struct rocksdb_storage_tag {};

template <>
struct storage<rocksdb_storage_tag> final {
  std::unique_ptr<ROCKSDB_NAMESPACE::DB> database;

  template <typename T, typename Encoder>
  std::optional<T> get(Encoder& encoder,
                       const quartermaster::schema::bytes_view_t& key);

  template <typename T, typename Encoder>
  void put(Encoder& encoder,
           const quartermaster::schema::bytes_view_t& key,
           const T& value);

  std::optional<quartermaster::schema::session_state_t> load_session_state()
      const;
  void save_session_state(
      const quartermaster::schema::session_state_t& state) const;
  std::vector<key_value_entry_t> list_by_prefix(
      const quartermaster::schema::bytes_view_t& prefix) const;
  void replace_by_prefix(const quartermaster::schema::bytes_view_t& prefix,
                         const std::vector<key_value_entry_t>& entries) const;
  void replace_by_prefixes(
      const std::vector<quartermaster::schema::bytes_t>& prefixes,
      const std::vector<key_value_entry_t>& entries) const;
};

using rocksdb_storage_t = storage<rocksdb_storage_tag>;

/// Open the ledger database at `path`, creating it when missing. Failure is
/// reported as storage_unavailable and leaves `storage` closed.
quartermaster::schema::operation_result_t open_ledger_storage(
    std::string_view path,
    rocksdb_storage_t& storage);

template <typename T, typename Encoder>
std::optional<T> storage<rocksdb_storage_tag>::get(
    Encoder& encoder,
    const quartermaster::schema::bytes_view_t& key) {
  if (!database) {
    quartermaster::common::critical("RocksDB database is not initialized");
  }
  auto value = std::string{};
  auto status = database->Get(ROCKSDB_NAMESPACE::ReadOptions{},
                              detail::to_slice(key), &value);
  if (!status.ok()) {
    if (status.IsNotFound()) {
      return std::nullopt;
    } else {
      spdlog::error("Failed to get value from RocksDB: {}", status.ToString());
      quartermaster::common::critical("Failed to get value from RocksDB");
    }
  }
  return {encoder.template decode<T>(quartermaster::schema::bytes_view_t{
      reinterpret_cast<const uint8_t*>(value.data()), value.size()})};
}

template <typename T, typename Encoder>
void storage<rocksdb_storage_tag>::put(
    Encoder& encoder,
    const quartermaster::schema::bytes_view_t& key,
    const T& value) {
  if (!database) {
    quartermaster::common::critical("RocksDB database is not initialized");
  }
  auto encoded_value = encoder.encode(value);
  auto status = database->Put(ROCKSDB_NAMESPACE::WriteOptions{},
                              detail::to_slice(key),
                              detail::to_slice(encoded_value));
  if (!status.ok()) {
    spdlog::error("Failed to put value into RocksDB: {}", status.ToString());
    quartermaster::common::critical("Failed to put value into RocksDB");
  }
}

inline std::optional<quartermaster::schema::session_state_t>
storage<rocksdb_storage_tag>::load_session_state() const {
  if (!database) {
    quartermaster::common::critical("RocksDB database is not initialized");
  }
  auto raw = std::string{};
  auto status = database->Get(ROCKSDB_NAMESPACE::ReadOptions{},
                              std::string{detail::kSessionStateKey}, &raw);
  if (status.IsNotFound()) {
    return std::nullopt;
  }
  if (!status.ok()) {
    quartermaster::common::critical("failed to load session state");
  }

  auto encoder = detail::encoder_t{};
  auto decoded = encoder.try_decode<quartermaster::schema::session_state_t>(
      quartermaster::schema::bytes_view_t{
          reinterpret_cast<const uint8_t*>(raw.data()), raw.size()});
  if (!decoded.has_value()) {
    quartermaster::common::critical("failed to decode session state");
  }
  return decoded;
}

inline void storage<rocksdb_storage_tag>::save_session_state(
    const quartermaster::schema::session_state_t& state) const {
  if (!database) {
    quartermaster::common::critical("RocksDB database is not initialized");
  }
  auto encoder = detail::encoder_t{};
  auto encoded = encoder.encode(state);
  auto status = database->Put(ROCKSDB_NAMESPACE::WriteOptions{},
                              std::string{detail::kSessionStateKey},
                              detail::to_slice(encoded));
  if (!status.ok()) {
    quartermaster::common::critical("failed to persist session state");
  }
}

inline std::vector<key_value_entry_t>
storage<rocksdb_storage_tag>::list_by_prefix(
    const quartermaster::schema::bytes_view_t& prefix) const {
  if (!database) {
    quartermaster::common::critical("RocksDB database is not initialized");
  }

  auto entries = std::vector<key_value_entry_t>{};
  auto prefix_string =
      std::string{reinterpret_cast<const char*>(prefix.data()), prefix.size()};

  auto read_options = ROCKSDB_NAMESPACE::ReadOptions{};
  read_options.prefix_same_as_start = true;
  auto iterator = std::unique_ptr<ROCKSDB_NAMESPACE::Iterator>{
      database->NewIterator(read_options)};
  iterator->Seek(prefix_string);
  while (iterator->Valid()) {
    auto key_view =
        std::string_view{iterator->key().data(), iterator->key().size()};
    if (!key_view.starts_with(prefix_string)) {
      break;
    }
    entries.push_back(key_value_entry_t{detail::to_bytes(iterator->key()),
                                        detail::to_bytes(iterator->value())});
    iterator->Next();
  }
  if (!iterator->status().ok()) {
    spdlog::error("RocksDB iteration failed: {}",
                  iterator->status().ToString());
    quartermaster::common::critical("failed to list keys by prefix");
  }
  return entries;
}

inline void storage<rocksdb_storage_tag>::replace_by_prefix(
    const quartermaster::schema::bytes_view_t& prefix,
    const std::vector<key_value_entry_t>& entries) const {
  replace_by_prefixes({quartermaster::schema::bytes_t{std::begin(prefix),
                                                      std::end(prefix)}},
                      entries);
}

inline void storage<rocksdb_storage_tag>::replace_by_prefixes(
    const std::vector<quartermaster::schema::bytes_t>& prefixes,
    const std::vector<key_value_entry_t>& entries) const {
  if (!database) {
    quartermaster::common::critical("RocksDB database is not initialized");
  }

  auto read_options = ROCKSDB_NAMESPACE::ReadOptions{};
  read_options.prefix_same_as_start = true;
  auto batch = ROCKSDB_NAMESPACE::WriteBatch{};

  for (const auto& prefix : prefixes) {
    auto prefix_string = std::string{
        reinterpret_cast<const char*>(prefix.data()), prefix.size()};
    auto iterator = std::unique_ptr<ROCKSDB_NAMESPACE::Iterator>{
        database->NewIterator(read_options)};
    iterator->Seek(prefix_string);
    while (iterator->Valid()) {
      auto key_view =
          std::string_view{iterator->key().data(), iterator->key().size()};
      if (!key_view.starts_with(prefix_string)) {
        break;
      }
      auto delete_status = batch.Delete(iterator->key());
      if (!delete_status.ok()) {
        quartermaster::common::critical(
            "failed deleting key during prefix replacement");
      }
      iterator->Next();
    }
  }

  for (const auto& [key, value] : entries) {
    auto put_status =
        batch.Put(detail::to_slice(key), detail::to_slice(value));
    if (!put_status.ok()) {
      quartermaster::common::critical(
          "failed writing key during prefix replacement");
    }
  }

  auto write_status =
      database->Write(ROCKSDB_NAMESPACE::WriteOptions{}, &batch);
  if (!write_status.ok()) {
    quartermaster::common::critical("failed to commit prefix replacement");
  }
}

}  // namespace quartermaster::storage
