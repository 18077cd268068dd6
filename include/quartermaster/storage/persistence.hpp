#pragma once
#include <quartermaster/schema/operation_result.hpp>
#include <quartermaster/storage/rocksdb/storage.hpp>
#include <quartermaster/store/entity_store.hpp>
#include <string>
#include <string_view>

namespace quartermaster::storage {

inline constexpr auto kAssetPrefix = std::string_view{"AST|"};
inline constexpr auto kUserPrefix = std::string_view{"USR|"};
inline constexpr auto kTransactionPrefix = std::string_view{"TX|"};
inline constexpr auto kReservationPrefix = std::string_view{"RES|"};

/// Key of the `index`th entity under `prefix`. Indices are zero padded so
/// RocksDB key order matches collection order.
std::string make_entity_key(std::string_view prefix, size_t index);

/// Write every collection and the session state in one batch, replacing
/// whatever was stored before.
void save_store(const rocksdb_storage_t& storage,
                const store::entity_store& store);

/// Replace the store contents with what was last saved. An empty database
/// leaves the store empty. Undecodable values fail with encoding_failed.
schema::operation_result_t load_store(const rocksdb_storage_t& storage,
                                      store::entity_store& store);

}  // namespace quartermaster::storage
