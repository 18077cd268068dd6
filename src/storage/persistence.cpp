#include <spdlog/spdlog.h>
#include <quartermaster/storage/persistence.hpp>
#include <cstdio>

using namespace quartermaster::schema;

namespace quartermaster::storage {

namespace {

using encoder_t = detail::encoder_t;

template <typename T>
void append_entries(encoder_t& encoder,
                    const std::string_view prefix,
                    const std::vector<T>& values,
                    std::vector<key_value_entry_t>& out) {
  for (size_t i = 0; i < values.size(); ++i) {
    out.push_back(key_value_entry_t{make_bytes(make_entity_key(prefix, i)),
                                    encoder.encode(values[i])});
  }
}

template <typename T>
std::optional<std::string> read_entries(encoder_t& encoder,
                                        const rocksdb_storage_t& storage,
                                        const std::string_view prefix,
                                        std::vector<T>& out) {
  for (const auto& [key, value] :
       storage.list_by_prefix(make_bytes_view(prefix))) {
    auto decoded = encoder.try_decode<T>(make_bytes_view(value));
    if (!decoded) {
      return make_string(make_bytes_view(key));
    }
    out.push_back(std::move(*decoded));
  }
  return std::nullopt;
}

}  // namespace

std::string make_entity_key(const std::string_view prefix, const size_t index) {
  char digits[24];
  std::snprintf(digits, sizeof(digits), "%010llu",
                static_cast<unsigned long long>(index));
  auto key = std::string{prefix};
  key.append(digits);
  return key;
}

void save_store(const rocksdb_storage_t& storage,
                const store::entity_store& store) {
  auto encoder = encoder_t{};
  auto snapshot = store.snapshot();

  auto entries = std::vector<key_value_entry_t>{};
  append_entries(encoder, kAssetPrefix, snapshot.assets, entries);
  append_entries(encoder, kUserPrefix, snapshot.users, entries);
  append_entries(encoder, kTransactionPrefix, snapshot.transactions, entries);
  append_entries(encoder, kReservationPrefix, snapshot.reservations, entries);
  entries.push_back(key_value_entry_t{make_bytes(detail::kSessionStateKey),
                                      encoder.encode(snapshot.session)});

  storage.replace_by_prefixes(
      {make_bytes(kAssetPrefix), make_bytes(kUserPrefix),
       make_bytes(kTransactionPrefix), make_bytes(kReservationPrefix)},
      entries);
  spdlog::debug("Saved {} assets, {} users, {} transactions, {} reservations",
                snapshot.assets.size(), snapshot.users.size(),
                snapshot.transactions.size(), snapshot.reservations.size());
}

operation_result_t load_store(const rocksdb_storage_t& storage,
                              store::entity_store& store) {
  auto encoder = encoder_t{};
  auto snapshot = store::entity_snapshot{};

  auto failed_key =
      read_entries(encoder, storage, kAssetPrefix, snapshot.assets);
  if (!failed_key) {
    failed_key = read_entries(encoder, storage, kUserPrefix, snapshot.users);
  }
  if (!failed_key) {
    failed_key = read_entries(encoder, storage, kTransactionPrefix,
                              snapshot.transactions);
  }
  if (!failed_key) {
    failed_key = read_entries(encoder, storage, kReservationPrefix,
                              snapshot.reservations);
  }
  if (failed_key) {
    spdlog::error("Failed to decode stored value at {}", *failed_key);
    return make_failure(kPersistenceCodespace, error_code_t::encoding_failed,
                        "stored value could not be decoded", *failed_key);
  }

  if (auto session = storage.load_session_state()) {
    snapshot.session = std::move(*session);
  }
  return store.restore(std::move(snapshot));
}

}  // namespace quartermaster::storage
