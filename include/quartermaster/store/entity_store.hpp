#pragma once
#include <quartermaster/common/time.hpp>
#include <quartermaster/schema/asset.hpp>
#include <quartermaster/schema/operation_result.hpp>
#include <quartermaster/schema/reservation.hpp>
#include <quartermaster/schema/session_state.hpp>
#include <quartermaster/schema/transaction.hpp>
#include <quartermaster/schema/user.hpp>
#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace quartermaster::store {

enum class collection_t : uint8_t {
  assets = 0,
  users = 1,
  transactions = 2,
  reservations = 3
};

/// Describes one committed write. A single logical operation that touches
/// several collections (a borrow updates the asset and appends a transaction)
/// is published as one event.
struct change_event final {
  std::vector<collection_t> collections;
  std::vector<std::string> ids;

  bool touches(collection_t collection) const;
};

using listener_t = std::function<void(const change_event&)>;
using subscription_id_t = uint64_t;

/// Full copy of the store contents, used by persistence.
struct entity_snapshot final {
  std::vector<schema::asset_t> assets;
  std::vector<schema::user_t> users;
  std::vector<schema::transaction_t> transactions;
  std::vector<schema::reservation_t> reservations;
  schema::session_state_t session;
};

inline constexpr auto kStoreCodespace = std::string_view{"quartermaster.store"};

/// Owner of the four persisted collections.
///
/// Collections keep insertion order. Pointers returned by lookups stay valid
/// until the next mutation of the same collection. Every successful write is
/// published to subscribers after it has been fully applied.
class entity_store final {
 public:
  explicit entity_store(common::clock_t clock = common::system_clock());

  entity_store(const entity_store&) = delete;
  entity_store& operator=(const entity_store&) = delete;

  schema::timestamp_milliseconds_t now() const;
  bool empty() const;

  const schema::asset_t* find_asset(std::string_view asset_id) const;
  std::vector<const schema::asset_t*> assets() const;
  std::vector<std::string> categories() const;

  /// Insert a new asset. An empty id is replaced with a generated one, an
  /// empty purchase date with today and an empty image with a placeholder.
  schema::operation_result_t insert_asset(schema::asset_t value);

  /// Insert several assets as one change. Nothing is inserted when any value
  /// is rejected.
  schema::operation_result_t insert_assets(std::vector<schema::asset_t> values);

  /// Replace the asset with the same id.
  schema::operation_result_t update_asset(schema::asset_t value);

  /// Replace several assets as one change. Nothing is written when any value
  /// is rejected.
  schema::operation_result_t update_assets(std::vector<schema::asset_t> values);

  const schema::user_t* find_user(std::string_view user_id) const;
  const schema::user_t* find_user_by_name(std::string_view name) const;
  std::vector<const schema::user_t*> users() const;
  schema::operation_result_t insert_user(schema::user_t value);
  schema::operation_result_t update_user(schema::user_t value);

  const schema::reservation_t* find_reservation(
      std::string_view reservation_id) const;
  std::vector<const schema::reservation_t*> reservations() const;
  schema::operation_result_t insert_reservation(schema::reservation_t value);
  schema::operation_result_t update_reservation(schema::reservation_t value);

  /// Ledger entries in insertion order.
  const std::vector<schema::transaction_t>& transactions() const;

  /// Ledger entries newest first; equal timestamps list the later insertion
  /// first.
  std::vector<const schema::transaction_t*> ledger() const;
  std::vector<const schema::transaction_t*> history(
      std::string_view asset_id) const;
  std::vector<const schema::transaction_t*> search_ledger(
      std::string_view text) const;

  /// Append a ledger entry that carries its own timestamp. A zero timestamp
  /// is stamped with the current time.
  schema::operation_result_t insert_transaction(schema::transaction_t entry);

  /// Apply an asset state change and append the ledger entry describing it.
  /// The entry receives its id, sequence and timestamp here.
  schema::operation_result_t record_transition(schema::asset_t updated,
                                               schema::transaction_t entry);

  std::string generate_id(collection_t collection);

  subscription_id_t subscribe(listener_t listener);
  void unsubscribe(subscription_id_t id);

  entity_snapshot snapshot() const;

  /// Replace every collection with the snapshot contents.
  schema::operation_result_t restore(entity_snapshot snapshot);

 private:
  schema::timestamp_milliseconds_t next_timestamp();
  bool id_taken(collection_t collection, std::string_view id) const;
  std::optional<schema::operation_result_t> normalize_asset(
      schema::asset_t& value) const;
  void append_transaction(schema::transaction_t entry);
  void publish(change_event event);

  common::clock_t clock_;
  std::vector<schema::asset_t> assets_;
  std::unordered_map<std::string, size_t> asset_index_;
  std::vector<schema::user_t> users_;
  std::unordered_map<std::string, size_t> user_index_;
  std::vector<schema::transaction_t> transactions_;
  std::unordered_map<std::string, size_t> transaction_index_;
  std::vector<schema::reservation_t> reservations_;
  std::unordered_map<std::string, size_t> reservation_index_;
  schema::session_state_t session_;
  std::map<subscription_id_t, listener_t> listeners_;
  subscription_id_t next_subscription_{1};
};

std::string_view to_string(collection_t collection);

/// Load the sample data set into an empty store.
schema::operation_result_t seed_sample_data(entity_store& store);

}  // namespace quartermaster::store
