#include <spdlog/spdlog.h>
#include <quartermaster/store/entity_store.hpp>
#include <algorithm>
#include <cstdio>
#include <iterator>
#include <set>
#include <unordered_set>
#include <utility>

using namespace quartermaster::schema;

namespace quartermaster::store {

namespace {

std::string_view id_prefix(const collection_t collection) {
  switch (collection) {
    case collection_t::assets:
      return "AST-";
    case collection_t::users:
      return "U-";
    case collection_t::transactions:
      return "TX-";
    case collection_t::reservations:
      return "RES-";
  }
  return "ID-";
}

bool canonical_order(const transaction_t* lhs, const transaction_t* rhs) {
  if (lhs->timestamp != rhs->timestamp) {
    return lhs->timestamp > rhs->timestamp;
  }
  return lhs->sequence > rhs->sequence;
}

template <typename T>
std::vector<const T*> make_pointers(const std::vector<T>& values) {
  auto pointers = std::vector<const T*>{};
  pointers.reserve(values.size());
  for (const auto& value : values) {
    pointers.push_back(&value);
  }
  return pointers;
}

template <typename T>
const T* find_by_id(const std::vector<T>& values,
                    const std::unordered_map<std::string, size_t>& index,
                    const std::string_view id) {
  auto it = index.find(std::string{id});
  if (it == std::end(index)) {
    return nullptr;
  }
  return &values[it->second];
}

template <typename T, typename IdOf>
std::optional<std::unordered_map<std::string, size_t>> build_index(
    const std::vector<T>& values,
    IdOf&& id_of) {
  auto index = std::unordered_map<std::string, size_t>{};
  for (size_t i = 0; i < values.size(); ++i) {
    auto [_, inserted] = index.emplace(id_of(values[i]), i);
    if (!inserted) {
      return std::nullopt;
    }
  }
  return index;
}

}  // namespace

bool change_event::touches(const collection_t collection) const {
  return std::find(std::begin(collections), std::end(collections),
                   collection) != std::end(collections);
}

std::string_view to_string(const collection_t collection) {
  switch (collection) {
    case collection_t::assets:
      return "assets";
    case collection_t::users:
      return "users";
    case collection_t::transactions:
      return "transactions";
    case collection_t::reservations:
      return "reservations";
  }
  return "unknown";
}

entity_store::entity_store(common::clock_t clock) : clock_{std::move(clock)} {}

timestamp_milliseconds_t entity_store::now() const {
  return clock_();
}

bool entity_store::empty() const {
  return assets_.empty() && users_.empty() && transactions_.empty() &&
         reservations_.empty();
}

const asset_t* entity_store::find_asset(const std::string_view asset_id) const {
  return find_by_id(assets_, asset_index_, asset_id);
}

std::vector<const asset_t*> entity_store::assets() const {
  return make_pointers(assets_);
}

std::vector<std::string> entity_store::categories() const {
  auto distinct = std::set<std::string>{};
  for (const auto& value : assets_) {
    distinct.insert(value.category);
  }
  return {std::begin(distinct), std::end(distinct)};
}

std::optional<operation_result_t> entity_store::normalize_asset(
    asset_t& value) const {
  if (value.name.empty()) {
    return make_failure(kStoreCodespace, error_code_t::invalid_argument,
                        "asset name must not be empty", value.asset_id);
  }
  if (value.status == asset_status_t::borrowed) {
    if (!value.current_holder || value.current_holder->empty()) {
      return make_failure(kStoreCodespace, error_code_t::invalid_argument,
                          "borrowed asset requires a holder", value.asset_id);
    }
  } else {
    value.current_holder.reset();
  }
  if (value.purchase_date.empty()) {
    value.purchase_date = common::format_date(now());
  } else if (!common::try_parse_date(value.purchase_date)) {
    return make_failure(kStoreCodespace, error_code_t::invalid_argument,
                        "purchase date must be YYYY-MM-DD", value.asset_id);
  }
  if (value.image_url.empty()) {
    value.image_url = make_placeholder_image_url(value.asset_id);
  }
  value.qr_code = make_qr_code(value.asset_id);
  return std::nullopt;
}

operation_result_t entity_store::insert_asset(asset_t value) {
  if (value.asset_id.empty()) {
    value.asset_id = generate_id(collection_t::assets);
  } else if (id_taken(collection_t::assets, value.asset_id)) {
    return make_failure(kStoreCodespace, error_code_t::duplicate_id,
                        "asset id already exists", value.asset_id);
  }
  if (auto failure = normalize_asset(value)) {
    return *failure;
  }
  auto id = value.asset_id;
  asset_index_.emplace(id, assets_.size());
  assets_.push_back(std::move(value));
  spdlog::debug("Inserted asset {}", id);
  publish(change_event{{collection_t::assets}, {id}});
  return make_success(kStoreCodespace, id);
}

operation_result_t entity_store::insert_assets(std::vector<asset_t> values) {
  auto pending = std::unordered_set<std::string>{};
  for (auto& value : values) {
    if (value.asset_id.empty()) {
      do {
        value.asset_id = generate_id(collection_t::assets);
      } while (pending.contains(value.asset_id));
    } else if (id_taken(collection_t::assets, value.asset_id) ||
               pending.contains(value.asset_id)) {
      return make_failure(kStoreCodespace, error_code_t::duplicate_id,
                          "asset id already exists", value.asset_id);
    }
    if (auto failure = normalize_asset(value)) {
      return *failure;
    }
    pending.insert(value.asset_id);
  }
  if (values.empty()) {
    return make_success(kStoreCodespace, {});
  }

  auto ids = std::vector<std::string>{};
  ids.reserve(values.size());
  for (auto& value : values) {
    ids.push_back(value.asset_id);
    asset_index_.emplace(value.asset_id, assets_.size());
    assets_.push_back(std::move(value));
  }
  spdlog::debug("Inserted {} assets", ids.size());
  publish(change_event{{collection_t::assets}, std::move(ids)});
  return make_success(kStoreCodespace, {});
}

operation_result_t entity_store::update_asset(asset_t value) {
  auto it = asset_index_.find(value.asset_id);
  if (it == std::end(asset_index_)) {
    return make_failure(kStoreCodespace, error_code_t::not_found,
                        "asset not found", value.asset_id);
  }
  if (auto failure = normalize_asset(value)) {
    return *failure;
  }
  auto id = value.asset_id;
  assets_[it->second] = std::move(value);
  publish(change_event{{collection_t::assets}, {id}});
  return make_success(kStoreCodespace, id);
}

operation_result_t entity_store::update_assets(std::vector<asset_t> values) {
  for (auto& value : values) {
    if (!asset_index_.contains(value.asset_id)) {
      return make_failure(kStoreCodespace, error_code_t::not_found,
                          "asset not found", value.asset_id);
    }
    if (auto failure = normalize_asset(value)) {
      return *failure;
    }
  }
  if (values.empty()) {
    return make_success(kStoreCodespace, {});
  }

  auto ids = std::vector<std::string>{};
  ids.reserve(values.size());
  for (auto& value : values) {
    ids.push_back(value.asset_id);
    assets_[asset_index_.at(value.asset_id)] = std::move(value);
  }
  publish(change_event{{collection_t::assets}, std::move(ids)});
  return make_success(kStoreCodespace, {});
}

const user_t* entity_store::find_user(const std::string_view user_id) const {
  return find_by_id(users_, user_index_, user_id);
}

const user_t* entity_store::find_user_by_name(
    const std::string_view name) const {
  auto it = std::find_if(std::begin(users_), std::end(users_),
                         [&](const auto& value) { return value.name == name; });
  if (it == std::end(users_)) {
    return nullptr;
  }
  return &(*it);
}

std::vector<const user_t*> entity_store::users() const {
  return make_pointers(users_);
}

operation_result_t entity_store::insert_user(user_t value) {
  if (value.user_id.empty()) {
    value.user_id = generate_id(collection_t::users);
  } else if (id_taken(collection_t::users, value.user_id) ||
             value.user_id == kWalkInUserId) {
    return make_failure(kStoreCodespace, error_code_t::duplicate_id,
                        "user id already exists", value.user_id);
  }
  if (value.name.empty()) {
    return make_failure(kStoreCodespace, error_code_t::invalid_argument,
                        "user name must not be empty", value.user_id);
  }
  auto id = value.user_id;
  user_index_.emplace(id, users_.size());
  users_.push_back(std::move(value));
  publish(change_event{{collection_t::users}, {id}});
  return make_success(kStoreCodespace, id);
}

operation_result_t entity_store::update_user(user_t value) {
  auto it = user_index_.find(value.user_id);
  if (it == std::end(user_index_)) {
    return make_failure(kStoreCodespace, error_code_t::not_found,
                        "user not found", value.user_id);
  }
  if (value.name.empty()) {
    return make_failure(kStoreCodespace, error_code_t::invalid_argument,
                        "user name must not be empty", value.user_id);
  }
  auto id = value.user_id;
  users_[it->second] = std::move(value);
  publish(change_event{{collection_t::users}, {id}});
  return make_success(kStoreCodespace, id);
}

const reservation_t* entity_store::find_reservation(
    const std::string_view reservation_id) const {
  return find_by_id(reservations_, reservation_index_, reservation_id);
}

std::vector<const reservation_t*> entity_store::reservations() const {
  return make_pointers(reservations_);
}

namespace {

std::optional<operation_result_t> validate_reservation(
    const entity_store& store,
    const reservation_t& value) {
  if (store.find_asset(value.asset_id) == nullptr) {
    return make_failure(kStoreCodespace, error_code_t::not_found,
                        "reserved asset not found", value.asset_id);
  }
  if (store.find_user(value.user_id) == nullptr) {
    return make_failure(kStoreCodespace, error_code_t::not_found,
                        "reserving user not found", value.user_id);
  }
  auto start = common::try_parse_date(value.start_date);
  auto end = common::try_parse_date(value.end_date);
  if (!start || !end) {
    return make_failure(kStoreCodespace, error_code_t::invalid_argument,
                        "reservation dates must be YYYY-MM-DD",
                        value.reservation_id);
  }
  if (*start > *end) {
    return make_failure(kStoreCodespace, error_code_t::invalid_argument,
                        "reservation ends before it starts",
                        value.reservation_id);
  }
  return std::nullopt;
}

}  // namespace

operation_result_t entity_store::insert_reservation(reservation_t value) {
  if (value.reservation_id.empty()) {
    value.reservation_id = generate_id(collection_t::reservations);
  } else if (id_taken(collection_t::reservations, value.reservation_id)) {
    return make_failure(kStoreCodespace, error_code_t::duplicate_id,
                        "reservation id already exists", value.reservation_id);
  }
  if (auto failure = validate_reservation(*this, value)) {
    return *failure;
  }
  auto id = value.reservation_id;
  reservation_index_.emplace(id, reservations_.size());
  reservations_.push_back(std::move(value));
  publish(change_event{{collection_t::reservations}, {id}});
  return make_success(kStoreCodespace, id);
}

operation_result_t entity_store::update_reservation(reservation_t value) {
  auto it = reservation_index_.find(value.reservation_id);
  if (it == std::end(reservation_index_)) {
    return make_failure(kStoreCodespace, error_code_t::not_found,
                        "reservation not found", value.reservation_id);
  }
  if (auto failure = validate_reservation(*this, value)) {
    return *failure;
  }
  auto id = value.reservation_id;
  reservations_[it->second] = std::move(value);
  publish(change_event{{collection_t::reservations}, {id}});
  return make_success(kStoreCodespace, id);
}

const std::vector<transaction_t>& entity_store::transactions() const {
  return transactions_;
}

std::vector<const transaction_t*> entity_store::ledger() const {
  auto entries = make_pointers(transactions_);
  std::sort(std::begin(entries), std::end(entries), canonical_order);
  return entries;
}

std::vector<const transaction_t*> entity_store::history(
    const std::string_view asset_id) const {
  auto entries = ledger();
  std::erase_if(entries,
                [&](const auto* entry) { return entry->asset_id != asset_id; });
  return entries;
}

std::vector<const transaction_t*> entity_store::search_ledger(
    const std::string_view text) const {
  auto entries = ledger();
  std::erase_if(entries, [&](const auto* entry) {
    return !contains_ignore_case(entry->asset_name, text) &&
           !contains_ignore_case(entry->user_name, text);
  });
  return entries;
}

operation_result_t entity_store::insert_transaction(transaction_t entry) {
  if (entry.transaction_id.empty()) {
    entry.transaction_id = generate_id(collection_t::transactions);
  } else if (id_taken(collection_t::transactions, entry.transaction_id)) {
    return make_failure(kStoreCodespace, error_code_t::duplicate_id,
                        "transaction id already exists", entry.transaction_id);
  }
  if (find_asset(entry.asset_id) == nullptr) {
    return make_failure(kStoreCodespace, error_code_t::not_found,
                        "ledger entry references unknown asset",
                        entry.asset_id);
  }
  if (entry.timestamp == 0) {
    entry.timestamp = next_timestamp();
  } else if (entry.timestamp < session_.last_timestamp) {
    return make_failure(kStoreCodespace, error_code_t::invalid_argument,
                        "ledger entry predates the last entry",
                        entry.transaction_id);
  } else {
    session_.last_timestamp = entry.timestamp;
  }
  auto id = entry.transaction_id;
  append_transaction(std::move(entry));
  publish(change_event{{collection_t::transactions}, {id}});
  return make_success(kStoreCodespace, id);
}

operation_result_t entity_store::record_transition(asset_t updated,
                                                   transaction_t entry) {
  auto it = asset_index_.find(updated.asset_id);
  if (it == std::end(asset_index_)) {
    return make_failure(kStoreCodespace, error_code_t::not_found,
                        "asset not found", updated.asset_id);
  }
  if (auto failure = normalize_asset(updated)) {
    return *failure;
  }
  entry.transaction_id = generate_id(collection_t::transactions);
  entry.asset_id = updated.asset_id;
  entry.timestamp = next_timestamp();

  auto asset_id = updated.asset_id;
  auto transaction_id = entry.transaction_id;
  assets_[it->second] = std::move(updated);
  append_transaction(std::move(entry));
  publish(change_event{{collection_t::assets, collection_t::transactions},
                       {asset_id, transaction_id}});
  return make_success(kStoreCodespace, transaction_id);
}

void entity_store::append_transaction(transaction_t entry) {
  entry.sequence = session_.next_sequence++;
  transaction_index_.emplace(entry.transaction_id, transactions_.size());
  transactions_.push_back(std::move(entry));
}

std::string entity_store::generate_id(const collection_t collection) {
  const auto prefix = std::string{id_prefix(collection)};
  auto& counter = session_.id_counters[prefix];
  while (true) {
    ++counter;
    char digits[24];
    std::snprintf(digits, sizeof(digits), "%05llu",
                  static_cast<unsigned long long>(counter));
    auto id = prefix + digits;
    if (!id_taken(collection, id)) {
      return id;
    }
  }
}

bool entity_store::id_taken(const collection_t collection,
                            const std::string_view id) const {
  auto key = std::string{id};
  switch (collection) {
    case collection_t::assets:
      return asset_index_.contains(key);
    case collection_t::users:
      return user_index_.contains(key);
    case collection_t::transactions:
      return transaction_index_.contains(key);
    case collection_t::reservations:
      return reservation_index_.contains(key);
  }
  return false;
}

timestamp_milliseconds_t entity_store::next_timestamp() {
  session_.last_timestamp = std::max(clock_(), session_.last_timestamp);
  return session_.last_timestamp;
}

subscription_id_t entity_store::subscribe(listener_t listener) {
  auto id = next_subscription_++;
  listeners_.emplace(id, std::move(listener));
  return id;
}

void entity_store::unsubscribe(const subscription_id_t id) {
  listeners_.erase(id);
}

void entity_store::publish(change_event event) {
  for (const auto& [_, listener] : listeners_) {
    listener(event);
  }
}

entity_snapshot entity_store::snapshot() const {
  return entity_snapshot{.assets = assets_,
                         .users = users_,
                         .transactions = transactions_,
                         .reservations = reservations_,
                         .session = session_};
}

operation_result_t entity_store::restore(entity_snapshot snapshot) {
  auto assets = build_index(snapshot.assets,
                            [](const auto& value) { return value.asset_id; });
  auto users = build_index(snapshot.users,
                           [](const auto& value) { return value.user_id; });
  auto transactions =
      build_index(snapshot.transactions,
                  [](const auto& value) { return value.transaction_id; });
  auto reservations =
      build_index(snapshot.reservations,
                  [](const auto& value) { return value.reservation_id; });
  if (!assets || !users || !transactions || !reservations) {
    return make_failure(kStoreCodespace, error_code_t::duplicate_id,
                        "snapshot contains duplicate ids");
  }
  for (const auto& value : snapshot.assets) {
    if (!holder_matches_status(value)) {
      return make_failure(kStoreCodespace, error_code_t::invalid_argument,
                          "snapshot asset violates the holder invariant",
                          value.asset_id);
    }
  }

  for (const auto& entry : snapshot.transactions) {
    snapshot.session.next_sequence =
        std::max(snapshot.session.next_sequence, entry.sequence + 1);
    snapshot.session.last_timestamp =
        std::max(snapshot.session.last_timestamp, entry.timestamp);
  }

  assets_ = std::move(snapshot.assets);
  asset_index_ = std::move(*assets);
  users_ = std::move(snapshot.users);
  user_index_ = std::move(*users);
  transactions_ = std::move(snapshot.transactions);
  transaction_index_ = std::move(*transactions);
  reservations_ = std::move(snapshot.reservations);
  reservation_index_ = std::move(*reservations);
  session_ = std::move(snapshot.session);

  spdlog::debug("Restored {} assets, {} users, {} transactions, {} reservations",
               assets_.size(), users_.size(), transactions_.size(),
               reservations_.size());
  publish(change_event{{collection_t::assets, collection_t::users,
                        collection_t::transactions,
                        collection_t::reservations},
                       {}});
  return make_success(kStoreCodespace, {});
}

}  // namespace quartermaster::store
