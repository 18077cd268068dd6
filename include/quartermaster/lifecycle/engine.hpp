#pragma once
#include <quartermaster/schema/asset.hpp>
#include <quartermaster/schema/operation_result.hpp>
#include <quartermaster/schema/transaction.hpp>
#include <quartermaster/store/entity_store.hpp>
#include <optional>
#include <string>
#include <string_view>

namespace quartermaster::lifecycle {

inline constexpr auto kLifecycleCodespace =
    std::string_view{"quartermaster.lifecycle"};

/// Borrow or return request. `signature` is the opaque image payload produced
/// by signature capture.
struct transition_request final {
  std::string asset_id;
  std::string user_name;
  std::string signature;
  std::optional<std::string> notes;
};

/// Borrow/return/maintenance state machine over an entity store.
///
/// States are Available, Borrowed, Maintenance and Lost. Borrow and return
/// move an asset between Available and Borrowed and append a ledger entry.
/// Maintenance logging only appends a ledger entry. Every other status change,
/// including the only path to Lost, is a direct administrative edit that
/// leaves the ledger untouched.
class engine final {
 public:
  explicit engine(store::entity_store& store);

  /// Available -> Borrowed, holder set to the borrower.
  schema::operation_result_t borrow(const transition_request& request);

  /// Borrowed -> Available, holder cleared.
  schema::operation_result_t return_asset(const transition_request& request);

  /// Append a maintenance entry; the asset status does not change.
  schema::operation_result_t log_maintenance(
      std::string_view asset_id,
      std::string_view user_name,
      std::optional<std::string> notes = std::nullopt);

  /// Administrative status edit. `holder` is required for Borrowed and
  /// ignored otherwise. No ledger entry is written.
  schema::operation_result_t set_status(
      std::string_view asset_id,
      schema::asset_status_t status,
      std::optional<std::string> holder = std::nullopt);

  /// Administrative edit of any asset attribute.
  schema::operation_result_t edit_asset(schema::asset_t value);

 private:
  schema::operation_result_t transition(const transition_request& request,
                                        schema::transaction_type_t type,
                                        schema::asset_status_t required,
                                        schema::asset_status_t target);
  schema::transaction_t make_entry(const schema::asset_t& value,
                                   std::string_view user_name,
                                   schema::transaction_type_t type) const;
  void verify_holder(std::string_view asset_id) const;

  store::entity_store& store_;
};

}  // namespace quartermaster::lifecycle
