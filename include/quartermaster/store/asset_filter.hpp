#pragma once
#include <quartermaster/schema/asset.hpp>
#include <quartermaster/schema/user.hpp>
#include <quartermaster/store/entity_store.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace quartermaster::store {

/// Selection used to build the filtered asset view that export and QR batch
/// export operate on. Unset fields match everything.
struct asset_filter final {
  /// Case-insensitive substring over name, id and serial number.
  std::string search;
  std::optional<schema::asset_status_t> status;
  /// Exact category match.
  std::optional<std::string> category;
  /// Inclusive purchase date bounds, `YYYY-MM-DD`.
  std::optional<std::string> purchased_from;
  std::optional<std::string> purchased_to;
};

/// Number of advanced filters in use; the free-text search is not counted.
size_t active_filter_count(const asset_filter& filter);

bool matches(const schema::asset_t& value, const asset_filter& filter);

/// Matching assets in store insertion order.
std::vector<const schema::asset_t*> filter_assets(const entity_store& store,
                                                  const asset_filter& filter);

/// Users whose name or email contains `text`, ignoring case.
std::vector<const schema::user_t*> search_users(const entity_store& store,
                                                std::string_view text);

}  // namespace quartermaster::store
