#pragma once
#include <quartermaster/schema/asset.hpp>
#include <quartermaster/schema/operation_result.hpp>
#include <quartermaster/store/entity_store.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace quartermaster::bulk {

inline constexpr auto kBulkCodespace = std::string_view{"quartermaster.bulk"};

/// Field-level patch applied to every selected asset. An empty category is
/// treated as absent.
struct asset_patch final {
  std::optional<schema::asset_status_t> status;
  std::optional<std::string> category;
};

struct bulk_result final {
  schema::operation_result_t result;
  /// Existing targets the patch applied to, in selection order.
  std::vector<schema::asset_t> changed;
  /// Requested ids with no matching asset.
  std::vector<std::string> missing;
};

/// Apply `patch` to the selected assets as one store write.
///
/// Every existing target counts as changed when the patch carries a status or
/// a non-empty category, even if it already held that value. Unknown ids are
/// skipped and duplicates collapse to their first occurrence.
/// Setting Borrowed is rejected because a holder cannot be bulk-assigned.
bulk_result apply_patch(store::entity_store& store,
                        const std::vector<std::string>& asset_ids,
                        const asset_patch& patch);

}  // namespace quartermaster::bulk
