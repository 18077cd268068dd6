#include <spdlog/spdlog.h>
#include <quartermaster/bulk/mutator.hpp>
#include <unordered_set>

using namespace quartermaster::schema;

namespace quartermaster::bulk {

bulk_result apply_patch(store::entity_store& store,
                        const std::vector<std::string>& asset_ids,
                        const asset_patch& patch) {
  auto outcome = bulk_result{};
  if (patch.status == asset_status_t::borrowed) {
    outcome.result =
        make_failure(kBulkCodespace, error_code_t::invalid_argument,
                     "bulk edit cannot assign a holder",
                     "status Borrowed is not allowed in a bulk patch");
    return outcome;
  }
  auto category = patch.category;
  if (category && category->empty()) {
    category.reset();
  }
  const auto applicable = patch.status.has_value() || category.has_value();

  auto seen = std::unordered_set<std::string>{};
  for (const auto& asset_id : asset_ids) {
    if (!seen.insert(asset_id).second) {
      continue;
    }
    const auto* current = store.find_asset(asset_id);
    if (current == nullptr) {
      outcome.missing.push_back(asset_id);
      continue;
    }
    if (!applicable) {
      continue;
    }
    auto updated = *current;
    if (patch.status) {
      updated.status = *patch.status;
      updated.current_holder.reset();
    }
    if (category) {
      updated.category = *category;
    }
    outcome.changed.push_back(std::move(updated));
  }

  if (!outcome.missing.empty()) {
    spdlog::warn("Bulk edit skipped {} unknown asset id(s)",
                 outcome.missing.size());
  }
  outcome.result = store.update_assets(outcome.changed);
  if (succeeded(outcome.result)) {
    outcome.result.codespace = std::string{kBulkCodespace};
    outcome.result.info = std::to_string(outcome.changed.size()) + " changed";
    spdlog::info("Bulk edit changed {} of {} selected asset(s)",
                 outcome.changed.size(), seen.size());
  } else {
    outcome.changed.clear();
  }
  return outcome;
}

}  // namespace quartermaster::bulk
