#include <nlohmann/json.hpp>
#include <quartermaster/common/time.hpp>
#include <quartermaster/insight/snapshot.hpp>
#include <algorithm>

using namespace quartermaster::schema;

namespace quartermaster::insight {

std::string make_snapshot_json(const store::entity_store& store,
                               const size_t recent) {
  const auto assets = store.assets();

  auto status_counts = nlohmann::json::object();
  for (const auto* value : assets) {
    auto key = std::string{to_string(value->status)};
    status_counts[key] = status_counts.value(key, 0) + 1;
  }

  auto transactions = nlohmann::json::array();
  const auto ledger = store.ledger();
  const auto count = std::min(recent, ledger.size());
  for (size_t i = 0; i < count; ++i) {
    const auto* entry = ledger[i];
    auto item = nlohmann::json{{"type", std::string{to_string(entry->type)}},
                               {"assetName", entry->asset_name},
                               {"date", common::format_date(entry->timestamp)}};
    if (entry->notes) {
      item["notes"] = *entry->notes;
    }
    transactions.push_back(std::move(item));
  }

  auto snapshot = nlohmann::json{{"totalAssets", assets.size()},
                                 {"statusCounts", std::move(status_counts)},
                                 {"recentTransactions", std::move(transactions)}};
  return snapshot.dump();
}

}  // namespace quartermaster::insight
