#pragma once
#include <quartermaster/store/entity_store.hpp>
#include <cstddef>
#include <string>

namespace quartermaster::insight {

inline constexpr size_t kRecentTransactionCount = 10;

/// JSON summary handed to the analyst:
/// `{totalAssets, statusCounts, recentTransactions: [{type, assetName, date,
/// notes}]}`. Recent transactions follow ledger order; `notes` is omitted when
/// absent and `statusCounts` only lists statuses that occur.
std::string make_snapshot_json(const store::entity_store& store,
                               size_t recent = kRecentTransactionCount);

}  // namespace quartermaster::insight
