#pragma once
#include <quartermaster/schema/asset.hpp>
#include <quartermaster/schema/notification.hpp>
#include <quartermaster/schema/transaction.hpp>
#include <vector>

namespace quartermaster::notify {

inline constexpr schema::duration_milliseconds_t kDefaultOverdueAfter =
    7 * schema::kMillisecondsPerDay;

struct deriver_options final {
  /// A borrow strictly older than this is overdue.
  schema::duration_milliseconds_t overdue_after{kDefaultOverdueAfter};
};

/// Recompute the active alert set from scratch.
///
/// Lost alerts come first, then overdue alerts, each group in asset order.
std::vector<schema::notification_t> derive_notifications(
    const std::vector<const schema::asset_t*>& assets,
    const std::vector<schema::transaction_t>& transactions,
    schema::timestamp_milliseconds_t now,
    const deriver_options& options = {});

}  // namespace quartermaster::notify
