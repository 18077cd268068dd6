#include <quartermaster/notify/deriver.hpp>
#include <unordered_map>

using namespace quartermaster::schema;

namespace quartermaster::notify {

namespace {

std::string format_days(const duration_milliseconds_t duration) {
  auto days = duration / kMillisecondsPerDay;
  if (duration % kMillisecondsPerDay == 0) {
    return std::to_string(days);
  }
  return std::to_string(days) + "+";
}

notification_t make_lost_alert(const asset_t& value,
                               const timestamp_milliseconds_t now) {
  auto alert = notification_t{};
  alert.key = "lost-" + value.asset_id;
  alert.title = "Asset Lost Alert";
  alert.message = value.name + " (" + value.asset_id + ") is marked as Lost.";
  alert.severity = notification_severity_t::critical;
  alert.asset_id = value.asset_id;
  alert.generated_at = now;
  return alert;
}

notification_t make_overdue_alert(const asset_t& value,
                                  const transaction_t& borrow,
                                  const timestamp_milliseconds_t now,
                                  const deriver_options& options) {
  auto alert = notification_t{};
  alert.key = "overdue-" + value.asset_id;
  alert.title = "Overdue Alert";
  alert.message = value.name + " held by " + borrow.user_name + " for >" +
                  format_days(options.overdue_after) + " days.";
  alert.severity = notification_severity_t::warning;
  alert.asset_id = value.asset_id;
  alert.generated_at = now;
  return alert;
}

bool is_newer(const transaction_t& candidate, const transaction_t& current) {
  if (candidate.timestamp != current.timestamp) {
    return candidate.timestamp > current.timestamp;
  }
  return candidate.sequence > current.sequence;
}

}  // namespace

std::vector<notification_t> derive_notifications(
    const std::vector<const asset_t*>& assets,
    const std::vector<transaction_t>& transactions,
    const timestamp_milliseconds_t now,
    const deriver_options& options) {
  auto notifications = std::vector<notification_t>{};

  for (const auto* value : assets) {
    if (value->status == asset_status_t::lost) {
      notifications.push_back(make_lost_alert(*value, now));
    }
  }

  auto latest_borrow = std::unordered_map<std::string, const transaction_t*>{};
  for (const auto& entry : transactions) {
    if (entry.type != transaction_type_t::borrow) {
      continue;
    }
    auto [it, inserted] = latest_borrow.emplace(entry.asset_id, &entry);
    if (!inserted && is_newer(entry, *it->second)) {
      it->second = &entry;
    }
  }

  for (const auto* value : assets) {
    if (value->status != asset_status_t::borrowed) {
      continue;
    }
    auto it = latest_borrow.find(value->asset_id);
    if (it == std::end(latest_borrow)) {
      continue;
    }
    const auto& borrow = *it->second;
    if (now > borrow.timestamp &&
        now - borrow.timestamp > options.overdue_after) {
      notifications.push_back(make_overdue_alert(*value, borrow, now, options));
    }
  }

  return notifications;
}

}  // namespace quartermaster::notify
