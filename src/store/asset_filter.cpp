#include <quartermaster/common/time.hpp>
#include <quartermaster/store/asset_filter.hpp>
#include <algorithm>

using namespace quartermaster::schema;

namespace quartermaster::store {

namespace {

bool within_bounds(const asset_t& value, const asset_filter& filter) {
  if (!filter.purchased_from && !filter.purchased_to) {
    return true;
  }
  auto purchased = common::try_parse_date(value.purchase_date);
  if (!purchased) {
    return false;
  }
  if (filter.purchased_from) {
    auto from = common::try_parse_date(*filter.purchased_from);
    if (from && *purchased < *from) {
      return false;
    }
  }
  if (filter.purchased_to) {
    auto to = common::try_parse_date(*filter.purchased_to);
    if (to && *purchased > *to) {
      return false;
    }
  }
  return true;
}

}  // namespace

size_t active_filter_count(const asset_filter& filter) {
  return (filter.status ? 1 : 0) + (filter.category ? 1 : 0) +
         (filter.purchased_from ? 1 : 0) + (filter.purchased_to ? 1 : 0);
}

bool matches(const asset_t& value, const asset_filter& filter) {
  auto matches_search = contains_ignore_case(value.name, filter.search) ||
                        contains_ignore_case(value.asset_id, filter.search) ||
                        contains_ignore_case(value.serial_number, filter.search);
  if (!matches_search) {
    return false;
  }
  if (filter.status && value.status != *filter.status) {
    return false;
  }
  if (filter.category && value.category != *filter.category) {
    return false;
  }
  return within_bounds(value, filter);
}

std::vector<const asset_t*> filter_assets(const entity_store& store,
                                          const asset_filter& filter) {
  auto selected = store.assets();
  std::erase_if(selected,
                [&](const auto* value) { return !matches(*value, filter); });
  return selected;
}

std::vector<const user_t*> search_users(const entity_store& store,
                                        const std::string_view text) {
  auto selected = store.users();
  std::erase_if(selected, [&](const auto* value) {
    return !contains_ignore_case(value->name, text) &&
           !contains_ignore_case(value->email, text);
  });
  return selected;
}

}  // namespace quartermaster::store
