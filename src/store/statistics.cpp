#include <quartermaster/store/statistics.hpp>

using namespace quartermaster::schema;

namespace quartermaster::store {

asset_statistics compute_statistics(const std::vector<const asset_t*>& assets) {
  auto statistics = asset_statistics{};
  statistics.total = assets.size();
  for (const auto* value : assets) {
    switch (value->status) {
      case asset_status_t::available:
        ++statistics.available;
        break;
      case asset_status_t::borrowed:
        ++statistics.borrowed;
        break;
      case asset_status_t::maintenance:
        ++statistics.maintenance;
        break;
      case asset_status_t::lost:
        ++statistics.lost;
        break;
    }
    ++statistics.categories[value->category];
  }
  return statistics;
}

size_t count_of(const asset_statistics& statistics,
                const asset_status_t status) {
  switch (status) {
    case asset_status_t::available:
      return statistics.available;
    case asset_status_t::borrowed:
      return statistics.borrowed;
    case asset_status_t::maintenance:
      return statistics.maintenance;
    case asset_status_t::lost:
      return statistics.lost;
  }
  return 0;
}

}  // namespace quartermaster::store
