#pragma once
#include <quartermaster/schema/asset.hpp>
#include <map>
#include <string>
#include <vector>

namespace quartermaster::store {

struct asset_statistics final {
  size_t total{};
  size_t available{};
  size_t borrowed{};
  size_t maintenance{};
  size_t lost{};
  /// Asset count per category, keyed in sorted order.
  std::map<std::string, size_t> categories;
};

asset_statistics compute_statistics(
    const std::vector<const schema::asset_t*>& assets);

/// Count for a single status.
size_t count_of(const asset_statistics& statistics,
                schema::asset_status_t status);

}  // namespace quartermaster::store
