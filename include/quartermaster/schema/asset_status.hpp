#pragma once

#include <quartermaster/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: asset status.
// Lifecycle state of a tracked item. Only `borrowed` carries a holder.
namespace quartermaster::schema {

enum class asset_status_t : uint8_t {
  available = 0,
  borrowed = 1,
  maintenance = 2,
  lost = 3
};

inline constexpr auto kAssetStatusMappings =
    std::array{std::pair<std::string_view, asset_status_t>{
                   "Available", asset_status_t::available},
               std::pair<std::string_view, asset_status_t>{
                   "Borrowed", asset_status_t::borrowed},
               std::pair<std::string_view, asset_status_t>{
                   "Maintenance", asset_status_t::maintenance},
               std::pair<std::string_view, asset_status_t>{
                   "Lost", asset_status_t::lost}};

template <>
inline std::optional<asset_status_t> try_from_string<asset_status_t>(
    const std::string_view value) {
  return from_string(value, kAssetStatusMappings);
}

inline constexpr std::string_view to_string(const asset_status_t value) {
  return to_string(value, kAssetStatusMappings).value_or("unknown");
}

}  // namespace quartermaster::schema
