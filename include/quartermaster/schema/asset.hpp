#pragma once
#include <quartermaster/schema/asset_status.hpp>
#include <quartermaster/schema/primitives.hpp>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace quartermaster::schema {

template <uint16_t Version>
struct asset;

// Schema type: asset.
// A tracked physical item. `current_holder` is set iff status is borrowed;
// `qr_code` is always derived from the id.
template <>
struct asset<1> final {
  uint16_t version{1};
  std::string asset_id;
  std::string name;
  std::string category;
  std::string model;
  std::string serial_number;
  std::string purchase_date;
  asset_status_t status{asset_status_t::available};
  std::optional<std::string> current_holder;
  std::string image_url;
  std::string qr_code;
  std::optional<std::string> description;
  std::map<std::string, std::string> custom_features;
};

using asset_t = asset<1>;

/// QR payload string stored on the asset, `qr-<id>`.
std::string make_qr_code(std::string_view asset_id);

/// Stock image reference for assets created without one.
std::string make_placeholder_image_url(std::string_view asset_id);

/// True when the holder is present exactly when the asset is borrowed.
bool holder_matches_status(const asset_t& value);

}  // namespace quartermaster::schema
