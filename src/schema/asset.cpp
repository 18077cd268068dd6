#include <quartermaster/schema/asset.hpp>

namespace quartermaster::schema {

std::string make_qr_code(const std::string_view asset_id) {
  auto qr = std::string{"qr-"};
  qr.append(asset_id);
  return qr;
}

std::string make_placeholder_image_url(const std::string_view asset_id) {
  auto url = std::string{"https://picsum.photos/400/300?random="};
  url.append(asset_id);
  return url;
}

bool holder_matches_status(const asset_t& value) {
  return value.current_holder.has_value() ==
         (value.status == asset_status_t::borrowed);
}

}  // namespace quartermaster::schema
