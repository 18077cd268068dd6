#include <quartermaster/schema/encoding/scale/asset.hpp>
#include <quartermaster/schema/encoding/scale/asset_status.hpp>

using namespace quartermaster::schema;

namespace quartermaster::schema::encoding::scale {

void encode(asset<1>&& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.asset_id, encoder);
  encode(o.name, encoder);
  encode(o.category, encoder);
  encode(o.model, encoder);
  encode(o.serial_number, encoder);
  encode(o.purchase_date, encoder);
  encode(o.status, encoder);
  encode(o.current_holder, encoder);
  encode(o.image_url, encoder);
  encode(o.qr_code, encoder);
  encode(o.description, encoder);
  encode(o.custom_features, encoder);
}

void decode(asset<1>&& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.asset_id, decoder);
  decode(o.name, decoder);
  decode(o.category, decoder);
  decode(o.model, decoder);
  decode(o.serial_number, decoder);
  decode(o.purchase_date, decoder);
  decode(o.status, decoder);
  decode(o.current_holder, decoder);
  decode(o.image_url, decoder);
  decode(o.qr_code, decoder);
  decode(o.description, decoder);
  decode(o.custom_features, decoder);
}

}  // namespace quartermaster::schema::encoding::scale
