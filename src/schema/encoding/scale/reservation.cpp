#include <quartermaster/schema/encoding/scale/reservation.hpp>
#include <quartermaster/schema/encoding/scale/reservation_status.hpp>

using namespace quartermaster::schema;

namespace quartermaster::schema::encoding::scale {

void encode(reservation<1>&& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.reservation_id, encoder);
  encode(o.asset_id, encoder);
  encode(o.user_id, encoder);
  encode(o.start_date, encoder);
  encode(o.end_date, encoder);
  encode(o.status, encoder);
}

void decode(reservation<1>&& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.reservation_id, decoder);
  decode(o.asset_id, decoder);
  decode(o.user_id, decoder);
  decode(o.start_date, decoder);
  decode(o.end_date, decoder);
  decode(o.status, decoder);
}

}  // namespace quartermaster::schema::encoding::scale
