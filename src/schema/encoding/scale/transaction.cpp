#include <quartermaster/schema/encoding/scale/transaction.hpp>
#include <quartermaster/schema/encoding/scale/transaction_type.hpp>

using namespace quartermaster::schema;

namespace quartermaster::schema::encoding::scale {

void encode(transaction<1>&& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.transaction_id, encoder);
  encode(o.sequence, encoder);
  encode(o.asset_id, encoder);
  encode(o.asset_name, encoder);
  encode(o.user_id, encoder);
  encode(o.user_name, encoder);
  encode(o.type, encoder);
  encode(o.timestamp, encoder);
  encode(o.signature, encoder);
  encode(o.notes, encoder);
}

void decode(transaction<1>&& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.transaction_id, decoder);
  decode(o.sequence, decoder);
  decode(o.asset_id, decoder);
  decode(o.asset_name, decoder);
  decode(o.user_id, decoder);
  decode(o.user_name, decoder);
  decode(o.type, decoder);
  decode(o.timestamp, decoder);
  decode(o.signature, decoder);
  decode(o.notes, decoder);
}

}  // namespace quartermaster::schema::encoding::scale
