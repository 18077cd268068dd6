#include <quartermaster/schema/encoding/scale/session_state.hpp>

using namespace quartermaster::schema;

namespace quartermaster::schema::encoding::scale {

void encode(session_state<1>&& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.id_counters, encoder);
  encode(o.next_sequence, encoder);
  encode(o.last_timestamp, encoder);
}

void decode(session_state<1>&& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.id_counters, decoder);
  decode(o.next_sequence, decoder);
  decode(o.last_timestamp, decoder);
}

}  // namespace quartermaster::schema::encoding::scale
