#include <quartermaster/schema/encoding/scale/user.hpp>
#include <quartermaster/schema/encoding/scale/user_role.hpp>

using namespace quartermaster::schema;

namespace quartermaster::schema::encoding::scale {

void encode(user<1>&& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.user_id, encoder);
  encode(o.name, encoder);
  encode(o.role, encoder);
  encode(o.email, encoder);
  encode(o.department, encoder);
  encode(o.password, encoder);
}

void decode(user<1>&& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.user_id, decoder);
  decode(o.name, decoder);
  decode(o.role, decoder);
  decode(o.email, decoder);
  decode(o.department, decoder);
  decode(o.password, decoder);
}

}  // namespace quartermaster::schema::encoding::scale
