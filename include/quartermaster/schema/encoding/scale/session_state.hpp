#pragma once

#include <quartermaster/schema/session_state.hpp>
#include <scale/scale.hpp>

namespace quartermaster::schema::encoding::scale {

void encode(quartermaster::schema::session_state<1>&& o,
            ::scale::Encoder& encoder);
void decode(quartermaster::schema::session_state<1>&& o,
            ::scale::Decoder& decoder);

}  // namespace quartermaster::schema::encoding::scale
