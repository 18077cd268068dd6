#pragma once

#include <quartermaster/schema/user.hpp>
#include <scale/scale.hpp>

namespace quartermaster::schema::encoding::scale {

void encode(quartermaster::schema::user<1>&& o, ::scale::Encoder& encoder);
void decode(quartermaster::schema::user<1>&& o, ::scale::Decoder& decoder);

}  // namespace quartermaster::schema::encoding::scale
