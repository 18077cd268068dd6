#pragma once

#include <quartermaster/schema/reservation.hpp>
#include <scale/scale.hpp>

namespace quartermaster::schema::encoding::scale {

void encode(quartermaster::schema::reservation<1>&& o,
            ::scale::Encoder& encoder);
void decode(quartermaster::schema::reservation<1>&& o,
            ::scale::Decoder& decoder);

}  // namespace quartermaster::schema::encoding::scale
