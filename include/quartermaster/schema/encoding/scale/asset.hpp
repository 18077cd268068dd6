#pragma once

#include <quartermaster/schema/asset.hpp>
#include <scale/scale.hpp>

namespace quartermaster::schema::encoding::scale {

void encode(quartermaster::schema::asset<1>&& o, ::scale::Encoder& encoder);
void decode(quartermaster::schema::asset<1>&& o, ::scale::Decoder& decoder);

}  // namespace quartermaster::schema::encoding::scale
