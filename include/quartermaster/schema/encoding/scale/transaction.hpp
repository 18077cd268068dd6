#pragma once

#include <quartermaster/schema/transaction.hpp>
#include <scale/scale.hpp>

namespace quartermaster::schema::encoding::scale {

void encode(quartermaster::schema::transaction<1>&& o,
            ::scale::Encoder& encoder);
void decode(quartermaster::schema::transaction<1>&& o,
            ::scale::Decoder& decoder);

}  // namespace quartermaster::schema::encoding::scale
