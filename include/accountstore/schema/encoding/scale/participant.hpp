#pragma once

#include <accountstore/schema/participant.hpp>
#include <scale/scale.hpp>

namespace accountstore::schema::encoding::scale {

void encode(accountstore::schema::participant<1>&& o,
            ::scale::Encoder& encoder);
void decode(accountstore::schema::participant<1>&& o,
            ::scale::Decoder& decoder);

}  // namespace accountstore::schema::encoding::scale
