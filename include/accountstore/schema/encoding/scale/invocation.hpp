#pragma once

#include <accountstore/schema/invocation.hpp>
#include <scale/scale.hpp>

namespace accountstore::schema::encoding::scale {

void encode(accountstore::schema::invocation<1>&& o, ::scale::Encoder& encoder);
void decode(accountstore::schema::invocation<1>&& o, ::scale::Decoder& decoder);

}  // namespace accountstore::schema::encoding::scale
