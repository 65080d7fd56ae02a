#pragma once

#include <accountstore/schema/invocation_result.hpp>
#include <scale/scale.hpp>

namespace accountstore::schema::encoding::scale {

void encode(accountstore::schema::invocation_result<1>&& o,
            ::scale::Encoder& encoder);
void decode(accountstore::schema::invocation_result<1>&& o,
            ::scale::Decoder& decoder);

}  // namespace accountstore::schema::encoding::scale
