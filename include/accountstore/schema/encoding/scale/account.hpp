#pragma once

#include <accountstore/schema/account.hpp>
#include <scale/scale.hpp>

namespace accountstore::schema::encoding::scale {

void encode(accountstore::schema::account<1>&& o, ::scale::Encoder& encoder);
void decode(accountstore::schema::account<1>&& o, ::scale::Decoder& decoder);

}  // namespace accountstore::schema::encoding::scale
