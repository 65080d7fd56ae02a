#pragma once

#include <accountstore/schema/history_entry.hpp>
#include <scale/scale.hpp>

namespace accountstore::schema::encoding::scale {

void encode(accountstore::schema::account_snapshot&& o,
            ::scale::Encoder& encoder);
void decode(accountstore::schema::account_snapshot&& o,
            ::scale::Decoder& decoder);

void encode(accountstore::schema::account_tombstone&& o,
            ::scale::Encoder& encoder);
void decode(accountstore::schema::account_tombstone&& o,
            ::scale::Decoder& decoder);

void encode(accountstore::schema::history_entry<1>&& o,
            ::scale::Encoder& encoder);
void decode(accountstore::schema::history_entry<1>&& o,
            ::scale::Decoder& decoder);

}  // namespace accountstore::schema::encoding::scale
