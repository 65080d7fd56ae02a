#include <accountstore/schema/encoding/scale/account.hpp>
#include <accountstore/schema/encoding/scale/history_entry.hpp>

using namespace accountstore::schema;

namespace accountstore::schema::encoding::scale {

void encode(account_snapshot&& o, ::scale::Encoder& encoder) {
  encode(o.account, encoder);
}

void decode(account_snapshot&& o, ::scale::Decoder& decoder) {
  decode(o.account, decoder);
}

void encode(account_tombstone&& o, ::scale::Encoder& encoder) {
  encode(o.id, encoder);
}

void decode(account_tombstone&& o, ::scale::Decoder& decoder) {
  decode(o.id, decoder);
}

void encode(history_entry<1>&& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.record, encoder);
  encode(o.tx_id, encoder);
  encode(o.timestamp, encoder);
}

void decode(history_entry<1>&& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.record, decoder);
  decode(o.tx_id, decoder);
  decode(o.timestamp, decoder);
}

}  // namespace accountstore::schema::encoding::scale
