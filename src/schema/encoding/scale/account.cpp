#include <accountstore/schema/encoding/scale/account.hpp>

using namespace accountstore::schema;

namespace accountstore::schema::encoding::scale {

void encode(account<1>&& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.id, encoder);
  encode(o.currency, encoder);
  encode(o.balance, encoder);
  encode(o.email, encoder);
}

void decode(account<1>&& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.id, decoder);
  decode(o.currency, decoder);
  decode(o.balance, decoder);
  decode(o.email, decoder);
}

}  // namespace accountstore::schema::encoding::scale
