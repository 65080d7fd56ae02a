#include <accountstore/schema/encoding/scale/invocation.hpp>

using namespace accountstore::schema;

namespace accountstore::schema::encoding::scale {

void encode(invocation<1>&& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.function, encoder);
  encode(o.args, encoder);
  encode(o.tx_id, encoder);
}

void decode(invocation<1>&& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.function, decoder);
  decode(o.args, decoder);
  decode(o.tx_id, decoder);
}

}  // namespace accountstore::schema::encoding::scale
