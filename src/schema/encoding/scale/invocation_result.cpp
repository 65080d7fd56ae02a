#include <accountstore/schema/encoding/scale/invocation_result.hpp>

using namespace accountstore::schema;

namespace accountstore::schema::encoding::scale {

void encode(invocation_result<1>&& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.code, encoder);
  encode(o.log, encoder);
  encode(o.info, encoder);
  encode(o.payload, encoder);
  encode(o.tx_id, encoder);
  encode(o.codespace, encoder);
}

void decode(invocation_result<1>&& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.code, decoder);
  decode(o.log, decoder);
  decode(o.info, decoder);
  decode(o.payload, decoder);
  decode(o.tx_id, decoder);
  decode(o.codespace, decoder);
}

}  // namespace accountstore::schema::encoding::scale
