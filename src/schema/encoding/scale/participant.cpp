#include <accountstore/schema/encoding/scale/participant.hpp>

using namespace accountstore::schema;

namespace accountstore::schema::encoding::scale {

void encode(participant<1>&& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.doc_type, encoder);
  encode(o.email, encoder);
  encode(o.name, encoder);
  encode(o.surname, encoder);
  encode(o.phone, encoder);
  encode(o.password_digest, encoder);
}

void decode(participant<1>&& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.doc_type, decoder);
  decode(o.email, decoder);
  decode(o.name, decoder);
  decode(o.surname, decoder);
  decode(o.phone, decoder);
  decode(o.password_digest, decoder);
}

}  // namespace accountstore::schema::encoding::scale
