#include <sentinel/schema/encoding/scale/actor.hpp>

namespace sentinel::schema {

void encode(const actor_t& o, ::scale::Encoder& encoder) {
  encode(o.id, encoder);
  encode(o.type, encoder);
  encode(o.name, encoder);
}

void decode(actor_t& o, ::scale::Decoder& decoder) {
  decode(o.id, decoder);
  decode(o.type, decoder);
  decode(o.name, decoder);
}

}  // namespace sentinel::schema
