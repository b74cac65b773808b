#include <sentinel/schema/encoding/scale/condition.hpp>
#include <sentinel/schema/encoding/scale/context_value.hpp>
#include <sentinel/schema/encoding/scale/sequence.hpp>

namespace sentinel::schema {

void encode(const condition_node_t& o, ::scale::Encoder& encoder) {
  encode(o.kind, encoder);
  encode(o.key, encoder);
  encoding::scale::encode_sequence(o.values, encoder);
  encode(o.children, encoder);
}

void decode(condition_node_t& o, ::scale::Decoder& decoder) {
  decode(o.kind, decoder);
  decode(o.key, decoder);
  encoding::scale::decode_sequence(o.values, decoder);
  decode(o.children, decoder);
}

void encode(const condition_t& o, ::scale::Encoder& encoder) {
  encoding::scale::encode_sequence(o.nodes, encoder);
}

void decode(condition_t& o, ::scale::Decoder& decoder) {
  encoding::scale::decode_sequence(o.nodes, decoder);
}

}  // namespace sentinel::schema
