#include <sentinel/schema/encoding/scale/control_policy.hpp>
#include <sentinel/schema/encoding/scale/sequence.hpp>

namespace sentinel::schema {

void encode(const control_policy<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.id, encoder);
  encode(o.key, encoder);
  encode(o.name, encoder);
  encode(o.outcome, encoder);
  encode(o.condition, encoder);
  encoding::scale::encode_optional(o.auto_deny_condition, encoder);
  encode(o.priority, encoder);
  encode(o.active, encoder);
  encode(o.created_by, encoder);
  encode(o.created_at, encoder);
  encode(o.updated_at, encoder);
}

void decode(control_policy<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.id, decoder);
  decode(o.key, decoder);
  decode(o.name, decoder);
  decode(o.outcome, decoder);
  decode(o.condition, decoder);
  encoding::scale::decode_optional(o.auto_deny_condition, decoder);
  decode(o.priority, decoder);
  decode(o.active, decoder);
  decode(o.created_by, decoder);
  decode(o.created_at, decoder);
  decode(o.updated_at, decoder);
}

}  // namespace sentinel::schema
