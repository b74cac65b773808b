#include <sentinel/schema/encoding/scale/audit_event.hpp>
#include <sentinel/schema/encoding/scale/sequence.hpp>

namespace sentinel::schema {

void encode(const resource_ref_t& o, ::scale::Encoder& encoder) {
  encode(o.type, encoder);
  encode(o.id, encoder);
  encode(o.name, encoder);
}

void decode(resource_ref_t& o, ::scale::Decoder& decoder) {
  decode(o.type, decoder);
  decode(o.id, decoder);
  decode(o.name, decoder);
}

void encode(const audit_event<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.sequence, encoder);
  encode(o.type, encoder);
  encode(o.action, encoder);
  encode(o.actor, encoder);
  encoding::scale::encode_optional(o.resource, encoder);
  encode(o.outcome, encoder);
  encode(o.context, encoder);
  encode(o.previous_hash, encoder);
  encode(o.event_hash, encoder);
  encode(o.created_at, encoder);
}

void decode(audit_event<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.sequence, decoder);
  decode(o.type, decoder);
  decode(o.action, decoder);
  decode(o.actor, decoder);
  encoding::scale::decode_optional(o.resource, decoder);
  decode(o.outcome, decoder);
  decode(o.context, decoder);
  decode(o.previous_hash, decoder);
  decode(o.event_hash, decoder);
  decode(o.created_at, decoder);
}

void encode(const chain_tip_t& o, ::scale::Encoder& encoder) {
  encode(o.sequence, encoder);
  encode(o.hash, encoder);
}

void decode(chain_tip_t& o, ::scale::Decoder& decoder) {
  decode(o.sequence, decoder);
  decode(o.hash, decoder);
}

}  // namespace sentinel::schema
