#include <sentinel/schema/encoding/scale/break_glass.hpp>
#include <sentinel/schema/encoding/scale/sequence.hpp>

namespace sentinel::schema {

void encode(const break_glass<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.id, encoder);
  encode(o.key, encoder);
  encode(o.workflow_id, encoder);
  encode(o.reason, encoder);
  encode(o.justification, encoder);
  encode(o.status, encoder);
  encode(o.requested_by, encoder);
  encode(o.requested_at, encoder);
  encoding::scale::encode_optional(o.decided_by, encoder);
  encode(o.decided_at, encoder);
  encode(o.decision_notes, encoder);
  encoding::scale::encode_optional(o.revoked_by, encoder);
  encode(o.revoked_at, encoder);
  encode(o.valid_from, encoder);
  encode(o.valid_until, encoder);
  encode(o.duration_minutes, encoder);
  encode(o.post_incident_reviewed, encoder);
  encode(o.post_incident_notes, encoder);
  encode(o.incident_id, encoder);
}

void decode(break_glass<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.id, decoder);
  decode(o.key, decoder);
  decode(o.workflow_id, decoder);
  decode(o.reason, decoder);
  decode(o.justification, decoder);
  decode(o.status, decoder);
  decode(o.requested_by, decoder);
  decode(o.requested_at, decoder);
  encoding::scale::decode_optional(o.decided_by, decoder);
  decode(o.decided_at, decoder);
  decode(o.decision_notes, decoder);
  encoding::scale::decode_optional(o.revoked_by, decoder);
  decode(o.revoked_at, decoder);
  decode(o.valid_from, decoder);
  decode(o.valid_until, decoder);
  decode(o.duration_minutes, decoder);
  decode(o.post_incident_reviewed, decoder);
  decode(o.post_incident_notes, decoder);
  decode(o.incident_id, decoder);
}

}  // namespace sentinel::schema
