#include <sentinel/schema/encoding/scale/enforcement_gate.hpp>

namespace sentinel::schema {

void encode(const enforcement_gate<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.id, encoder);
  encode(o.key, encoder);
  encode(o.name, encoder);
  encode(o.type, encoder);
  encode(o.workflow_id, encoder);
  encode(o.capability_id, encoder);
  encode(o.policy_ids, encoder);
  encode(o.mode, encoder);
  encode(o.require_all_pass, encoder);
  encode(o.check_kill_switches, encoder);
  encode(o.capture_inputs, encoder);
  encode(o.capture_outputs, encoder);
  encode(o.capture_context, encoder);
  encode(o.tolerate_warning, encoder);
  encode(o.active, encoder);
  encode(o.created_at, encoder);
}

void decode(enforcement_gate<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.id, decoder);
  decode(o.key, decoder);
  decode(o.name, decoder);
  decode(o.type, decoder);
  decode(o.workflow_id, decoder);
  decode(o.capability_id, decoder);
  decode(o.policy_ids, decoder);
  decode(o.mode, decoder);
  decode(o.require_all_pass, decoder);
  decode(o.check_kill_switches, decoder);
  decode(o.capture_inputs, decoder);
  decode(o.capture_outputs, decoder);
  decode(o.capture_context, decoder);
  decode(o.tolerate_warning, decoder);
  decode(o.active, decoder);
  decode(o.created_at, decoder);
}

}  // namespace sentinel::schema
