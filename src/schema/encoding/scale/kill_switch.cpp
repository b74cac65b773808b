#include <sentinel/schema/encoding/scale/kill_switch.hpp>
#include <sentinel/schema/encoding/scale/sequence.hpp>

namespace sentinel::schema {

void encode(const kill_switch_scope_t& o, ::scale::Encoder& encoder) {
  std::visit(overloaded{[&](const global_scope_t&) {
                          encode(uint8_t{0}, encoder);
                        },
                        [&](const workflow_scope_t& arg) {
                          encode(uint8_t{1}, encoder);
                          encode(arg.workflow_id, encoder);
                        },
                        [&](const capability_scope_t& arg) {
                          encode(uint8_t{2}, encoder);
                          encode(arg.capability_id, encoder);
                        }},
             o);
}

void decode(kill_switch_scope_t& o, ::scale::Decoder& decoder) {
  auto tag = uint8_t{};
  decode(tag, decoder);
  switch (tag) {
    case 0:
      o = global_scope_t{};
      return;
    case 1: {
      auto scope = workflow_scope_t{};
      decode(scope.workflow_id, decoder);
      o = scope;
      return;
    }
    case 2: {
      auto scope = capability_scope_t{};
      decode(scope.capability_id, decoder);
      o = scope;
      return;
    }
    default:
      ::scale::raise(::scale::DecodeError::WRONG_TYPE_INDEX);
  }
}

void encode(const kill_switch<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.id, encoder);
  encode(o.key, encoder);
  encode(o.name, encoder);
  encode(o.scope, encoder);
  encode(o.mode, encoder);
  encode(o.trigger, encoder);
  encode(o.active, encoder);
  encode(o.activated_at, encoder);
  encoding::scale::encode_optional(o.activated_by, encoder);
  encode(o.deactivated_at, encoder);
  encoding::scale::encode_optional(o.deactivated_by, encoder);
  encode(o.auto_deactivate_at, encoder);
  encode(o.reason, encoder);
  encode(o.resolution_notes, encoder);
  encode(o.incident_id, encoder);
  encode(o.created_at, encoder);
}

void decode(kill_switch<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.id, decoder);
  decode(o.key, decoder);
  decode(o.name, decoder);
  decode(o.scope, decoder);
  decode(o.mode, decoder);
  decode(o.trigger, decoder);
  decode(o.active, decoder);
  decode(o.activated_at, decoder);
  encoding::scale::decode_optional(o.activated_by, decoder);
  decode(o.deactivated_at, decoder);
  encoding::scale::decode_optional(o.deactivated_by, decoder);
  decode(o.auto_deactivate_at, decoder);
  decode(o.reason, decoder);
  decode(o.resolution_notes, decoder);
  decode(o.incident_id, decoder);
  decode(o.created_at, decoder);
}

}  // namespace sentinel::schema
