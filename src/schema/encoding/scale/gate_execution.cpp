#include <sentinel/schema/encoding/scale/gate_execution.hpp>
#include <sentinel/schema/encoding/scale/sequence.hpp>

namespace sentinel::schema {

void encode(const policy_evaluation_t& o, ::scale::Encoder& encoder) {
  encode(o.policy_id, encoder);
  encode(o.policy_key, encoder);
  encode(o.priority, encoder);
  encode(o.applied, encoder);
  encode(o.recommendation, encoder);
  encode(o.result, encoder);
  encode(o.reason, encoder);
}

void decode(policy_evaluation_t& o, ::scale::Decoder& decoder) {
  decode(o.policy_id, decoder);
  decode(o.policy_key, decoder);
  decode(o.priority, decoder);
  decode(o.applied, decoder);
  decode(o.recommendation, decoder);
  decode(o.result, decoder);
  decode(o.reason, decoder);
}

void encode(const kill_switch_check_t& o, ::scale::Encoder& encoder) {
  encode(o.switch_id, encoder);
  encode(o.switch_key, encoder);
  encode(o.mode, encoder);
  encode(o.scope, encoder);
  encode(o.active, encoder);
}

void decode(kill_switch_check_t& o, ::scale::Decoder& decoder) {
  decode(o.switch_id, decoder);
  decode(o.switch_key, decoder);
  decode(o.mode, decoder);
  decode(o.scope, decoder);
  decode(o.active, decoder);
}

void encode(const gate_execution<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.id, encoder);
  encode(o.gate_id, encoder);
  encode(o.gate_key, encoder);
  encode(o.request_id, encoder);
  encode(o.correlation_id, encoder);
  encode(o.actor, encoder);
  encode(o.outcome, encoder);
  encoding::scale::encode_sequence(o.policy_results, encoder);
  encoding::scale::encode_sequence(o.kill_switch_checks, encoder);
  encode(static_cast<uint32_t>(o.evidence.size()), encoder);
  for (const auto& [name, value] : o.evidence) {
    encode(name, encoder);
    encode(value, encoder);
  }
  encode(o.duration, encoder);
  encode(o.errors, encoder);
  encode(o.executed_at, encoder);
  encode(o.ledger_sequence, encoder);
}

void decode(gate_execution<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.id, decoder);
  decode(o.gate_id, decoder);
  decode(o.gate_key, decoder);
  decode(o.request_id, decoder);
  decode(o.correlation_id, decoder);
  decode(o.actor, decoder);
  decode(o.outcome, decoder);
  encoding::scale::decode_sequence(o.policy_results, decoder);
  encoding::scale::decode_sequence(o.kill_switch_checks, decoder);
  auto count = uint32_t{};
  decode(count, decoder);
  if (count > encoding::scale::kMaxSequenceItems) {
    ::scale::raise(::scale::DecodeError::TOO_MANY_ITEMS);
  }
  o.evidence.clear();
  for (auto i = uint32_t{}; i < count; ++i) {
    auto entry = evidence_entry_t{};
    decode(entry.first, decoder);
    decode(entry.second, decoder);
    o.evidence.push_back(std::move(entry));
  }
  decode(o.duration, decoder);
  decode(o.errors, decoder);
  decode(o.executed_at, decoder);
  decode(o.ledger_sequence, decoder);
}

}  // namespace sentinel::schema
