#include <sentinel/schema/encoding/scale/change_request.hpp>
#include <sentinel/schema/encoding/scale/sequence.hpp>

namespace sentinel::schema {

void encode(const verification_criterion_t& o, ::scale::Encoder& encoder) {
  encode(o.key, encoder);
  encode(o.description, encoder);
}

void decode(verification_criterion_t& o, ::scale::Decoder& decoder) {
  decode(o.key, decoder);
  decode(o.description, decoder);
}

void encode(const verification_result_t& o, ::scale::Encoder& encoder) {
  encode(o.criterion_key, encoder);
  encode(o.passed, encoder);
  encode(o.notes, encoder);
}

void decode(verification_result_t& o, ::scale::Decoder& decoder) {
  decode(o.criterion_key, decoder);
  decode(o.passed, decoder);
  decode(o.notes, decoder);
}

void encode(const sign_off_t& o, ::scale::Encoder& encoder) {
  encode(o.actor, encoder);
  encode(o.at, encoder);
  encode(o.notes, encoder);
}

void decode(sign_off_t& o, ::scale::Decoder& decoder) {
  decode(o.actor, decoder);
  decode(o.at, decoder);
  decode(o.notes, decoder);
}

void encode(const change_execution_record_t& o, ::scale::Encoder& encoder) {
  encode(o.started_at, encoder);
  encode(o.completed_at, encoder);
  encode(o.success, encoder);
  encode(o.notes, encoder);
  encode(o.gate_execution_id, encoder);
}

void decode(change_execution_record_t& o, ::scale::Decoder& decoder) {
  decode(o.started_at, decoder);
  decode(o.completed_at, decoder);
  decode(o.success, decoder);
  decode(o.notes, decoder);
  decode(o.gate_execution_id, decoder);
}

void encode(const change_verification_record_t& o, ::scale::Encoder& encoder) {
  encode(o.required, encoder);
  encoding::scale::encode_sequence(o.criteria, encoder);
  encode(o.completed, encoder);
  encode(o.passed, encoder);
  encoding::scale::encode_sequence(o.results, encoder);
  encode(o.verified_at, encoder);
}

void decode(change_verification_record_t& o, ::scale::Decoder& decoder) {
  decode(o.required, decoder);
  encoding::scale::decode_sequence(o.criteria, decoder);
  decode(o.completed, decoder);
  decode(o.passed, decoder);
  encoding::scale::decode_sequence(o.results, decoder);
  decode(o.verified_at, decoder);
}

void encode(const change_rollback_record_t& o, ::scale::Encoder& encoder) {
  encode(o.required, encoder);
  encode(o.in_progress, encoder);
  encode(o.started_at, encoder);
  encode(o.executed, encoder);
  encode(o.executed_at, encoder);
  encode(o.successful, encoder);
}

void decode(change_rollback_record_t& o, ::scale::Decoder& decoder) {
  decode(o.required, decoder);
  decode(o.in_progress, decoder);
  decode(o.started_at, decoder);
  decode(o.executed, decoder);
  decode(o.executed_at, decoder);
  decode(o.successful, decoder);
}

void encode(const change_request<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.id, encoder);
  encode(o.key, encoder);
  encode(o.type, encoder);
  encode(o.risk_level, encoder);
  encode(o.title, encoder);
  encode(o.description, encoder);
  encode(o.rationale, encoder);
  encode(o.rollback_procedure, encoder);
  encode(o.change_details, encoder);
  encode(o.impact_notes, encoder);
  encode(o.workflow_id, encoder);
  encode(o.capability_id, encoder);
  encode(o.policy_id, encoder);
  encode(o.requested_by, encoder);
  encode(o.requested_at, encoder);
  encode(o.submitted_at, encoder);
  encoding::scale::encode_optional(o.reviewer, encoder);
  encode(o.review_started_at, encoder);
  encoding::scale::encode_optional(o.review, encoder);
  encoding::scale::encode_optional(o.approval, encoder);
  encode(o.auto_approved, encoder);
  encoding::scale::encode_optional(o.rejection, encoder);
  encoding::scale::encode_optional(o.cancellation, encoder);
  encode(o.requested_start, encoder);
  encode(o.requested_end, encoder);
  encode(o.scheduled_start, encoder);
  encode(o.scheduled_end, encoder);
  encode(o.execution, encoder);
  encode(o.verification, encoder);
  encode(o.rollback, encoder);
  encode(o.status, encoder);
  encode(o.revision, encoder);
  encode(o.audit_event_ids, encoder);
  encode(o.created_at, encoder);
  encode(o.updated_at, encoder);
}

void decode(change_request<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.id, decoder);
  decode(o.key, decoder);
  decode(o.type, decoder);
  decode(o.risk_level, decoder);
  decode(o.title, decoder);
  decode(o.description, decoder);
  decode(o.rationale, decoder);
  decode(o.rollback_procedure, decoder);
  decode(o.change_details, decoder);
  decode(o.impact_notes, decoder);
  decode(o.workflow_id, decoder);
  decode(o.capability_id, decoder);
  decode(o.policy_id, decoder);
  decode(o.requested_by, decoder);
  decode(o.requested_at, decoder);
  decode(o.submitted_at, decoder);
  encoding::scale::decode_optional(o.reviewer, decoder);
  decode(o.review_started_at, decoder);
  encoding::scale::decode_optional(o.review, decoder);
  encoding::scale::decode_optional(o.approval, decoder);
  decode(o.auto_approved, decoder);
  encoding::scale::decode_optional(o.rejection, decoder);
  encoding::scale::decode_optional(o.cancellation, decoder);
  decode(o.requested_start, decoder);
  decode(o.requested_end, decoder);
  decode(o.scheduled_start, decoder);
  decode(o.scheduled_end, decoder);
  decode(o.execution, decoder);
  decode(o.verification, decoder);
  decode(o.rollback, decoder);
  decode(o.status, decoder);
  decode(o.revision, decoder);
  decode(o.audit_event_ids, decoder);
  decode(o.created_at, decoder);
  decode(o.updated_at, decoder);
}

}  // namespace sentinel::schema
