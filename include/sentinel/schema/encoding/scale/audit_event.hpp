#pragma once
#include <sentinel/schema/audit_event.hpp>
#include <sentinel/schema/encoding/scale/actor.hpp>
#include <sentinel/schema/encoding/scale/context_value.hpp>

#include <scale/decoder.hpp>
#include <scale/encoder.hpp>
#include <scale/scale.hpp>

SCALE_DEFINE_ENUM_VALUE_LIST(
    sentinel::schema,
    audit_event_type_t,
    sentinel::schema::audit_event_type_t::gate_executed,
    sentinel::schema::audit_event_type_t::gate_blocked,
    sentinel::schema::audit_event_type_t::kill_switch_defined,
    sentinel::schema::audit_event_type_t::kill_switch_activated,
    sentinel::schema::audit_event_type_t::kill_switch_deactivated,
    sentinel::schema::audit_event_type_t::control_policy_registered,
    sentinel::schema::audit_event_type_t::control_policy_deactivated,
    sentinel::schema::audit_event_type_t::gate_registered,
    sentinel::schema::audit_event_type_t::break_glass_requested,
    sentinel::schema::audit_event_type_t::break_glass_activated,
    sentinel::schema::audit_event_type_t::break_glass_denied,
    sentinel::schema::audit_event_type_t::break_glass_closed,
    sentinel::schema::audit_event_type_t::change_request_created,
    sentinel::schema::audit_event_type_t::change_request_submitted,
    sentinel::schema::audit_event_type_t::change_request_reviewed,
    sentinel::schema::audit_event_type_t::change_approved,
    sentinel::schema::audit_event_type_t::change_rejected,
    sentinel::schema::audit_event_type_t::change_cancelled,
    sentinel::schema::audit_event_type_t::change_scheduled,
    sentinel::schema::audit_event_type_t::change_execution_started,
    sentinel::schema::audit_event_type_t::change_execution_blocked,
    sentinel::schema::audit_event_type_t::change_execution_completed,
    sentinel::schema::audit_event_type_t::change_execution_failed,
    sentinel::schema::audit_event_type_t::change_verified,
    sentinel::schema::audit_event_type_t::change_rolled_back,
    sentinel::schema::audit_event_type_t::change_request_updated,
    sentinel::schema::audit_event_type_t::change_rollback_started)

SCALE_DEFINE_ENUM_VALUE_LIST(
    sentinel::schema,
    audit_outcome_t,
    sentinel::schema::audit_outcome_t::success,
    sentinel::schema::audit_outcome_t::failure,
    sentinel::schema::audit_outcome_t::blocked,
    sentinel::schema::audit_outcome_t::warning,
    sentinel::schema::audit_outcome_t::error)

namespace sentinel::schema {

void encode(const resource_ref_t& o, ::scale::Encoder& encoder);
void decode(resource_ref_t& o, ::scale::Decoder& decoder);

void encode(const audit_event<1>& o, ::scale::Encoder& encoder);
void decode(audit_event<1>& o, ::scale::Decoder& decoder);

void encode(const chain_tip_t& o, ::scale::Encoder& encoder);
void decode(chain_tip_t& o, ::scale::Decoder& decoder);

}  // namespace sentinel::schema
