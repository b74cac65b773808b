#pragma once
#include <sentinel/schema/change_request.hpp>
#include <sentinel/schema/encoding/scale/actor.hpp>
#include <sentinel/schema/encoding/scale/context_value.hpp>

#include <scale/decoder.hpp>
#include <scale/encoder.hpp>
#include <scale/scale.hpp>

SCALE_DEFINE_ENUM_VALUE_LIST(
    sentinel::schema,
    change_type_t,
    sentinel::schema::change_type_t::workflow_deployment,
    sentinel::schema::change_type_t::workflow_modification,
    sentinel::schema::change_type_t::capability_grant,
    sentinel::schema::change_type_t::capability_revoke,
    sentinel::schema::change_type_t::control_policy_update,
    sentinel::schema::change_type_t::emergency_access,
    sentinel::schema::change_type_t::model_deployment,
    sentinel::schema::change_type_t::config_change)

SCALE_DEFINE_ENUM_VALUE_LIST(
    sentinel::schema,
    change_risk_level_t,
    sentinel::schema::change_risk_level_t::low,
    sentinel::schema::change_risk_level_t::medium,
    sentinel::schema::change_risk_level_t::high,
    sentinel::schema::change_risk_level_t::critical)

SCALE_DEFINE_ENUM_VALUE_LIST(
    sentinel::schema,
    change_status_t,
    sentinel::schema::change_status_t::draft,
    sentinel::schema::change_status_t::submitted,
    sentinel::schema::change_status_t::under_review,
    sentinel::schema::change_status_t::pending_approval,
    sentinel::schema::change_status_t::approved,
    sentinel::schema::change_status_t::scheduled,
    sentinel::schema::change_status_t::in_progress,
    sentinel::schema::change_status_t::verifying,
    sentinel::schema::change_status_t::completed,
    sentinel::schema::change_status_t::failed,
    sentinel::schema::change_status_t::rolled_back,
    sentinel::schema::change_status_t::rejected,
    sentinel::schema::change_status_t::cancelled)

namespace sentinel::schema {

void encode(const verification_criterion_t& o, ::scale::Encoder& encoder);
void decode(verification_criterion_t& o, ::scale::Decoder& decoder);

void encode(const verification_result_t& o, ::scale::Encoder& encoder);
void decode(verification_result_t& o, ::scale::Decoder& decoder);

void encode(const sign_off_t& o, ::scale::Encoder& encoder);
void decode(sign_off_t& o, ::scale::Decoder& decoder);

void encode(const change_execution_record_t& o, ::scale::Encoder& encoder);
void decode(change_execution_record_t& o, ::scale::Decoder& decoder);

void encode(const change_verification_record_t& o, ::scale::Encoder& encoder);
void decode(change_verification_record_t& o, ::scale::Decoder& decoder);

void encode(const change_rollback_record_t& o, ::scale::Encoder& encoder);
void decode(change_rollback_record_t& o, ::scale::Decoder& decoder);

void encode(const change_request<1>& o, ::scale::Encoder& encoder);
void decode(change_request<1>& o, ::scale::Decoder& decoder);

}  // namespace sentinel::schema
