#pragma once
#include <sentinel/schema/encoding/scale/actor.hpp>
#include <sentinel/schema/encoding/scale/control_policy.hpp>
#include <sentinel/schema/encoding/scale/kill_switch.hpp>
#include <sentinel/schema/gate_execution.hpp>

#include <scale/decoder.hpp>
#include <scale/encoder.hpp>
#include <scale/scale.hpp>

SCALE_DEFINE_ENUM_VALUE_LIST(
    sentinel::schema,
    gate_outcome_t,
    sentinel::schema::gate_outcome_t::allow,
    sentinel::schema::gate_outcome_t::block,
    sentinel::schema::gate_outcome_t::warning,
    sentinel::schema::gate_outcome_t::hard_stop,
    sentinel::schema::gate_outcome_t::degrade)

SCALE_DEFINE_ENUM_VALUE_LIST(
    sentinel::schema,
    policy_check_result_t,
    sentinel::schema::policy_check_result_t::pass,
    sentinel::schema::policy_check_result_t::fail,
    sentinel::schema::policy_check_result_t::error)

namespace sentinel::schema {

void encode(const policy_evaluation_t& o, ::scale::Encoder& encoder);
void decode(policy_evaluation_t& o, ::scale::Decoder& decoder);

void encode(const kill_switch_check_t& o, ::scale::Encoder& encoder);
void decode(kill_switch_check_t& o, ::scale::Decoder& decoder);

void encode(const gate_execution<1>& o, ::scale::Encoder& encoder);
void decode(gate_execution<1>& o, ::scale::Decoder& decoder);

}  // namespace sentinel::schema
