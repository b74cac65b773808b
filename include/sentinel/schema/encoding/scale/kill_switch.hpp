#pragma once
#include <sentinel/schema/encoding/scale/actor.hpp>
#include <sentinel/schema/kill_switch.hpp>

#include <scale/decoder.hpp>
#include <scale/encoder.hpp>
#include <scale/scale.hpp>

SCALE_DEFINE_ENUM_VALUE_LIST(
    sentinel::schema,
    kill_switch_mode_t,
    sentinel::schema::kill_switch_mode_t::hard_stop,
    sentinel::schema::kill_switch_mode_t::soft_stop,
    sentinel::schema::kill_switch_mode_t::read_only,
    sentinel::schema::kill_switch_mode_t::degrade)

SCALE_DEFINE_ENUM_VALUE_LIST(
    sentinel::schema,
    kill_switch_trigger_t,
    sentinel::schema::kill_switch_trigger_t::manual,
    sentinel::schema::kill_switch_trigger_t::incident,
    sentinel::schema::kill_switch_trigger_t::security,
    sentinel::schema::kill_switch_trigger_t::compliance,
    sentinel::schema::kill_switch_trigger_t::automated,
    sentinel::schema::kill_switch_trigger_t::data_anomaly)

namespace sentinel::schema {

void encode(const kill_switch_scope_t& o, ::scale::Encoder& encoder);
void decode(kill_switch_scope_t& o, ::scale::Decoder& decoder);

void encode(const kill_switch<1>& o, ::scale::Encoder& encoder);
void decode(kill_switch<1>& o, ::scale::Decoder& decoder);

}  // namespace sentinel::schema
