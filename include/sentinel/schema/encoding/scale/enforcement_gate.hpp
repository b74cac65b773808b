#pragma once
#include <sentinel/schema/enforcement_gate.hpp>

#include <scale/decoder.hpp>
#include <scale/encoder.hpp>
#include <scale/scale.hpp>

SCALE_DEFINE_ENUM_VALUE_LIST(
    sentinel::schema,
    gate_type_t,
    sentinel::schema::gate_type_t::pre_execution,
    sentinel::schema::gate_type_t::post_execution,
    sentinel::schema::gate_type_t::capability_request,
    sentinel::schema::gate_type_t::production_change,
    sentinel::schema::gate_type_t::data_access,
    sentinel::schema::gate_type_t::model_deployment,
    sentinel::schema::gate_type_t::break_glass_entry)

SCALE_DEFINE_ENUM_VALUE_LIST(
    sentinel::schema,
    enforcement_mode_t,
    sentinel::schema::enforcement_mode_t::blocking,
    sentinel::schema::enforcement_mode_t::monitoring)

namespace sentinel::schema {

void encode(const enforcement_gate<1>& o, ::scale::Encoder& encoder);
void decode(enforcement_gate<1>& o, ::scale::Decoder& decoder);

}  // namespace sentinel::schema
