#pragma once
#include <sentinel/schema/break_glass.hpp>
#include <sentinel/schema/encoding/scale/actor.hpp>

#include <scale/decoder.hpp>
#include <scale/encoder.hpp>
#include <scale/scale.hpp>

SCALE_DEFINE_ENUM_VALUE_LIST(
    sentinel::schema,
    break_glass_reason_t,
    sentinel::schema::break_glass_reason_t::p0_incident,
    sentinel::schema::break_glass_reason_t::data_loss,
    sentinel::schema::break_glass_reason_t::security_response,
    sentinel::schema::break_glass_reason_t::regulatory,
    sentinel::schema::break_glass_reason_t::customer_impact,
    sentinel::schema::break_glass_reason_t::system_failure)

SCALE_DEFINE_ENUM_VALUE_LIST(
    sentinel::schema,
    break_glass_status_t,
    sentinel::schema::break_glass_status_t::pending,
    sentinel::schema::break_glass_status_t::approved,
    sentinel::schema::break_glass_status_t::denied,
    sentinel::schema::break_glass_status_t::expired,
    sentinel::schema::break_glass_status_t::revoked)

namespace sentinel::schema {

void encode(const break_glass<1>& o, ::scale::Encoder& encoder);
void decode(break_glass<1>& o, ::scale::Decoder& decoder);

}  // namespace sentinel::schema
