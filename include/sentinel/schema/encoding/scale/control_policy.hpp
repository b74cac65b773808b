#pragma once
#include <sentinel/schema/control_policy.hpp>
#include <sentinel/schema/encoding/scale/actor.hpp>
#include <sentinel/schema/encoding/scale/condition.hpp>

#include <scale/decoder.hpp>
#include <scale/encoder.hpp>
#include <scale/scale.hpp>

SCALE_DEFINE_ENUM_VALUE_LIST(
    sentinel::schema,
    policy_outcome_t,
    sentinel::schema::policy_outcome_t::allow,
    sentinel::schema::policy_outcome_t::deny,
    sentinel::schema::policy_outcome_t::review)

namespace sentinel::schema {

void encode(const control_policy<1>& o, ::scale::Encoder& encoder);
void decode(control_policy<1>& o, ::scale::Decoder& decoder);

}  // namespace sentinel::schema
