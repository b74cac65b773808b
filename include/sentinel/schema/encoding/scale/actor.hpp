#pragma once
#include <sentinel/schema/actor.hpp>

#include <scale/decoder.hpp>
#include <scale/encoder.hpp>
#include <scale/scale.hpp>

SCALE_DEFINE_ENUM_VALUE_LIST(sentinel::schema,
                             actor_type_t,
                             sentinel::schema::actor_type_t::user,
                             sentinel::schema::actor_type_t::agent,
                             sentinel::schema::actor_type_t::system,
                             sentinel::schema::actor_type_t::service,
                             sentinel::schema::actor_type_t::api_key)

namespace sentinel::schema {

void encode(const actor_t& o, ::scale::Encoder& encoder);
void decode(actor_t& o, ::scale::Decoder& decoder);

}  // namespace sentinel::schema
