#pragma once
#include <sentinel/schema/condition.hpp>

#include <scale/decoder.hpp>
#include <scale/encoder.hpp>
#include <scale/scale.hpp>

SCALE_DEFINE_ENUM_VALUE_LIST(
    sentinel::schema,
    condition_kind_t,
    sentinel::schema::condition_kind_t::always,
    sentinel::schema::condition_kind_t::equals,
    sentinel::schema::condition_kind_t::in_set,
    sentinel::schema::condition_kind_t::all_of,
    sentinel::schema::condition_kind_t::any_of,
    sentinel::schema::condition_kind_t::none_of)

namespace sentinel::schema {

void encode(const condition_node_t& o, ::scale::Encoder& encoder);
void decode(condition_node_t& o, ::scale::Decoder& decoder);

void encode(const condition_t& o, ::scale::Encoder& encoder);
void decode(condition_t& o, ::scale::Decoder& decoder);

}  // namespace sentinel::schema
