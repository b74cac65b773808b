#pragma once
#include <sentinel/schema/context_value.hpp>

#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

// The context variant carries std::monostate as an explicit null, so values
// and maps are written with a one-byte tag instead of the library's variant
// support.
namespace sentinel::schema {

void encode(const context_value_t& o, ::scale::Encoder& encoder);
void decode(context_value_t& o, ::scale::Decoder& decoder);

void encode(const context_map_t& o, ::scale::Encoder& encoder);
void decode(context_map_t& o, ::scale::Decoder& decoder);

}  // namespace sentinel::schema
