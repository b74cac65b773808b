#pragma once

#include <scale/decoder.hpp>
#include <scale/encoder.hpp>
#include <scale/scale.hpp>
#include <scale/scale_error.hpp>

#include <cstdint>
#include <optional>
#include <vector>

// Length-prefixed sequences and presence-tagged optionals of schema structs,
// written element by element through the schema's own encode/decode
// overloads.
namespace sentinel::schema::encoding::scale {

inline constexpr uint32_t kMaxSequenceItems = 1u << 20u;

template <typename T>
void encode_sequence(const std::vector<T>& items, ::scale::Encoder& encoder) {
  encode(static_cast<uint32_t>(items.size()), encoder);
  for (const auto& item : items) {
    encode(item, encoder);
  }
}

template <typename T>
void decode_sequence(std::vector<T>& items, ::scale::Decoder& decoder) {
  auto count = uint32_t{};
  decode(count, decoder);
  if (count > kMaxSequenceItems) {
    ::scale::raise(::scale::DecodeError::TOO_MANY_ITEMS);
  }
  items.clear();
  items.reserve(count);
  for (auto i = uint32_t{}; i < count; ++i) {
    auto item = T{};
    decode(item, decoder);
    items.push_back(std::move(item));
  }
}

template <typename T>
void encode_optional(const std::optional<T>& value, ::scale::Encoder& encoder) {
  encode(value.has_value(), encoder);
  if (value) {
    encode(*value, encoder);
  }
}

template <typename T>
void decode_optional(std::optional<T>& value, ::scale::Decoder& decoder) {
  auto present = bool{};
  decode(present, decoder);
  if (!present) {
    value.reset();
    return;
  }
  auto item = T{};
  decode(item, decoder);
  value = std::move(item);
}

}  // namespace sentinel::schema::encoding::scale
