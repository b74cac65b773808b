#include <sentinel/schema/encoding/scale/context_value.hpp>
#include <sentinel/schema/encoding/scale/sequence.hpp>

namespace sentinel::schema {

namespace {

enum class context_tag : uint8_t {
  null = 0,
  boolean = 1,
  integer = 2,
  string = 3,
};

}  // namespace

void encode(const context_value_t& o, ::scale::Encoder& encoder) {
  std::visit(overloaded{[&](const std::monostate&) {
                          encode(static_cast<uint8_t>(context_tag::null),
                                 encoder);
                        },
                        [&](const bool v) {
                          encode(static_cast<uint8_t>(context_tag::boolean),
                                 encoder);
                          encode(v, encoder);
                        },
                        [&](const int64_t v) {
                          encode(static_cast<uint8_t>(context_tag::integer),
                                 encoder);
                          encode(v, encoder);
                        },
                        [&](const std::string& v) {
                          encode(static_cast<uint8_t>(context_tag::string),
                                 encoder);
                          encode(v, encoder);
                        }},
             o);
}

void decode(context_value_t& o, ::scale::Decoder& decoder) {
  auto tag = uint8_t{};
  decode(tag, decoder);
  switch (static_cast<context_tag>(tag)) {
    case context_tag::null:
      o = std::monostate{};
      return;
    case context_tag::boolean: {
      auto v = bool{};
      decode(v, decoder);
      o = v;
      return;
    }
    case context_tag::integer: {
      auto v = int64_t{};
      decode(v, decoder);
      o = v;
      return;
    }
    case context_tag::string: {
      auto v = std::string{};
      decode(v, decoder);
      o = std::move(v);
      return;
    }
  }
  ::scale::raise(::scale::DecodeError::WRONG_TYPE_INDEX);
}

void encode(const context_map_t& o, ::scale::Encoder& encoder) {
  encode(static_cast<uint32_t>(o.size()), encoder);
  for (const auto& [key, value] : o) {
    encode(key, encoder);
    encode(value, encoder);
  }
}

void decode(context_map_t& o, ::scale::Decoder& decoder) {
  auto count = uint32_t{};
  decode(count, decoder);
  if (count > encoding::scale::kMaxSequenceItems) {
    ::scale::raise(::scale::DecodeError::TOO_MANY_ITEMS);
  }
  o.clear();
  for (auto i = uint32_t{}; i < count; ++i) {
    auto key = std::string{};
    auto value = context_value_t{};
    decode(key, decoder);
    decode(value, decoder);
    o.insert_or_assign(std::move(key), std::move(value));
  }
}

}  // namespace sentinel::schema
