#pragma once

#include <sentinel/schema/error_code.hpp>
#include <sentinel/schema/primitives.hpp>

#include <cstdint>
#include <string>

namespace sentinel::schema {

template <uint16_t Version>
struct append_result;

template <>
struct append_result<1> final {
  uint16_t version{1};
  uint32_t code{};
  std::string log;
  std::string codespace;
  uint64_t sequence{};
  hash32_t event_hash{};

  bool ok() const { return code == to_code(error_code::ok); }
};

using append_result_t = append_result<1>;

}  // namespace sentinel::schema
