#pragma once

#include <sentinel/schema/error_code.hpp>
#include <sentinel/schema/primitives.hpp>

#include <cstdint>
#include <optional>
#include <string>

namespace sentinel::schema {

template <uint16_t Version>
struct registry_result;

template <>
struct registry_result<1> final {
  uint16_t version{1};
  uint32_t code{};
  std::string log;
  std::string codespace;
  hash32_t id{};
  std::optional<uint64_t> ledger_sequence;

  bool ok() const { return code == to_code(error_code::ok); }
};

using registry_result_t = registry_result<1>;

}  // namespace sentinel::schema
