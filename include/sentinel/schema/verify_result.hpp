#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace sentinel::schema {

template <uint16_t Version>
struct verify_result;

template <>
struct verify_result<1> final {
  uint16_t version{1};
  bool ok{true};
  // First sequence whose link, hash or numbering does not hold.
  std::optional<uint64_t> first_mismatch;
  uint64_t checked{};
  std::string log;
};

using verify_result_t = verify_result<1>;

}  // namespace sentinel::schema
