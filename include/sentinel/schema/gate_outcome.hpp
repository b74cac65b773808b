#pragma once

#include <sentinel/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

namespace sentinel::schema {

enum class gate_outcome_t : uint8_t {
  allow = 0,
  block = 1,
  warning = 2,
  hard_stop = 3,
  degrade = 4,
};

inline constexpr auto kGateOutcomeMappings = std::array{
    enum_mapping_t<gate_outcome_t>{"ALLOW", gate_outcome_t::allow},
    enum_mapping_t<gate_outcome_t>{"BLOCK", gate_outcome_t::block},
    enum_mapping_t<gate_outcome_t>{"WARNING", gate_outcome_t::warning},
    enum_mapping_t<gate_outcome_t>{"HARD_STOP", gate_outcome_t::hard_stop},
    enum_mapping_t<gate_outcome_t>{"DEGRADE", gate_outcome_t::degrade},
};

template <>
inline std::optional<gate_outcome_t> try_from_string<gate_outcome_t>(
    const std::string_view value) {
  return from_string(value, kGateOutcomeMappings);
}

inline constexpr std::string_view to_string(const gate_outcome_t value) {
  return to_string(value, kGateOutcomeMappings).value_or("UNKNOWN");
}

inline constexpr bool is_blocking(const gate_outcome_t value) {
  return value == gate_outcome_t::block || value == gate_outcome_t::hard_stop;
}

}  // namespace sentinel::schema
