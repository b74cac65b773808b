#pragma once

#include <sentinel/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

namespace sentinel::schema {

enum class audit_outcome_t : uint8_t {
  success = 0,
  failure = 1,
  blocked = 2,
  warning = 3,
  error = 4,
};

inline constexpr auto kAuditOutcomeMappings = std::array{
    enum_mapping_t<audit_outcome_t>{"SUCCESS", audit_outcome_t::success},
    enum_mapping_t<audit_outcome_t>{"FAILURE", audit_outcome_t::failure},
    enum_mapping_t<audit_outcome_t>{"BLOCKED", audit_outcome_t::blocked},
    enum_mapping_t<audit_outcome_t>{"WARNING", audit_outcome_t::warning},
    enum_mapping_t<audit_outcome_t>{"ERROR", audit_outcome_t::error},
};

template <>
inline std::optional<audit_outcome_t> try_from_string<audit_outcome_t>(
    const std::string_view value) {
  return from_string(value, kAuditOutcomeMappings);
}

inline constexpr std::string_view to_string(const audit_outcome_t value) {
  return to_string(value, kAuditOutcomeMappings).value_or("UNKNOWN");
}

}  // namespace sentinel::schema
