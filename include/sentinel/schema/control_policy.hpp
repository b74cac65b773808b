#pragma once

#include <sentinel/schema/actor.hpp>
#include <sentinel/schema/condition.hpp>
#include <sentinel/schema/enum_string.hpp>
#include <sentinel/schema/primitives.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

// Schema type: control policy.
// Governance workflow: conditional rule producing an allow/deny/review
// recommendation at the gates that list it. Soft-deleted only.
namespace sentinel::schema {

enum class policy_outcome_t : uint8_t {
  allow = 0,
  deny = 1,
  review = 2,
};

inline constexpr auto kPolicyOutcomeMappings = std::array{
    enum_mapping_t<policy_outcome_t>{"ALLOW", policy_outcome_t::allow},
    enum_mapping_t<policy_outcome_t>{"DENY", policy_outcome_t::deny},
    enum_mapping_t<policy_outcome_t>{"REVIEW", policy_outcome_t::review},
};

template <>
inline std::optional<policy_outcome_t> try_from_string<policy_outcome_t>(
    const std::string_view value) {
  return from_string(value, kPolicyOutcomeMappings);
}

inline constexpr std::string_view to_string(const policy_outcome_t value) {
  return to_string(value, kPolicyOutcomeMappings).value_or("UNKNOWN");
}

template <uint16_t Version>
struct control_policy;

template <>
struct control_policy<1> final {
  uint16_t version{1};
  hash32_t id{};
  std::string key;
  std::string name;
  policy_outcome_t outcome{policy_outcome_t::allow};
  condition_t condition;
  std::optional<condition_t> auto_deny_condition;
  // Lower is evaluated first.
  int32_t priority{100};
  bool active{true};
  actor_t created_by;
  timestamp_milliseconds_t created_at{};
  timestamp_milliseconds_t updated_at{};
};

using control_policy_t = control_policy<1>;

}  // namespace sentinel::schema
