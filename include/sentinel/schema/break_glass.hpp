#pragma once

#include <sentinel/schema/actor.hpp>
#include <sentinel/schema/enum_string.hpp>
#include <sentinel/schema/primitives.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

// Schema type: break glass.
// Governance workflow: emergency, time-bounded, approved bypass of control
// policies for one requester. Never bypasses kill switches.
namespace sentinel::schema {

enum class break_glass_reason_t : uint8_t {
  p0_incident = 0,
  data_loss = 1,
  security_response = 2,
  regulatory = 3,
  customer_impact = 4,
  system_failure = 5,
};

inline constexpr auto kBreakGlassReasonMappings = std::array{
    enum_mapping_t<break_glass_reason_t>{"P0_INCIDENT",
                                         break_glass_reason_t::p0_incident},
    enum_mapping_t<break_glass_reason_t>{"DATA_LOSS",
                                         break_glass_reason_t::data_loss},
    enum_mapping_t<break_glass_reason_t>{
        "SECURITY_RESPONSE", break_glass_reason_t::security_response},
    enum_mapping_t<break_glass_reason_t>{"REGULATORY",
                                         break_glass_reason_t::regulatory},
    enum_mapping_t<break_glass_reason_t>{
        "CUSTOMER_IMPACT", break_glass_reason_t::customer_impact},
    enum_mapping_t<break_glass_reason_t>{"SYSTEM_FAILURE",
                                         break_glass_reason_t::system_failure},
};

template <>
inline std::optional<break_glass_reason_t>
try_from_string<break_glass_reason_t>(const std::string_view value) {
  return from_string(value, kBreakGlassReasonMappings);
}

inline constexpr std::string_view to_string(const break_glass_reason_t value) {
  return to_string(value, kBreakGlassReasonMappings).value_or("UNKNOWN");
}

enum class break_glass_status_t : uint8_t {
  pending = 0,
  approved = 1,
  denied = 2,
  expired = 3,
  revoked = 4,
};

inline constexpr auto kBreakGlassStatusMappings = std::array{
    enum_mapping_t<break_glass_status_t>{"PENDING",
                                         break_glass_status_t::pending},
    enum_mapping_t<break_glass_status_t>{"APPROVED",
                                         break_glass_status_t::approved},
    enum_mapping_t<break_glass_status_t>{"DENIED",
                                         break_glass_status_t::denied},
    enum_mapping_t<break_glass_status_t>{"EXPIRED",
                                         break_glass_status_t::expired},
    enum_mapping_t<break_glass_status_t>{"REVOKED",
                                         break_glass_status_t::revoked},
};

inline constexpr std::string_view to_string(const break_glass_status_t value) {
  return to_string(value, kBreakGlassStatusMappings).value_or("UNKNOWN");
}

template <uint16_t Version>
struct break_glass;

template <>
struct break_glass<1> final {
  uint16_t version{1};
  hash32_t id{};
  std::string key;
  // Unset means every workflow.
  std::optional<hash32_t> workflow_id;
  break_glass_reason_t reason{break_glass_reason_t::p0_incident};
  std::string justification;
  break_glass_status_t status{break_glass_status_t::pending};
  actor_t requested_by;
  timestamp_milliseconds_t requested_at{};
  std::optional<actor_t> decided_by;
  std::optional<timestamp_milliseconds_t> decided_at;
  std::string decision_notes;
  std::optional<actor_t> revoked_by;
  std::optional<timestamp_milliseconds_t> revoked_at;
  std::optional<timestamp_milliseconds_t> valid_from;
  std::optional<timestamp_milliseconds_t> valid_until;
  uint32_t duration_minutes{60};
  bool post_incident_reviewed{};
  std::string post_incident_notes;
  std::optional<std::string> incident_id;
};

using break_glass_t = break_glass<1>;

/// Approved, inside its window, and scoped to every workflow or this one.
inline bool is_usable(const break_glass_t& grant,
                      const actor_t& actor,
                      const std::optional<hash32_t>& workflow_id,
                      const timestamp_milliseconds_t now) {
  if (grant.status != break_glass_status_t::approved) {
    return false;
  }
  if (!grant.valid_from || !grant.valid_until || now < *grant.valid_from ||
      now > *grant.valid_until) {
    return false;
  }
  if (grant.requested_by.id != actor.id) {
    return false;
  }
  if (grant.workflow_id && grant.workflow_id != workflow_id) {
    return false;
  }
  return true;
}

}  // namespace sentinel::schema
