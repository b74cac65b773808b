#pragma once

#include <sentinel/schema/actor.hpp>
#include <sentinel/schema/context_value.hpp>
#include <sentinel/schema/enum_string.hpp>
#include <sentinel/schema/primitives.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

// Schema type: change request.
// Governance workflow: governed high-risk production change moving through
// review, approval, a time-bounded execution window, verification and
// rollback.
namespace sentinel::schema {

enum class change_type_t : uint8_t {
  workflow_deployment = 0,
  workflow_modification = 1,
  capability_grant = 2,
  capability_revoke = 3,
  control_policy_update = 4,
  emergency_access = 5,
  model_deployment = 6,
  config_change = 7,
};

inline constexpr auto kChangeTypeMappings = std::array{
    enum_mapping_t<change_type_t>{"WORKFLOW_DEPLOYMENT",
                                  change_type_t::workflow_deployment},
    enum_mapping_t<change_type_t>{"WORKFLOW_MODIFICATION",
                                  change_type_t::workflow_modification},
    enum_mapping_t<change_type_t>{"CAPABILITY_GRANT",
                                  change_type_t::capability_grant},
    enum_mapping_t<change_type_t>{"CAPABILITY_REVOKE",
                                  change_type_t::capability_revoke},
    enum_mapping_t<change_type_t>{"CONTROL_POLICY_UPDATE",
                                  change_type_t::control_policy_update},
    enum_mapping_t<change_type_t>{"EMERGENCY_ACCESS",
                                  change_type_t::emergency_access},
    enum_mapping_t<change_type_t>{"MODEL_DEPLOYMENT",
                                  change_type_t::model_deployment},
    enum_mapping_t<change_type_t>{"CONFIG_CHANGE",
                                  change_type_t::config_change},
};

template <>
inline std::optional<change_type_t> try_from_string<change_type_t>(
    const std::string_view value) {
  return from_string(value, kChangeTypeMappings);
}

inline constexpr std::string_view to_string(const change_type_t value) {
  return to_string(value, kChangeTypeMappings).value_or("UNKNOWN");
}

enum class change_risk_level_t : uint8_t {
  low = 0,
  medium = 1,
  high = 2,
  critical = 3,
};

inline constexpr auto kChangeRiskLevelMappings = std::array{
    enum_mapping_t<change_risk_level_t>{"LOW", change_risk_level_t::low},
    enum_mapping_t<change_risk_level_t>{"MEDIUM", change_risk_level_t::medium},
    enum_mapping_t<change_risk_level_t>{"HIGH", change_risk_level_t::high},
    enum_mapping_t<change_risk_level_t>{"CRITICAL",
                                        change_risk_level_t::critical},
};

template <>
inline std::optional<change_risk_level_t> try_from_string<change_risk_level_t>(
    const std::string_view value) {
  return from_string(value, kChangeRiskLevelMappings);
}

inline constexpr std::string_view to_string(const change_risk_level_t value) {
  return to_string(value, kChangeRiskLevelMappings).value_or("UNKNOWN");
}

enum class change_status_t : uint8_t {
  draft = 0,
  submitted = 1,
  under_review = 2,
  pending_approval = 3,
  approved = 4,
  scheduled = 5,
  in_progress = 6,
  verifying = 7,
  completed = 8,
  failed = 9,
  rolled_back = 10,
  rejected = 11,
  cancelled = 12,
};

inline constexpr auto kChangeStatusMappings = std::array{
    enum_mapping_t<change_status_t>{"DRAFT", change_status_t::draft},
    enum_mapping_t<change_status_t>{"SUBMITTED", change_status_t::submitted},
    enum_mapping_t<change_status_t>{"UNDER_REVIEW",
                                    change_status_t::under_review},
    enum_mapping_t<change_status_t>{"PENDING_APPROVAL",
                                    change_status_t::pending_approval},
    enum_mapping_t<change_status_t>{"APPROVED", change_status_t::approved},
    enum_mapping_t<change_status_t>{"SCHEDULED", change_status_t::scheduled},
    enum_mapping_t<change_status_t>{"IN_PROGRESS",
                                    change_status_t::in_progress},
    enum_mapping_t<change_status_t>{"VERIFYING", change_status_t::verifying},
    enum_mapping_t<change_status_t>{"COMPLETED", change_status_t::completed},
    enum_mapping_t<change_status_t>{"FAILED", change_status_t::failed},
    enum_mapping_t<change_status_t>{"ROLLED_BACK",
                                    change_status_t::rolled_back},
    enum_mapping_t<change_status_t>{"REJECTED", change_status_t::rejected},
    enum_mapping_t<change_status_t>{"CANCELLED", change_status_t::cancelled},
};

template <>
inline std::optional<change_status_t> try_from_string<change_status_t>(
    const std::string_view value) {
  return from_string(value, kChangeStatusMappings);
}

inline constexpr std::string_view to_string(const change_status_t value) {
  return to_string(value, kChangeStatusMappings).value_or("UNKNOWN");
}

inline constexpr bool is_terminal(const change_status_t value) {
  return value == change_status_t::completed ||
         value == change_status_t::rolled_back ||
         value == change_status_t::rejected ||
         value == change_status_t::cancelled;
}

struct verification_criterion_t final {
  std::string key;
  std::string description;
};

struct verification_result_t final {
  std::string criterion_key;
  bool passed{};
  std::string notes;
};

struct change_execution_record_t final {
  std::optional<timestamp_milliseconds_t> started_at;
  std::optional<timestamp_milliseconds_t> completed_at;
  std::optional<bool> success;
  std::string notes;
  std::optional<hash32_t> gate_execution_id;
};

struct change_verification_record_t final {
  bool required{};
  std::vector<verification_criterion_t> criteria;
  bool completed{};
  std::optional<bool> passed;
  std::vector<verification_result_t> results;
  std::optional<timestamp_milliseconds_t> verified_at;
};

struct change_rollback_record_t final {
  bool required{true};
  // Set while the rollback procedure runs; no other transition is admitted.
  bool in_progress{};
  std::optional<timestamp_milliseconds_t> started_at;
  bool executed{};
  std::optional<timestamp_milliseconds_t> executed_at;
  std::optional<bool> successful;
};

struct sign_off_t final {
  actor_t actor;
  timestamp_milliseconds_t at{};
  std::string notes;
};

/// Caller-supplied fields for a new request.
struct change_request_draft_t final {
  std::string key;
  change_type_t type{change_type_t::config_change};
  std::optional<change_risk_level_t> risk_level;
  std::string title;
  std::string description;
  std::string rationale;
  std::string rollback_procedure;
  context_map_t change_details;
  std::string impact_notes;
  std::optional<hash32_t> workflow_id;
  std::optional<hash32_t> capability_id;
  std::optional<hash32_t> policy_id;
  std::optional<timestamp_milliseconds_t> requested_start;
  std::optional<timestamp_milliseconds_t> requested_end;
  bool verification_required{};
  std::vector<verification_criterion_t> verification_criteria;
  bool rollback_required{true};
};

template <uint16_t Version>
struct change_request;

template <>
struct change_request<1> final {
  uint16_t version{1};
  hash32_t id{};
  std::string key;
  change_type_t type{change_type_t::config_change};
  std::optional<change_risk_level_t> risk_level;
  std::string title;
  std::string description;
  std::string rationale;
  std::string rollback_procedure;
  context_map_t change_details;
  std::string impact_notes;
  std::optional<hash32_t> workflow_id;
  std::optional<hash32_t> capability_id;
  std::optional<hash32_t> policy_id;
  actor_t requested_by;
  timestamp_milliseconds_t requested_at{};
  std::optional<timestamp_milliseconds_t> submitted_at;
  std::optional<actor_t> reviewer;
  std::optional<timestamp_milliseconds_t> review_started_at;
  std::optional<sign_off_t> review;
  std::optional<sign_off_t> approval;
  bool auto_approved{};
  std::optional<sign_off_t> rejection;
  std::optional<sign_off_t> cancellation;
  std::optional<timestamp_milliseconds_t> requested_start;
  std::optional<timestamp_milliseconds_t> requested_end;
  std::optional<timestamp_milliseconds_t> scheduled_start;
  std::optional<timestamp_milliseconds_t> scheduled_end;
  change_execution_record_t execution;
  change_verification_record_t verification;
  change_rollback_record_t rollback;
  change_status_t status{change_status_t::draft};
  uint64_t revision{1};
  std::vector<uint64_t> audit_event_ids;
  timestamp_milliseconds_t created_at{};
  timestamp_milliseconds_t updated_at{};
};

using change_request_t = change_request<1>;

}  // namespace sentinel::schema
