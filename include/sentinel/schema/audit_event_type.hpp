#pragma once

#include <sentinel/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema type: audit event type.
// Governance workflow: closed taxonomy of everything the ledger records.
namespace sentinel::schema {

enum class audit_event_type_t : uint16_t {
  gate_executed = 1,
  gate_blocked = 2,
  kill_switch_defined = 10,
  kill_switch_activated = 11,
  kill_switch_deactivated = 12,
  control_policy_registered = 20,
  control_policy_deactivated = 21,
  gate_registered = 22,
  break_glass_requested = 30,
  break_glass_activated = 31,
  break_glass_denied = 32,
  break_glass_closed = 33,
  change_request_created = 40,
  change_request_submitted = 41,
  change_request_reviewed = 42,
  change_approved = 43,
  change_rejected = 44,
  change_cancelled = 45,
  change_scheduled = 46,
  change_execution_started = 47,
  change_execution_blocked = 48,
  change_execution_completed = 49,
  change_execution_failed = 50,
  change_verified = 51,
  change_rolled_back = 52,
  change_request_updated = 53,
  change_rollback_started = 54,
};

inline constexpr auto kAuditEventTypeMappings = std::array{
    enum_mapping_t<audit_event_type_t>{"GATE_EXECUTED",
                                       audit_event_type_t::gate_executed},
    enum_mapping_t<audit_event_type_t>{"GATE_BLOCKED",
                                       audit_event_type_t::gate_blocked},
    enum_mapping_t<audit_event_type_t>{
        "KILL_SWITCH_DEFINED", audit_event_type_t::kill_switch_defined},
    enum_mapping_t<audit_event_type_t>{
        "KILL_SWITCH_ACTIVATED", audit_event_type_t::kill_switch_activated},
    enum_mapping_t<audit_event_type_t>{
        "KILL_SWITCH_DEACTIVATED",
        audit_event_type_t::kill_switch_deactivated},
    enum_mapping_t<audit_event_type_t>{
        "CONTROL_POLICY_REGISTERED",
        audit_event_type_t::control_policy_registered},
    enum_mapping_t<audit_event_type_t>{
        "CONTROL_POLICY_DEACTIVATED",
        audit_event_type_t::control_policy_deactivated},
    enum_mapping_t<audit_event_type_t>{"GATE_REGISTERED",
                                       audit_event_type_t::gate_registered},
    enum_mapping_t<audit_event_type_t>{
        "BREAK_GLASS_REQUESTED", audit_event_type_t::break_glass_requested},
    enum_mapping_t<audit_event_type_t>{
        "BREAK_GLASS_ACTIVATED", audit_event_type_t::break_glass_activated},
    enum_mapping_t<audit_event_type_t>{"BREAK_GLASS_DENIED",
                                       audit_event_type_t::break_glass_denied},
    enum_mapping_t<audit_event_type_t>{"BREAK_GLASS_CLOSED",
                                       audit_event_type_t::break_glass_closed},
    enum_mapping_t<audit_event_type_t>{
        "CHANGE_REQUEST_CREATED", audit_event_type_t::change_request_created},
    enum_mapping_t<audit_event_type_t>{
        "CHANGE_REQUEST_SUBMITTED",
        audit_event_type_t::change_request_submitted},
    enum_mapping_t<audit_event_type_t>{
        "CHANGE_REQUEST_REVIEWED",
        audit_event_type_t::change_request_reviewed},
    enum_mapping_t<audit_event_type_t>{"CHANGE_APPROVED",
                                       audit_event_type_t::change_approved},
    enum_mapping_t<audit_event_type_t>{"CHANGE_REJECTED",
                                       audit_event_type_t::change_rejected},
    enum_mapping_t<audit_event_type_t>{"CHANGE_CANCELLED",
                                       audit_event_type_t::change_cancelled},
    enum_mapping_t<audit_event_type_t>{"CHANGE_SCHEDULED",
                                       audit_event_type_t::change_scheduled},
    enum_mapping_t<audit_event_type_t>{
        "CHANGE_EXECUTION_STARTED",
        audit_event_type_t::change_execution_started},
    enum_mapping_t<audit_event_type_t>{
        "CHANGE_EXECUTION_BLOCKED",
        audit_event_type_t::change_execution_blocked},
    enum_mapping_t<audit_event_type_t>{
        "CHANGE_EXECUTION_COMPLETED",
        audit_event_type_t::change_execution_completed},
    enum_mapping_t<audit_event_type_t>{
        "CHANGE_EXECUTION_FAILED",
        audit_event_type_t::change_execution_failed},
    enum_mapping_t<audit_event_type_t>{"CHANGE_VERIFIED",
                                       audit_event_type_t::change_verified},
    enum_mapping_t<audit_event_type_t>{"CHANGE_ROLLED_BACK",
                                       audit_event_type_t::change_rolled_back},
    enum_mapping_t<audit_event_type_t>{
        "CHANGE_REQUEST_UPDATED", audit_event_type_t::change_request_updated},
    enum_mapping_t<audit_event_type_t>{
        "CHANGE_ROLLBACK_STARTED",
        audit_event_type_t::change_rollback_started},
};

template <>
inline std::optional<audit_event_type_t> try_from_string<audit_event_type_t>(
    const std::string_view value) {
  return from_string(value, kAuditEventTypeMappings);
}

inline constexpr std::string_view to_string(const audit_event_type_t value) {
  return to_string(value, kAuditEventTypeMappings).value_or("UNKNOWN");
}

}  // namespace sentinel::schema
