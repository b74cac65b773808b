#pragma once

#include <sentinel/schema/primitives.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

// Schema key type: sentinel keys.
// Governance workflow: canonical key prefixes for the ledger, the control
// registry and change requests.
namespace sentinel::schema::key {

inline constexpr std::string_view kLedgerEventPrefix{"SENTINEL|LEDGER|EVENT|"};
inline constexpr std::string_view kLedgerTipKey{"SENTINEL|LEDGER|TIP"};
inline constexpr std::string_view kKillSwitchPrefix{
    "SENTINEL|REGISTRY|KILL_SWITCH|"};
inline constexpr std::string_view kControlPolicyPrefix{
    "SENTINEL|REGISTRY|POLICY|"};
inline constexpr std::string_view kEnforcementGatePrefix{
    "SENTINEL|REGISTRY|GATE|"};
inline constexpr std::string_view kBreakGlassPrefix{
    "SENTINEL|REGISTRY|BREAK_GLASS|"};
inline constexpr std::string_view kGateExecutionPrefix{
    "SENTINEL|GATE|EXECUTION|"};
inline constexpr std::string_view kChangeRequestPrefix{
    "SENTINEL|CHANGE|REQUEST|"};

inline const std::array<std::string_view, 8> kKeyspaces{
    kLedgerEventPrefix,     kLedgerTipKey,        kKillSwitchPrefix,
    kControlPolicyPrefix,   kEnforcementGatePrefix, kBreakGlassPrefix,
    kGateExecutionPrefix,   kChangeRequestPrefix,
};

bytes_t make_prefix(const std::string_view& prefix);

bytes_t make_ledger_event_key(const uint64_t sequence);
std::optional<uint64_t> parse_ledger_event_key(const bytes_view_t& key);
bytes_t make_ledger_tip_key();

bytes_t make_kill_switch_key(const hash32_t& id);
bytes_t make_control_policy_key(const hash32_t& id);
bytes_t make_enforcement_gate_key(const hash32_t& id);
bytes_t make_break_glass_key(const hash32_t& id);
bytes_t make_gate_execution_key(const hash32_t& id);
bytes_t make_change_request_key(const hash32_t& id);

}  // namespace sentinel::schema::key
