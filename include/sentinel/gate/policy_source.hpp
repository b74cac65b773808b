#pragma once

#include <sentinel/schema/break_glass.hpp>
#include <sentinel/schema/control_policy.hpp>
#include <sentinel/schema/enforcement_gate.hpp>
#include <sentinel/schema/kill_switch.hpp>

#include <functional>
#include <optional>
#include <string_view>
#include <vector>

namespace sentinel::gate {

/// Scope of a kill-switch lookup: global switches always match, scoped ones
/// match the gate's workflow or capability.
struct kill_switch_query final {
  std::optional<schema::hash32_t> workflow_id;
  std::optional<schema::hash32_t> capability_id;
};

/// Read snapshot of the active controls. Any member may throw
/// std::exception to signal a transient fetch failure.
struct policy_source final {
  std::function<std::vector<schema::kill_switch_t>(const kill_switch_query&)>
      active_kill_switches;
  std::function<std::vector<schema::control_policy_t>(const schema::hash32_t&)>
      active_policies;
  std::function<std::optional<schema::enforcement_gate_t>(std::string_view)>
      find_gate;
  std::function<std::optional<schema::break_glass_t>(const schema::hash32_t&)>
      find_break_glass;
};

/// True when `kill_switch` applies to a request scoped by `query`.
bool in_scope(const schema::kill_switch_t& kill_switch,
              const kill_switch_query& query);

}  // namespace sentinel::gate
