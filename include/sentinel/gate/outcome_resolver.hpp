#pragma once

#include <sentinel/schema/context_value.hpp>
#include <sentinel/schema/control_policy.hpp>
#include <sentinel/schema/enforcement_gate.hpp>
#include <sentinel/schema/gate_execution.hpp>
#include <sentinel/schema/gate_outcome.hpp>
#include <sentinel/schema/kill_switch.hpp>

#include <optional>
#include <string>
#include <vector>

// Pure decision functions of the gate evaluator. Nothing here performs I/O.
namespace sentinel::gate {

inline constexpr std::string_view kOperationContextKey{"operation"};

/// Only an explicit `operation = "read"` is a read.
bool is_write_operation(const schema::context_map_t& context);

struct kill_switch_verdict final {
  // HARD_STOP or BLOCK when a switch ends evaluation.
  std::optional<schema::gate_outcome_t> outcome;
  bool degrade{};
  std::vector<schema::kill_switch_check_t> checks;
  std::string reason;
};

kill_switch_verdict check_kill_switches(
    const std::vector<schema::kill_switch_t>& switches,
    const bool is_write);

struct policy_verdict final {
  schema::gate_outcome_t outcome{schema::gate_outcome_t::allow};
  bool errored{};
  std::vector<schema::policy_evaluation_t> results;
  std::vector<std::string> errors;
};

/// Orders by ascending priority (ties by id), evaluates every policy and
/// aggregates. Auto-deny conditions are checked before the main condition.
policy_verdict evaluate_policies(std::vector<schema::control_policy_t> policies,
                                 const schema::context_map_t& context,
                                 const bool require_all_pass);

/// Monitoring gates report policy blocks as warnings.
schema::gate_outcome_t apply_enforcement_mode(
    const schema::gate_outcome_t outcome,
    const schema::enforcement_mode_t mode);

/// A degrade switch turns ALLOW and WARNING into DEGRADE for writes.
schema::gate_outcome_t apply_degrade(const schema::gate_outcome_t outcome,
                                     const bool degrade,
                                     const bool is_write);

/// Outcome when the controls could not be fetched in time or at all.
schema::gate_outcome_t conservative_outcome(
    const schema::enforcement_mode_t mode);

}  // namespace sentinel::gate
