#include <sentinel/gate/condition_evaluator.hpp>
#include <sentinel/gate/outcome_resolver.hpp>

#include <spdlog/fmt/fmt.h>

#include <algorithm>

namespace sentinel::gate {

bool is_write_operation(const schema::context_map_t& context) {
  auto found = context.find(kOperationContextKey);
  if (found == context.end()) {
    return true;
  }
  const auto* value = std::get_if<std::string>(&found->second);
  return value == nullptr || *value != "read";
}

kill_switch_verdict check_kill_switches(
    const std::vector<schema::kill_switch_t>& switches,
    const bool is_write) {
  auto verdict = kill_switch_verdict{};
  const schema::kill_switch_t* most_severe = nullptr;
  for (const auto& kill_switch : switches) {
    verdict.checks.push_back(
        schema::kill_switch_check_t{.switch_id = kill_switch.id,
                                    .switch_key = kill_switch.key,
                                    .mode = kill_switch.mode,
                                    .scope = kill_switch.scope,
                                    .active = kill_switch.active});
    if (!kill_switch.active) {
      continue;
    }
    if (kill_switch.mode == schema::kill_switch_mode_t::degrade) {
      verdict.degrade = true;
    }
    if (most_severe == nullptr ||
        schema::severity_rank(kill_switch.mode) <
            schema::severity_rank(most_severe->mode)) {
      most_severe = &kill_switch;
    }
  }

  if (most_severe == nullptr) {
    return verdict;
  }
  switch (most_severe->mode) {
    case schema::kill_switch_mode_t::hard_stop:
      verdict.outcome = schema::gate_outcome_t::hard_stop;
      verdict.reason =
          fmt::format("hard-stop kill switch '{}' active", most_severe->key);
      break;
    case schema::kill_switch_mode_t::soft_stop:
    case schema::kill_switch_mode_t::read_only:
      if (is_write) {
        verdict.outcome = schema::gate_outcome_t::block;
        verdict.reason = fmt::format("{} kill switch '{}' blocks writes",
                                     schema::to_string(most_severe->mode),
                                     most_severe->key);
      }
      break;
    case schema::kill_switch_mode_t::degrade:
      break;
  }
  return verdict;
}

policy_verdict evaluate_policies(std::vector<schema::control_policy_t> policies,
                                 const schema::context_map_t& context,
                                 const bool require_all_pass) {
  std::ranges::sort(policies, [](const auto& lhs, const auto& rhs) {
    if (lhs.priority != rhs.priority) {
      return lhs.priority < rhs.priority;
    }
    return lhs.id < rhs.id;
  });

  auto verdict = policy_verdict{};
  auto any_allow = false;
  auto any_deny = false;
  auto any_review = false;

  for (const auto& policy : policies) {
    auto result = schema::policy_evaluation_t{.policy_id = policy.id,
                                              .policy_key = policy.key,
                                              .priority = policy.priority};

    if (policy.auto_deny_condition) {
      auto auto_deny =
          evaluate_condition(*policy.auto_deny_condition, context);
      if (auto_deny.match == condition_match_t::error) {
        result.result = schema::policy_check_result_t::error;
        result.reason = "auto-deny condition: " + auto_deny.reason;
        verdict.errored = true;
        verdict.errors.push_back(
            fmt::format("policy '{}': {}", policy.key, result.reason));
        verdict.results.push_back(std::move(result));
        continue;
      }
      if (auto_deny.match == condition_match_t::matched) {
        result.applied = true;
        result.recommendation = schema::policy_outcome_t::deny;
        result.result = schema::policy_check_result_t::fail;
        result.reason = "auto-deny condition matched";
        any_deny = true;
        verdict.results.push_back(std::move(result));
        continue;
      }
    }

    auto evaluation = evaluate_condition(policy.condition, context);
    switch (evaluation.match) {
      case condition_match_t::error:
        result.result = schema::policy_check_result_t::error;
        result.reason = evaluation.reason;
        verdict.errored = true;
        verdict.errors.push_back(
            fmt::format("policy '{}': {}", policy.key, evaluation.reason));
        break;
      case condition_match_t::not_matched:
        result.result = schema::policy_check_result_t::pass;
        result.reason = "condition not matched";
        break;
      case condition_match_t::matched:
        result.applied = true;
        result.recommendation = policy.outcome;
        result.reason = evaluation.reason;
        switch (policy.outcome) {
          case schema::policy_outcome_t::allow:
            result.result = schema::policy_check_result_t::pass;
            any_allow = true;
            break;
          case schema::policy_outcome_t::review:
            result.result = schema::policy_check_result_t::pass;
            any_review = true;
            break;
          case schema::policy_outcome_t::deny:
            result.result = schema::policy_check_result_t::fail;
            any_deny = true;
            break;
        }
        break;
    }
    verdict.results.push_back(std::move(result));
  }

  if (verdict.errored) {
    verdict.outcome = schema::gate_outcome_t::block;
  } else if (require_all_pass) {
    verdict.outcome = any_deny     ? schema::gate_outcome_t::block
                      : any_review ? schema::gate_outcome_t::warning
                                   : schema::gate_outcome_t::allow;
  } else if (any_allow) {
    verdict.outcome = schema::gate_outcome_t::allow;
  } else if (any_review) {
    verdict.outcome = schema::gate_outcome_t::warning;
  } else if (any_deny) {
    verdict.outcome = schema::gate_outcome_t::block;
  } else {
    verdict.outcome = schema::gate_outcome_t::allow;
  }
  return verdict;
}

schema::gate_outcome_t apply_enforcement_mode(
    const schema::gate_outcome_t outcome,
    const schema::enforcement_mode_t mode) {
  if (mode == schema::enforcement_mode_t::monitoring &&
      outcome == schema::gate_outcome_t::block) {
    return schema::gate_outcome_t::warning;
  }
  return outcome;
}

schema::gate_outcome_t apply_degrade(const schema::gate_outcome_t outcome,
                                     const bool degrade,
                                     const bool is_write) {
  if (!degrade || !is_write) {
    return outcome;
  }
  if (outcome == schema::gate_outcome_t::allow ||
      outcome == schema::gate_outcome_t::warning) {
    return schema::gate_outcome_t::degrade;
  }
  return outcome;
}

schema::gate_outcome_t conservative_outcome(
    const schema::enforcement_mode_t mode) {
  return mode == schema::enforcement_mode_t::monitoring
             ? schema::gate_outcome_t::warning
             : schema::gate_outcome_t::block;
}

}  // namespace sentinel::gate
