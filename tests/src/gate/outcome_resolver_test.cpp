#include <gtest/gtest.h>
#include <sentinel/gate/outcome_resolver.hpp>

#include <string>
#include <vector>

namespace {

using sentinel::schema::gate_outcome_t;
using sentinel::schema::make_context_value;

sentinel::schema::kill_switch_t make_switch(
    const std::string& key,
    const sentinel::schema::kill_switch_mode_t mode,
    const bool active = true) {
  auto kill_switch = sentinel::schema::kill_switch_t{};
  kill_switch.id = sentinel::schema::make_id(key);
  kill_switch.key = key;
  kill_switch.mode = mode;
  kill_switch.active = active;
  return kill_switch;
}

sentinel::schema::control_policy_t make_policy(
    const std::string& key,
    const int32_t priority,
    const sentinel::schema::policy_outcome_t outcome,
    sentinel::schema::condition_t condition) {
  auto policy = sentinel::schema::control_policy_t{};
  policy.id = sentinel::schema::make_id(key);
  policy.key = key;
  policy.priority = priority;
  policy.outcome = outcome;
  policy.condition = std::move(condition);
  return policy;
}

sentinel::schema::context_map_t prod_after_hours() {
  auto context = sentinel::schema::context_map_t{};
  context.emplace("env", make_context_value("prod"));
  context.emplace("after_hours", make_context_value(true));
  return context;
}

}  // namespace

TEST(outcome_resolver, only_explicit_read_is_a_read) {
  auto context = sentinel::schema::context_map_t{};
  EXPECT_TRUE(sentinel::gate::is_write_operation(context));
  context.emplace("operation", make_context_value("read"));
  EXPECT_FALSE(sentinel::gate::is_write_operation(context));
  context.insert_or_assign("operation", make_context_value("READ"));
  EXPECT_TRUE(sentinel::gate::is_write_operation(context));
}

TEST(outcome_resolver, hard_stop_outranks_every_other_switch) {
  using sentinel::schema::kill_switch_mode_t;
  auto verdict = sentinel::gate::check_kill_switches(
      {make_switch("degrade", kill_switch_mode_t::degrade),
       make_switch("soft", kill_switch_mode_t::soft_stop),
       make_switch("stop", kill_switch_mode_t::hard_stop)},
      false);
  ASSERT_TRUE(verdict.outcome.has_value());
  EXPECT_EQ(*verdict.outcome, gate_outcome_t::hard_stop);
  EXPECT_EQ(verdict.checks.size(), 3u);
  EXPECT_NE(verdict.reason.find("stop"), std::string::npos);
}

TEST(outcome_resolver, soft_stop_and_read_only_block_writes_only) {
  using sentinel::schema::kill_switch_mode_t;
  for (auto mode :
       {kill_switch_mode_t::soft_stop, kill_switch_mode_t::read_only}) {
    auto switches = std::vector{make_switch("s", mode)};
    auto write = sentinel::gate::check_kill_switches(switches, true);
    ASSERT_TRUE(write.outcome.has_value());
    EXPECT_EQ(*write.outcome, gate_outcome_t::block);

    auto read = sentinel::gate::check_kill_switches(switches, false);
    EXPECT_FALSE(read.outcome.has_value());
  }
}

TEST(outcome_resolver, inactive_switches_are_recorded_but_ignored) {
  auto verdict = sentinel::gate::check_kill_switches(
      {make_switch("off", sentinel::schema::kill_switch_mode_t::hard_stop,
                   false)},
      true);
  EXPECT_FALSE(verdict.outcome.has_value());
  ASSERT_EQ(verdict.checks.size(), 1u);
  EXPECT_FALSE(verdict.checks[0].active);
}

TEST(outcome_resolver, earlier_deny_wins_over_later_allow) {
  using sentinel::schema::policy_outcome_t;
  auto verdict = sentinel::gate::evaluate_policies(
      {make_policy("allow_20", 20, policy_outcome_t::allow,
                   sentinel::schema::make_always()),
       make_policy("deny_10", 10, policy_outcome_t::deny,
                   sentinel::schema::make_always())},
      {}, true);
  EXPECT_EQ(verdict.outcome, gate_outcome_t::block);
  ASSERT_EQ(verdict.results.size(), 2u);
  EXPECT_EQ(verdict.results[0].policy_key, "deny_10");
  EXPECT_EQ(verdict.results[1].policy_key, "allow_20");
}

TEST(outcome_resolver, after_hours_deny_blocks_prod_change) {
  using sentinel::schema::policy_outcome_t;
  auto verdict = sentinel::gate::evaluate_policies(
      {make_policy("prod_allow", 10, policy_outcome_t::allow,
                   sentinel::schema::make_equals("env",
                                                 make_context_value("prod"))),
       make_policy("after_hours_deny", 20, policy_outcome_t::deny,
                   sentinel::schema::make_equals("after_hours",
                                                 make_context_value(true)))},
      prod_after_hours(), true);
  EXPECT_EQ(verdict.outcome, gate_outcome_t::block);
  ASSERT_EQ(verdict.results.size(), 2u);
  EXPECT_EQ(verdict.results[0].result,
            sentinel::schema::policy_check_result_t::pass);
  EXPECT_EQ(verdict.results[1].result,
            sentinel::schema::policy_check_result_t::fail);
}

TEST(outcome_resolver, any_pass_picks_most_permissive_applied_outcome) {
  using sentinel::schema::policy_outcome_t;
  auto policies = std::vector{
      make_policy("deny", 10, policy_outcome_t::deny,
                  sentinel::schema::make_always()),
      make_policy("review", 20, policy_outcome_t::review,
                  sentinel::schema::make_always())};
  EXPECT_EQ(sentinel::gate::evaluate_policies(policies, {}, false).outcome,
            gate_outcome_t::warning);

  policies.push_back(make_policy("allow", 30, policy_outcome_t::allow,
                                 sentinel::schema::make_always()));
  EXPECT_EQ(sentinel::gate::evaluate_policies(policies, {}, false).outcome,
            gate_outcome_t::allow);
  EXPECT_EQ(sentinel::gate::evaluate_policies({}, {}, false).outcome,
            gate_outcome_t::allow);
}

TEST(outcome_resolver, auto_deny_precedes_main_condition) {
  auto policy = make_policy("guarded_allow", 10,
                            sentinel::schema::policy_outcome_t::allow,
                            sentinel::schema::make_always());
  policy.auto_deny_condition = sentinel::schema::make_equals(
      "after_hours", make_context_value(true));
  auto verdict =
      sentinel::gate::evaluate_policies({policy}, prod_after_hours(), true);
  EXPECT_EQ(verdict.outcome, gate_outcome_t::block);
  ASSERT_EQ(verdict.results.size(), 1u);
  EXPECT_EQ(verdict.results[0].recommendation,
            std::optional{sentinel::schema::policy_outcome_t::deny});
}

TEST(outcome_resolver, malformed_condition_blocks_in_both_modes) {
  auto broken = make_policy(
      "broken", 10, sentinel::schema::policy_outcome_t::allow,
      sentinel::schema::condition_t{
          .nodes = {{.kind = sentinel::schema::condition_kind_t::equals}}});
  for (auto require_all_pass : {true, false}) {
    auto verdict = sentinel::gate::evaluate_policies({broken}, {},
                                                     require_all_pass);
    EXPECT_EQ(verdict.outcome, gate_outcome_t::block);
    EXPECT_TRUE(verdict.errored);
    EXPECT_EQ(verdict.errors.size(), 1u);
    EXPECT_EQ(verdict.results[0].result,
              sentinel::schema::policy_check_result_t::error);
  }
}

TEST(outcome_resolver, monitoring_softens_block_only) {
  using sentinel::schema::enforcement_mode_t;
  EXPECT_EQ(sentinel::gate::apply_enforcement_mode(
                gate_outcome_t::block, enforcement_mode_t::monitoring),
            gate_outcome_t::warning);
  EXPECT_EQ(sentinel::gate::apply_enforcement_mode(
                gate_outcome_t::block, enforcement_mode_t::blocking),
            gate_outcome_t::block);
  EXPECT_EQ(sentinel::gate::apply_enforcement_mode(
                gate_outcome_t::allow, enforcement_mode_t::monitoring),
            gate_outcome_t::allow);
  EXPECT_EQ(sentinel::gate::conservative_outcome(enforcement_mode_t::blocking),
            gate_outcome_t::block);
  EXPECT_EQ(
      sentinel::gate::conservative_outcome(enforcement_mode_t::monitoring),
      gate_outcome_t::warning);
}

TEST(outcome_resolver, degrade_overrides_permissive_writes) {
  EXPECT_EQ(sentinel::gate::apply_degrade(gate_outcome_t::allow, true, true),
            gate_outcome_t::degrade);
  EXPECT_EQ(sentinel::gate::apply_degrade(gate_outcome_t::warning, true, true),
            gate_outcome_t::degrade);
  EXPECT_EQ(sentinel::gate::apply_degrade(gate_outcome_t::block, true, true),
            gate_outcome_t::block);
  EXPECT_EQ(sentinel::gate::apply_degrade(gate_outcome_t::allow, true, false),
            gate_outcome_t::allow);
}
