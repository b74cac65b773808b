#include <gtest/gtest.h>
#include <sentinel/testing/fixture.hpp>

#include <string>
#include <utility>
#include <vector>

namespace {

using sentinel::registry::kill_switch_activation;
using sentinel::schema::audit_event_type_t;
using sentinel::schema::error_code;
using sentinel::schema::to_code;

const auto kAdmin = sentinel::testing::make_actor("admin");
const auto kAlice = sentinel::testing::make_actor("alice");
const auto kBob = sentinel::testing::make_actor("bob");

sentinel::registry::kill_switch_definition make_definition(
    const std::string& key,
    const sentinel::schema::kill_switch_mode_t mode =
        sentinel::schema::kill_switch_mode_t::hard_stop) {
  return sentinel::registry::kill_switch_definition{.key = key, .mode = mode};
}

sentinel::registry::break_glass_request make_grant_request(
    const std::string& key,
    const uint32_t duration_minutes = 30) {
  return sentinel::registry::break_glass_request{
      .key = key,
      .justification = "database outage",
      .duration_minutes = duration_minutes};
}

audit_event_type_t last_event_type(
    sentinel::testing::governance_fixture& fixture) {
  auto event = fixture.ledger().read(fixture.ledger().size());
  EXPECT_TRUE(event.has_value());
  return event ? event->type : audit_event_type_t{};
}

}  // namespace

TEST(control_registry, kill_switch_lifecycle_is_recorded) {
  auto fixture =
      sentinel::testing::governance_fixture{"sentinel_registry_switch"};
  auto& registry = fixture.registry();

  auto defined =
      registry.define_kill_switch(kAdmin, make_definition("halt_all"));
  ASSERT_TRUE(defined.ok()) << defined.log;
  EXPECT_EQ(defined.id, sentinel::schema::make_id("halt_all"));
  EXPECT_EQ(last_event_type(fixture), audit_event_type_t::kill_switch_defined);

  auto kill_switch = registry.find_kill_switch("halt_all");
  ASSERT_TRUE(kill_switch.has_value());
  EXPECT_FALSE(kill_switch->active);
  EXPECT_EQ(kill_switch->name, "halt_all");

  auto activated = registry.activate_kill_switch(
      "halt_all", kAdmin,
      kill_switch_activation{.reason = "breach", .incident_id = "INC-7"});
  ASSERT_TRUE(activated.ok()) << activated.log;
  EXPECT_EQ(last_event_type(fixture),
            audit_event_type_t::kill_switch_activated);

  kill_switch = registry.find_kill_switch("halt_all");
  ASSERT_TRUE(kill_switch.has_value());
  EXPECT_TRUE(kill_switch->active);
  EXPECT_EQ(kill_switch->activated_by, kAdmin);
  EXPECT_EQ(kill_switch->activated_at, fixture.clock().now());
  EXPECT_EQ(kill_switch->incident_id, "INC-7");

  auto again = registry.activate_kill_switch(
      "halt_all", kAdmin,
      kill_switch_activation{.reason = "again"});
  EXPECT_EQ(again.code, to_code(error_code::invalid_transition));

  auto deactivated =
      registry.deactivate_kill_switch("halt_all", kBob, "contained");
  ASSERT_TRUE(deactivated.ok()) << deactivated.log;
  EXPECT_EQ(last_event_type(fixture),
            audit_event_type_t::kill_switch_deactivated);

  kill_switch = registry.find_kill_switch("halt_all");
  ASSERT_TRUE(kill_switch.has_value());
  EXPECT_FALSE(kill_switch->active);
  EXPECT_EQ(kill_switch->deactivated_by, kBob);
  EXPECT_EQ(kill_switch->resolution_notes, "contained");
  EXPECT_EQ(fixture.ledger().size(), 3u);
}

TEST(control_registry, activation_requires_reason_and_existing_switch) {
  auto fixture =
      sentinel::testing::governance_fixture{"sentinel_registry_reason"};
  auto& registry = fixture.registry();
  ASSERT_TRUE(registry.define_kill_switch(kAdmin, make_definition("halt_all"))
                  .ok());
  auto size = fixture.ledger().size();

  auto missing_reason = registry.activate_kill_switch(
      "halt_all", kAdmin, kill_switch_activation{});
  EXPECT_EQ(missing_reason.code, to_code(error_code::validation_error));
  EXPECT_EQ(missing_reason.codespace, sentinel::schema::kRegistryCodespace);

  auto unknown = registry.activate_kill_switch(
      "nope", kAdmin,
      kill_switch_activation{.reason = "breach"});
  EXPECT_EQ(unknown.code, to_code(error_code::not_found));

  auto past = registry.activate_kill_switch(
      "halt_all", kAdmin,
      kill_switch_activation{
          .reason = "breach", .auto_deactivate_at = fixture.clock().now()});
  EXPECT_EQ(past.code, to_code(error_code::validation_error));

  auto not_active = registry.deactivate_kill_switch("halt_all", kAdmin, "");
  EXPECT_EQ(not_active.code, to_code(error_code::invalid_transition));

  EXPECT_EQ(fixture.ledger().size(), size);
  EXPECT_FALSE(registry.find_kill_switch("halt_all")->active);
}

TEST(control_registry, duplicate_keys_are_rejected) {
  auto fixture = sentinel::testing::governance_fixture{"sentinel_registry_dup"};
  auto& registry = fixture.registry();

  ASSERT_TRUE(registry.define_kill_switch(kAdmin, make_definition("halt_all"))
                  .ok());
  EXPECT_EQ(
      registry.define_kill_switch(kAdmin, make_definition("halt_all")).code,
      to_code(error_code::already_exists));

  auto policy = sentinel::schema::control_policy_t{};
  policy.key = "prod_allow";
  ASSERT_TRUE(registry.register_policy(kAdmin, policy).ok());
  EXPECT_EQ(registry.register_policy(kAdmin, policy).code,
            to_code(error_code::already_exists));

  ASSERT_TRUE(
      registry.request_break_glass(kAlice, make_grant_request("bg")).ok());
  EXPECT_EQ(registry.request_break_glass(kAlice, make_grant_request("bg")).code,
            to_code(error_code::already_exists));

  EXPECT_EQ(registry.define_kill_switch(kAdmin, make_definition("")).code,
            to_code(error_code::validation_error));
}

TEST(control_registry, hard_stop_activation_notifies) {
  auto fixture =
      sentinel::testing::governance_fixture{"sentinel_registry_notify"};
  auto& registry = fixture.registry();
  ASSERT_TRUE(registry.define_kill_switch(kAdmin, make_definition("halt_all"))
                  .ok());
  ASSERT_TRUE(registry
                  .define_kill_switch(
                      kAdmin,
                      make_definition(
                          "slow_down",
                          sentinel::schema::kill_switch_mode_t::degrade))
                  .ok());

  ASSERT_TRUE(registry
                  .activate_kill_switch(
                      "slow_down", kAdmin,
                      kill_switch_activation{.reason = "load"})
                  .ok());
  EXPECT_TRUE(fixture.notifications().empty());

  auto activated = registry.activate_kill_switch(
      "halt_all", kAdmin,
      kill_switch_activation{.reason = "breach"});
  ASSERT_TRUE(activated.ok());

  auto notifications = fixture.notifications();
  ASSERT_EQ(notifications.size(), 1u);
  EXPECT_EQ(notifications[0].kind,
            sentinel::notify::notification_kind_t::hard_stop_activated);
  EXPECT_TRUE(notifications[0].critical);
  EXPECT_EQ(notifications[0].subject_key, "halt_all");
  EXPECT_EQ(notifications[0].message, "breach");
  EXPECT_EQ(notifications[0].ledger_sequence, activated.ledger_sequence);
}

TEST(control_registry, kill_switch_auto_deactivates_when_due) {
  auto fixture =
      sentinel::testing::governance_fixture{"sentinel_registry_auto_off"};
  auto& registry = fixture.registry();
  ASSERT_TRUE(registry.define_kill_switch(kAdmin, make_definition("halt_all"))
                  .ok());
  ASSERT_TRUE(registry
                  .activate_kill_switch(
                      "halt_all", kAdmin,
                      kill_switch_activation{
                          .reason = "maintenance",
                          .auto_deactivate_at =
                              fixture.clock().now() +
                              10 * sentinel::testing::kMinute})
                  .ok());

  EXPECT_EQ(registry.active_kill_switches({}).size(), 1u);

  fixture.clock().advance(10 * sentinel::testing::kMinute);
  auto size = fixture.ledger().size();
  EXPECT_TRUE(registry.active_kill_switches({}).empty());
  EXPECT_EQ(fixture.ledger().size(), size + 1);

  auto event = fixture.ledger().read(size + 1);
  ASSERT_TRUE(event.has_value());
  EXPECT_EQ(event->type, audit_event_type_t::kill_switch_deactivated);
  EXPECT_EQ(event->actor.type, sentinel::schema::actor_type_t::system);
  EXPECT_EQ(event->context.at("auto_deactivated"),
            sentinel::schema::make_context_value(true));

  auto kill_switch = registry.find_kill_switch("halt_all");
  ASSERT_TRUE(kill_switch.has_value());
  EXPECT_FALSE(kill_switch->active);
  EXPECT_EQ(registry.sweep_expired(), 0u);
}

TEST(control_registry, scoped_switches_match_their_workflow_only) {
  auto fixture =
      sentinel::testing::governance_fixture{"sentinel_registry_scope"};
  auto& registry = fixture.registry();
  auto payments = sentinel::schema::make_id("payments");
  ASSERT_TRUE(registry
                  .define_kill_switch(
                      kAdmin, sentinel::registry::kill_switch_definition{
                                  .key = "payments_stop",
                                  .scope = sentinel::schema::workflow_scope_t{
                                      .workflow_id = payments}})
                  .ok());
  ASSERT_TRUE(registry
                  .activate_kill_switch(
                      "payments_stop", kAdmin,
                      kill_switch_activation{.reason = "fraud"})
                  .ok());

  EXPECT_TRUE(registry.active_kill_switches({}).empty());
  EXPECT_EQ(registry
                .active_kill_switches(
                    sentinel::gate::kill_switch_query{.workflow_id = payments})
                .size(),
            1u);
  EXPECT_TRUE(registry
                  .active_kill_switches(sentinel::gate::kill_switch_query{
                      .workflow_id = sentinel::schema::make_id("billing")})
                  .empty());
  EXPECT_EQ(registry.list_kill_switches().size(), 1u);
}

TEST(control_registry, deactivated_policy_leaves_active_set) {
  auto fixture =
      sentinel::testing::governance_fixture{"sentinel_registry_policy"};
  auto& registry = fixture.registry();

  auto first = sentinel::schema::control_policy_t{};
  first.key = "late";
  first.priority = 50;
  auto second = sentinel::schema::control_policy_t{};
  second.key = "early";
  second.priority = 5;
  ASSERT_TRUE(registry.register_policy(kAdmin, first).ok());
  ASSERT_TRUE(registry.register_policy(kAdmin, second).ok());

  auto gate = sentinel::schema::enforcement_gate_t{};
  gate.key = "deploy";
  gate.policy_ids = {sentinel::schema::make_id("late"),
                     sentinel::schema::make_id("early")};
  ASSERT_TRUE(registry.register_gate(kAdmin, gate).ok());
  EXPECT_EQ(last_event_type(fixture), audit_event_type_t::gate_registered);

  auto gate_id = sentinel::schema::make_id("deploy");
  auto policies = registry.active_policies(gate_id);
  ASSERT_EQ(policies.size(), 2u);
  EXPECT_EQ(policies[0].key, "early");
  EXPECT_EQ(policies[1].key, "late");

  ASSERT_TRUE(registry.deactivate_policy("early", kAdmin).ok());
  EXPECT_EQ(last_event_type(fixture),
            audit_event_type_t::control_policy_deactivated);
  policies = registry.active_policies(gate_id);
  ASSERT_EQ(policies.size(), 1u);
  EXPECT_EQ(policies[0].key, "late");

  auto stored = registry.find_policy("early");
  ASSERT_TRUE(stored.has_value());
  EXPECT_FALSE(stored->active);
  EXPECT_EQ(registry.deactivate_policy("early", kAdmin).code,
            to_code(error_code::invalid_transition));
  EXPECT_EQ(registry.deactivate_policy("missing", kAdmin).code,
            to_code(error_code::not_found));
}

TEST(control_registry, gate_with_unknown_policy_is_rejected) {
  auto fixture =
      sentinel::testing::governance_fixture{"sentinel_registry_gate"};
  auto gate = sentinel::schema::enforcement_gate_t{};
  gate.key = "deploy";
  gate.policy_ids = {sentinel::schema::make_id("ghost")};

  auto result = fixture.registry().register_gate(kAdmin, gate);
  EXPECT_EQ(result.code, to_code(error_code::validation_error));
  EXPECT_FALSE(fixture.registry().find_gate("deploy").has_value());
  EXPECT_EQ(fixture.ledger().size(), 0u);
}

TEST(control_registry, break_glass_cannot_be_self_approved) {
  auto fixture =
      sentinel::testing::governance_fixture{"sentinel_registry_bg_self"};
  auto& registry = fixture.registry();
  ASSERT_TRUE(
      registry.request_break_glass(kAlice, make_grant_request("bg")).ok());
  EXPECT_EQ(last_event_type(fixture),
            audit_event_type_t::break_glass_requested);

  auto self = registry.approve_break_glass("bg", kAlice, "ok");
  EXPECT_EQ(self.code, to_code(error_code::validation_error));
  EXPECT_EQ(registry.find_break_glass("bg")->status,
            sentinel::schema::break_glass_status_t::pending);

  auto approved = registry.approve_break_glass("bg", kBob, "ok");
  ASSERT_TRUE(approved.ok()) << approved.log;
  EXPECT_EQ(last_event_type(fixture),
            audit_event_type_t::break_glass_activated);

  auto grant = registry.find_break_glass("bg");
  ASSERT_TRUE(grant.has_value());
  EXPECT_EQ(grant->status, sentinel::schema::break_glass_status_t::approved);
  EXPECT_EQ(grant->decided_by, kBob);
  EXPECT_EQ(grant->valid_from, fixture.clock().now());
  EXPECT_EQ(grant->valid_until,
            fixture.clock().now() + 30 * sentinel::testing::kMinute);
  EXPECT_TRUE(sentinel::schema::is_usable(*grant, kAlice, std::nullopt,
                                          fixture.clock().now()));
  EXPECT_FALSE(sentinel::schema::is_usable(*grant, kBob, std::nullopt,
                                           fixture.clock().now()));

  EXPECT_EQ(registry.approve_break_glass("bg", kBob, "again").code,
            to_code(error_code::invalid_transition));
}

TEST(control_registry, break_glass_requires_justification_and_duration) {
  auto fixture =
      sentinel::testing::governance_fixture{"sentinel_registry_bg_valid"};
  auto request = make_grant_request("bg");
  request.justification.clear();
  EXPECT_EQ(fixture.registry().request_break_glass(kAlice, request).code,
            to_code(error_code::validation_error));
  EXPECT_EQ(fixture.registry()
                .request_break_glass(kAlice, make_grant_request("bg", 0))
                .code,
            to_code(error_code::validation_error));
  EXPECT_EQ(fixture.ledger().size(), 0u);
}

TEST(control_registry, denied_break_glass_is_blocked_outcome) {
  auto fixture =
      sentinel::testing::governance_fixture{"sentinel_registry_bg_deny"};
  auto& registry = fixture.registry();
  ASSERT_TRUE(
      registry.request_break_glass(kAlice, make_grant_request("bg")).ok());
  ASSERT_TRUE(registry.deny_break_glass("bg", kBob, "not justified").ok());

  auto event = fixture.ledger().read(fixture.ledger().size());
  ASSERT_TRUE(event.has_value());
  EXPECT_EQ(event->type, audit_event_type_t::break_glass_denied);
  EXPECT_EQ(event->outcome, sentinel::schema::audit_outcome_t::blocked);
  EXPECT_EQ(registry.find_break_glass("bg")->status,
            sentinel::schema::break_glass_status_t::denied);
  EXPECT_EQ(registry.approve_break_glass("bg", kBob, "changed mind").code,
            to_code(error_code::invalid_transition));
}

TEST(control_registry, break_glass_expires_then_takes_one_review) {
  auto fixture =
      sentinel::testing::governance_fixture{"sentinel_registry_bg_expire"};
  auto& registry = fixture.registry();
  ASSERT_TRUE(
      registry.request_break_glass(kAlice, make_grant_request("bg")).ok());
  ASSERT_TRUE(registry.approve_break_glass("bg", kBob, "go").ok());

  EXPECT_EQ(registry.review_break_glass("bg", kBob, "early").code,
            to_code(error_code::invalid_transition));

  fixture.clock().advance(31 * sentinel::testing::kMinute);
  EXPECT_EQ(registry.sweep_expired(), 1u);
  EXPECT_EQ(last_event_type(fixture), audit_event_type_t::break_glass_closed);

  auto grant = registry.find_break_glass("bg");
  ASSERT_TRUE(grant.has_value());
  EXPECT_EQ(grant->status, sentinel::schema::break_glass_status_t::expired);
  EXPECT_FALSE(sentinel::schema::is_usable(*grant, kAlice, std::nullopt,
                                           fixture.clock().now()));

  EXPECT_EQ(registry.review_break_glass("bg", kBob, "").code,
            to_code(error_code::validation_error));
  auto reviewed = registry.review_break_glass("bg", kBob, "root cause fixed");
  ASSERT_TRUE(reviewed.ok()) << reviewed.log;
  EXPECT_EQ(last_event_type(fixture), audit_event_type_t::break_glass_closed);

  grant = registry.find_break_glass("bg");
  ASSERT_TRUE(grant.has_value());
  EXPECT_TRUE(grant->post_incident_reviewed);
  EXPECT_EQ(grant->post_incident_notes, "root cause fixed");
  EXPECT_EQ(registry.review_break_glass("bg", kBob, "twice").code,
            to_code(error_code::invalid_transition));
}

TEST(control_registry, revoked_break_glass_can_be_reviewed) {
  auto fixture =
      sentinel::testing::governance_fixture{"sentinel_registry_bg_revoke"};
  auto& registry = fixture.registry();
  ASSERT_TRUE(
      registry.request_break_glass(kAlice, make_grant_request("bg")).ok());
  EXPECT_EQ(registry.revoke_break_glass("bg", kBob, "too early").code,
            to_code(error_code::invalid_transition));
  ASSERT_TRUE(registry.approve_break_glass("bg", kBob, "go").ok());
  ASSERT_TRUE(registry.revoke_break_glass("bg", kBob, "resolved").ok());

  auto grant = registry.find_break_glass("bg");
  ASSERT_TRUE(grant.has_value());
  EXPECT_EQ(grant->status, sentinel::schema::break_glass_status_t::revoked);
  EXPECT_EQ(grant->revoked_by, kBob);
  EXPECT_TRUE(registry.review_break_glass("bg", kAdmin, "reviewed").ok());
}

TEST(control_registry, records_survive_reopen) {
  auto db_path = sentinel::testing::make_db_path("sentinel_registry_reopen");
  auto clock = sentinel::testing::manual_clock{};
  {
    auto store = sentinel::storage::make_storage<
        sentinel::storage::rocksdb_storage_tag>(db_path);
    auto ledger = sentinel::ledger::ledger{store, clock.source()};
    auto registry =
        sentinel::registry::control_registry{ledger, store, clock.source()};
    ASSERT_TRUE(registry.define_kill_switch(kAdmin, make_definition("halt_all"))
                    .ok());
    ASSERT_TRUE(registry
                    .activate_kill_switch(
                        "halt_all", kAdmin,
                        kill_switch_activation{.reason = "x"})
                    .ok());
  }
  {
    auto store = sentinel::storage::make_storage<
        sentinel::storage::rocksdb_storage_tag>(db_path);
    auto ledger = sentinel::ledger::ledger{store, clock.source()};
    auto registry =
        sentinel::registry::control_registry{ledger, store, clock.source()};
    EXPECT_EQ(registry.active_kill_switches({}).size(), 1u);
    EXPECT_EQ(ledger.size(), 2u);
    EXPECT_TRUE(ledger.verify_chain().ok);
  }
  sentinel::testing::remove_path(db_path);
}

TEST(control_registry, list_policies_filters_inactive) {
  auto fixture =
      sentinel::testing::governance_fixture{"sentinel_registry_list_policies"};
  auto& registry = fixture.registry();
  for (const auto& [key, priority] :
       std::vector<std::pair<std::string, int32_t>>{
           {"audit", 30}, {"freeze", 10}, {"review", 20}}) {
    auto policy = sentinel::schema::control_policy_t{};
    policy.key = key;
    policy.priority = priority;
    ASSERT_TRUE(registry.register_policy(kAdmin, policy).ok());
  }
  ASSERT_TRUE(registry.deactivate_policy("review", kAdmin).ok());

  auto keys = [](const std::vector<sentinel::schema::control_policy_t>& list) {
    auto out = std::vector<std::string>{};
    for (const auto& policy : list) {
      out.push_back(policy.key);
    }
    return out;
  };
  EXPECT_EQ(keys(registry.list_policies()),
            (std::vector<std::string>{"freeze", "review", "audit"}));
  EXPECT_EQ(keys(registry.list_policies(true)),
            (std::vector<std::string>{"freeze", "audit"}));
}

TEST(control_registry, malformed_policy_condition_is_rejected) {
  auto fixture =
      sentinel::testing::governance_fixture{"sentinel_registry_bad_condition"};
  auto& registry = fixture.registry();
  auto leaf = sentinel::schema::condition_node_t{
      .kind = sentinel::schema::condition_kind_t::equals,
      .key = "env",
      .values = {sentinel::schema::make_context_value("prod")}};

  auto policy = sentinel::schema::control_policy_t{};
  policy.key = "shared";
  policy.condition.nodes = {
      {.kind = sentinel::schema::condition_kind_t::all_of,
       .children = {1, 1}},
      leaf};
  auto result = registry.register_policy(kAdmin, policy);
  EXPECT_EQ(result.code, to_code(error_code::validation_error));

  policy.condition = sentinel::schema::make_always();
  policy.auto_deny_condition =
      sentinel::schema::condition_t{.nodes = {leaf, leaf}};
  result = registry.register_policy(kAdmin, policy);
  EXPECT_EQ(result.code, to_code(error_code::validation_error));

  EXPECT_FALSE(registry.find_policy("shared").has_value());
  EXPECT_EQ(fixture.ledger().size(), 0u);
}

TEST(control_registry, policy_source_skips_due_switches_without_closing) {
  auto fixture =
      sentinel::testing::governance_fixture{"sentinel_registry_source_due"};
  auto& registry = fixture.registry();
  ASSERT_TRUE(registry.define_kill_switch(kAdmin, make_definition("halt_all"))
                  .ok());
  ASSERT_TRUE(registry
                  .activate_kill_switch(
                      "halt_all", kAdmin,
                      kill_switch_activation{
                          .reason = "maintenance",
                          .auto_deactivate_at =
                              fixture.clock().now() +
                              10 * sentinel::testing::kMinute})
                  .ok());
  auto gate = sentinel::schema::enforcement_gate_t{};
  gate.key = "deploy";
  ASSERT_TRUE(registry.register_gate(kAdmin, gate).ok());

  EXPECT_FALSE(
      fixture.evaluator().evaluate("deploy", kAlice, {}).permits_execution());

  fixture.clock().advance(10 * sentinel::testing::kMinute);
  auto size = fixture.ledger().size();
  EXPECT_TRUE(
      fixture.evaluator().evaluate("deploy", kAlice, {}).permits_execution());
  for (auto sequence = size + 1; sequence <= fixture.ledger().size();
       ++sequence) {
    auto event = fixture.ledger().read(sequence);
    ASSERT_TRUE(event.has_value());
    EXPECT_NE(event->type, audit_event_type_t::kill_switch_deactivated);
  }
  EXPECT_TRUE(registry.find_kill_switch("halt_all")->active);

  EXPECT_EQ(registry.sweep_expired(), 1u);
  EXPECT_EQ(last_event_type(fixture),
            audit_event_type_t::kill_switch_deactivated);
}
