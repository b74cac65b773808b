#pragma once

#include <sentinel/common/clock.hpp>
#include <sentinel/gate/policy_source.hpp>
#include <sentinel/ledger/ledger.hpp>
#include <sentinel/notify/notifier.hpp>
#include <sentinel/schema/break_glass.hpp>
#include <sentinel/schema/control_policy.hpp>
#include <sentinel/schema/enforcement_gate.hpp>
#include <sentinel/schema/kill_switch.hpp>
#include <sentinel/schema/registry_result.hpp>
#include <sentinel/storage/rocksdb/storage.hpp>

#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace sentinel::registry {

struct kill_switch_definition final {
  std::string key;
  std::string name;
  schema::kill_switch_scope_t scope{schema::global_scope_t{}};
  schema::kill_switch_mode_t mode{schema::kill_switch_mode_t::hard_stop};
  schema::kill_switch_trigger_t trigger{schema::kill_switch_trigger_t::manual};
};

struct kill_switch_activation final {
  std::string reason;
  std::optional<schema::kill_switch_trigger_t> trigger;
  std::optional<schema::timestamp_milliseconds_t> auto_deactivate_at;
  std::optional<std::string> incident_id;
};

struct break_glass_request final {
  std::string key;
  std::optional<schema::hash32_t> workflow_id;
  schema::break_glass_reason_t reason{
      schema::break_glass_reason_t::p0_incident};
  std::string justification;
  uint32_t duration_minutes{60};
  std::optional<std::string> incident_id;
};

/// Storage-backed owner of kill switches, control policies, gates and
/// break-glass grants.
///
/// Every mutation appends exactly one ledger event before the record is
/// saved; a failed append leaves the record untouched. Expired kill switches
/// and grants are closed lazily, against the injected clock, whenever active
/// kill switches are read through the registry or swept.
class control_registry final {
 public:
  control_registry(ledger::ledger& ledger,
                   storage::rocksdb_storage_t& store,
                   common::clock_source_t clock,
                   notify::notifier_t notifier = {});

  // Kill switches. Created inactive; activate/deactivate are the only
  // mutations.
  schema::registry_result_t define_kill_switch(
      const schema::actor_t& actor,
      const kill_switch_definition& definition);
  schema::registry_result_t activate_kill_switch(
      const std::string_view key,
      const schema::actor_t& actor,
      const kill_switch_activation& activation);
  schema::registry_result_t deactivate_kill_switch(
      const std::string_view key,
      const schema::actor_t& actor,
      const std::string& resolution_notes);

  // Control policies. Soft-deleted only.
  schema::registry_result_t register_policy(const schema::actor_t& actor,
                                            schema::control_policy_t policy);
  schema::registry_result_t deactivate_policy(const std::string_view key,
                                              const schema::actor_t& actor);

  schema::registry_result_t register_gate(const schema::actor_t& actor,
                                          schema::enforcement_gate_t gate);

  // Break-glass lifecycle.
  schema::registry_result_t request_break_glass(
      const schema::actor_t& actor,
      const break_glass_request& request);
  schema::registry_result_t approve_break_glass(const std::string_view key,
                                                const schema::actor_t& approver,
                                                const std::string& notes);
  schema::registry_result_t deny_break_glass(const std::string_view key,
                                             const schema::actor_t& approver,
                                             const std::string& notes);
  schema::registry_result_t revoke_break_glass(const std::string_view key,
                                               const schema::actor_t& actor,
                                               const std::string& notes);
  schema::registry_result_t review_break_glass(const std::string_view key,
                                               const schema::actor_t& reviewer,
                                               const std::string& notes);

  /// Deactivate kill switches and expire grants whose time has passed.
  /// Returns the number of records closed.
  uint32_t sweep_expired();

  std::optional<schema::kill_switch_t> find_kill_switch(
      const std::string_view key) const;
  std::vector<schema::kill_switch_t> list_kill_switches() const;
  std::vector<schema::kill_switch_t> active_kill_switches(
      const gate::kill_switch_query& query);

  std::optional<schema::control_policy_t> find_policy(
      const std::string_view key) const;
  /// Every registered policy, or only active ones, ascending by priority
  /// then id.
  std::vector<schema::control_policy_t> list_policies(
      const bool active_only = false) const;
  /// The gate's listed active policies, ascending by priority then id.
  std::vector<schema::control_policy_t> active_policies(
      const schema::hash32_t& gate_id) const;

  std::optional<schema::enforcement_gate_t> find_gate(
      const std::string_view key) const;

  std::optional<schema::break_glass_t> find_break_glass(
      const schema::hash32_t& id) const;
  std::optional<schema::break_glass_t> find_break_glass(
      const std::string_view key) const;

  /// Read-only lookups bound to this registry, for the gate evaluator. Kill
  /// switches past their auto-deactivate time are left out without being
  /// closed. The registry must outlive every evaluator given this source.
  gate::policy_source make_policy_source() const;

 private:
  template <typename T>
  std::optional<T> load(const schema::bytes_t& key) const;
  template <typename T>
  void save(const schema::bytes_t& key, const T& value) const;

  schema::registry_result_t record(const schema::audit_event_draft_t& draft,
                                   const schema::hash32_t& id);
  uint32_t sweep_expired_locked();
  std::vector<schema::kill_switch_t> kill_switches_in_force(
      const gate::kill_switch_query& query) const;

  ledger::ledger& ledger_;
  storage::rocksdb_storage_t& store_;
  common::clock_source_t clock_;
  notify::notifier_t notifier_;
  mutable std::mutex mutex_;
};

}  // namespace sentinel::registry
