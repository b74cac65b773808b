#include <sentinel/gate/condition_evaluator.hpp>
#include <sentinel/registry/control_registry.hpp>
#include <sentinel/schema/key/keys.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>

namespace sentinel::registry {

namespace {

using encoder_t =
    schema::encoding::encoder<schema::encoding::scale_encoder_tag>;

constexpr auto kMillisecondsPerMinute = uint64_t{60'000};

schema::registry_result_t make_error(const schema::error_code code,
                                     std::string log,
                                     const schema::hash32_t& id = {}) {
  spdlog::error("Registry operation failed: {}", log);
  return schema::registry_result_t{
      .code = schema::to_code(code),
      .log = std::move(log),
      .codespace = std::string{schema::kRegistryCodespace},
      .id = id};
}

schema::bytes_view_t view(const schema::bytes_t& bytes) {
  return schema::bytes_view_t{bytes.data(), bytes.size()};
}

template <typename T>
std::vector<T> load_all(const storage::rocksdb_storage_t& store,
                        const std::string_view prefix) {
  auto encoder = encoder_t{};
  auto records = std::vector<T>{};
  for (const auto& [key, value] :
       store.list_by_prefix(view(schema::key::make_prefix(prefix)))) {
    auto decoded = encoder.try_decode<T>(view(value));
    if (!decoded) {
      spdlog::warn("Failed decoding registry record under '{}'", prefix);
      continue;
    }
    records.push_back(std::move(*decoded));
  }
  return records;
}

schema::audit_event_draft_t make_draft(const schema::audit_event_type_t type,
                                       std::string action,
                                       const schema::actor_t& actor,
                                       std::string resource_type,
                                       const schema::hash32_t& id,
                                       const std::string& key) {
  return schema::audit_event_draft_t{
      .type = type,
      .action = std::move(action),
      .actor = actor,
      .resource = schema::resource_ref_t{.type = std::move(resource_type),
                                         .id = id,
                                         .name = key},
      .outcome = schema::audit_outcome_t::success};
}

schema::actor_t registry_actor() {
  return schema::make_system_actor("sentinel.registry");
}

}  // namespace

control_registry::control_registry(ledger::ledger& ledger,
                                   storage::rocksdb_storage_t& store,
                                   common::clock_source_t clock,
                                   notify::notifier_t notifier)
    : ledger_{ledger},
      store_{store},
      clock_{std::move(clock)},
      notifier_{std::move(notifier)} {}

template <typename T>
std::optional<T> control_registry::load(const schema::bytes_t& key) const {
  auto encoder = encoder_t{};
  return store_.get<T>(encoder, view(key));
}

template <typename T>
void control_registry::save(const schema::bytes_t& key, const T& value) const {
  auto encoder = encoder_t{};
  store_.put(encoder, view(key), value);
}

schema::registry_result_t control_registry::record(
    const schema::audit_event_draft_t& draft,
    const schema::hash32_t& id) {
  auto appended = ledger_.append(draft);
  if (!appended.ok()) {
    return make_error(static_cast<schema::error_code>(appended.code),
                      fmt::format("{}: {}", draft.action, appended.log), id);
  }
  spdlog::info("{} (ledger #{})", draft.action, appended.sequence);
  return schema::registry_result_t{
      .code = schema::to_code(schema::error_code::ok),
      .codespace = std::string{schema::kRegistryCodespace},
      .id = id,
      .ledger_sequence = appended.sequence};
}

schema::registry_result_t control_registry::define_kill_switch(
    const schema::actor_t& actor,
    const kill_switch_definition& definition) {
  if (definition.key.empty()) {
    return make_error(schema::error_code::validation_error,
                      "kill switch key is required");
  }
  auto id = schema::make_id(definition.key);
  auto key = schema::key::make_kill_switch_key(id);

  auto lock = std::scoped_lock{mutex_};
  if (load<schema::kill_switch_t>(key)) {
    return make_error(
        schema::error_code::already_exists,
        fmt::format("kill switch '{}' already exists", definition.key), id);
  }

  auto kill_switch = schema::kill_switch_t{};
  kill_switch.id = id;
  kill_switch.key = definition.key;
  kill_switch.name = definition.name.empty() ? definition.key : definition.name;
  kill_switch.scope = definition.scope;
  kill_switch.mode = definition.mode;
  kill_switch.trigger = definition.trigger;
  kill_switch.created_at = clock_();

  auto draft = make_draft(
      schema::audit_event_type_t::kill_switch_defined,
      fmt::format("Kill switch '{}' defined", kill_switch.key), actor,
      "kill_switch", id, kill_switch.key);
  draft.context.emplace("mode", schema::make_context_value(std::string{
                                    schema::to_string(kill_switch.mode)}));
  draft.context.emplace("scope", schema::make_context_value(
                                     schema::to_string(kill_switch.scope)));
  auto result = record(draft, id);
  if (result.ok()) {
    save(key, kill_switch);
  }
  return result;
}

schema::registry_result_t control_registry::activate_kill_switch(
    const std::string_view key,
    const schema::actor_t& actor,
    const kill_switch_activation& activation) {
  auto id = schema::make_id(key);
  if (activation.reason.empty()) {
    return make_error(schema::error_code::validation_error,
                      "a reason is required to activate a kill switch", id);
  }

  auto result = schema::registry_result_t{};
  auto activated = schema::kill_switch_t{};
  {
    auto lock = std::scoped_lock{mutex_};
    auto storage_key = schema::key::make_kill_switch_key(id);
    auto kill_switch = load<schema::kill_switch_t>(storage_key);
    if (!kill_switch) {
      return make_error(schema::error_code::not_found,
                        fmt::format("kill switch '{}' not found", key), id);
    }
    if (kill_switch->active) {
      return make_error(schema::error_code::invalid_transition,
                        fmt::format("kill switch '{}' is already active", key),
                        id);
    }
    auto now = clock_();
    if (activation.auto_deactivate_at &&
        *activation.auto_deactivate_at <= now) {
      return make_error(schema::error_code::validation_error,
                        "auto-deactivation time must be in the future", id);
    }

    kill_switch->active = true;
    kill_switch->activated_at = now;
    kill_switch->activated_by = actor;
    kill_switch->deactivated_at.reset();
    kill_switch->deactivated_by.reset();
    kill_switch->auto_deactivate_at = activation.auto_deactivate_at;
    kill_switch->reason = activation.reason;
    kill_switch->resolution_notes.clear();
    kill_switch->incident_id = activation.incident_id;
    if (activation.trigger) {
      kill_switch->trigger = *activation.trigger;
    }

    auto draft = make_draft(
        schema::audit_event_type_t::kill_switch_activated,
        fmt::format("Kill switch '{}' activated ({})", kill_switch->key,
                    schema::to_string(kill_switch->mode)),
        actor, "kill_switch", id, kill_switch->key);
    draft.context.emplace("mode", schema::make_context_value(std::string{
                                      schema::to_string(kill_switch->mode)}));
    draft.context.emplace("scope", schema::make_context_value(
                                       schema::to_string(kill_switch->scope)));
    draft.context.emplace(
        "trigger", schema::make_context_value(
                       std::string{schema::to_string(kill_switch->trigger)}));
    draft.context.emplace("reason",
                          schema::make_context_value(activation.reason));
    if (activation.incident_id) {
      draft.context.emplace(
          "incident_id", schema::make_context_value(*activation.incident_id));
    }
    if (activation.auto_deactivate_at) {
      draft.context.emplace("auto_deactivate_at",
                            schema::make_context_value(static_cast<int64_t>(
                                *activation.auto_deactivate_at)));
    }
    result = record(draft, id);
    if (!result.ok()) {
      return result;
    }
    save(storage_key, *kill_switch);
    activated = std::move(*kill_switch);
  }

  if (activated.mode == schema::kill_switch_mode_t::hard_stop) {
    notify::notify_best_effort(
        notifier_,
        notify::notification{
            .kind = notify::notification_kind_t::hard_stop_activated,
            .critical = true,
            .subject_id = activated.id,
            .subject_key = activated.key,
            .message = activated.reason,
            .ledger_sequence = result.ledger_sequence});
  }
  return result;
}

schema::registry_result_t control_registry::deactivate_kill_switch(
    const std::string_view key,
    const schema::actor_t& actor,
    const std::string& resolution_notes) {
  auto id = schema::make_id(key);
  auto lock = std::scoped_lock{mutex_};
  auto storage_key = schema::key::make_kill_switch_key(id);
  auto kill_switch = load<schema::kill_switch_t>(storage_key);
  if (!kill_switch) {
    return make_error(schema::error_code::not_found,
                      fmt::format("kill switch '{}' not found", key), id);
  }
  if (!kill_switch->active) {
    return make_error(schema::error_code::invalid_transition,
                      fmt::format("kill switch '{}' is not active", key), id);
  }

  kill_switch->active = false;
  kill_switch->deactivated_at = clock_();
  kill_switch->deactivated_by = actor;
  kill_switch->resolution_notes = resolution_notes;

  auto draft = make_draft(
      schema::audit_event_type_t::kill_switch_deactivated,
      fmt::format("Kill switch '{}' deactivated", kill_switch->key), actor,
      "kill_switch", id, kill_switch->key);
  draft.context.emplace("resolution_notes",
                        schema::make_context_value(resolution_notes));
  auto result = record(draft, id);
  if (result.ok()) {
    save(storage_key, *kill_switch);
  }
  return result;
}

schema::registry_result_t control_registry::register_policy(
    const schema::actor_t& actor,
    schema::control_policy_t policy) {
  if (policy.key.empty()) {
    return make_error(schema::error_code::validation_error,
                      "policy key is required");
  }
  policy.id = schema::make_id(policy.key);
  if (auto problem = gate::validate_condition(policy.condition)) {
    return make_error(schema::error_code::validation_error,
                      fmt::format("policy '{}' condition is malformed: {}",
                                  policy.key, *problem),
                      policy.id);
  }
  if (policy.auto_deny_condition) {
    if (auto problem = gate::validate_condition(*policy.auto_deny_condition)) {
      return make_error(
          schema::error_code::validation_error,
          fmt::format("policy '{}' auto-deny condition is malformed: {}",
                      policy.key, *problem),
          policy.id);
    }
  }
  auto storage_key = schema::key::make_control_policy_key(policy.id);

  auto lock = std::scoped_lock{mutex_};
  if (load<schema::control_policy_t>(storage_key)) {
    return make_error(schema::error_code::already_exists,
                      fmt::format("policy '{}' already exists", policy.key),
                      policy.id);
  }
  if (policy.name.empty()) {
    policy.name = policy.key;
  }
  policy.active = true;
  policy.created_by = actor;
  policy.created_at = clock_();
  policy.updated_at = policy.created_at;

  auto draft = make_draft(
      schema::audit_event_type_t::control_policy_registered,
      fmt::format("Control policy '{}' registered", policy.key), actor,
      "control_policy", policy.id, policy.key);
  draft.context.emplace("outcome", schema::make_context_value(std::string{
                                       schema::to_string(policy.outcome)}));
  draft.context.emplace("priority", schema::make_context_value(
                                        static_cast<int64_t>(policy.priority)));
  auto result = record(draft, policy.id);
  if (result.ok()) {
    save(storage_key, policy);
  }
  return result;
}

schema::registry_result_t control_registry::deactivate_policy(
    const std::string_view key,
    const schema::actor_t& actor) {
  auto id = schema::make_id(key);
  auto storage_key = schema::key::make_control_policy_key(id);

  auto lock = std::scoped_lock{mutex_};
  auto policy = load<schema::control_policy_t>(storage_key);
  if (!policy) {
    return make_error(schema::error_code::not_found,
                      fmt::format("policy '{}' not found", key), id);
  }
  if (!policy->active) {
    return make_error(schema::error_code::invalid_transition,
                      fmt::format("policy '{}' is already inactive", key), id);
  }
  policy->active = false;
  policy->updated_at = clock_();

  auto result = record(
      make_draft(schema::audit_event_type_t::control_policy_deactivated,
                 fmt::format("Control policy '{}' deactivated", policy->key),
                 actor, "control_policy", id, policy->key),
      id);
  if (result.ok()) {
    save(storage_key, *policy);
  }
  return result;
}

schema::registry_result_t control_registry::register_gate(
    const schema::actor_t& actor,
    schema::enforcement_gate_t gate) {
  if (gate.key.empty()) {
    return make_error(schema::error_code::validation_error,
                      "gate key is required");
  }
  gate.id = schema::make_id(gate.key);
  auto storage_key = schema::key::make_enforcement_gate_key(gate.id);

  auto lock = std::scoped_lock{mutex_};
  if (load<schema::enforcement_gate_t>(storage_key)) {
    return make_error(schema::error_code::already_exists,
                      fmt::format("gate '{}' already exists", gate.key),
                      gate.id);
  }
  for (const auto& policy_id : gate.policy_ids) {
    if (!load<schema::control_policy_t>(
            schema::key::make_control_policy_key(policy_id))) {
      return make_error(schema::error_code::validation_error,
                        fmt::format("gate '{}' lists unknown policy {}",
                                    gate.key, schema::to_hex(policy_id)),
                        gate.id);
    }
  }
  if (gate.name.empty()) {
    gate.name = gate.key;
  }
  gate.created_at = clock_();

  auto draft = make_draft(schema::audit_event_type_t::gate_registered,
                          fmt::format("Gate '{}' registered", gate.key), actor,
                          "enforcement_gate", gate.id, gate.key);
  draft.context.emplace("gate_type", schema::make_context_value(std::string{
                                         schema::to_string(gate.type)}));
  draft.context.emplace("mode", schema::make_context_value(std::string{
                                    schema::to_string(gate.mode)}));
  draft.context.emplace("policies",
                        schema::make_context_value(
                            static_cast<int64_t>(gate.policy_ids.size())));
  auto result = record(draft, gate.id);
  if (result.ok()) {
    save(storage_key, gate);
  }
  return result;
}

schema::registry_result_t control_registry::request_break_glass(
    const schema::actor_t& actor,
    const break_glass_request& request) {
  if (request.key.empty() || request.justification.empty()) {
    return make_error(schema::error_code::validation_error,
                      "break-glass key and justification are required");
  }
  if (request.duration_minutes == 0) {
    return make_error(schema::error_code::validation_error,
                      "break-glass duration must be positive");
  }
  auto id = schema::make_id(request.key);
  auto storage_key = schema::key::make_break_glass_key(id);

  auto lock = std::scoped_lock{mutex_};
  if (load<schema::break_glass_t>(storage_key)) {
    return make_error(
        schema::error_code::already_exists,
        fmt::format("break-glass '{}' already exists", request.key), id);
  }

  auto grant = schema::break_glass_t{};
  grant.id = id;
  grant.key = request.key;
  grant.workflow_id = request.workflow_id;
  grant.reason = request.reason;
  grant.justification = request.justification;
  grant.requested_by = actor;
  grant.requested_at = clock_();
  grant.duration_minutes = request.duration_minutes;
  grant.incident_id = request.incident_id;

  auto draft = make_draft(
      schema::audit_event_type_t::break_glass_requested,
      fmt::format("Break-glass '{}' requested", grant.key), actor,
      "break_glass", id, grant.key);
  draft.context.emplace("reason", schema::make_context_value(std::string{
                                      schema::to_string(grant.reason)}));
  draft.context.emplace("duration_minutes",
                        schema::make_context_value(
                            static_cast<int64_t>(grant.duration_minutes)));
  auto result = record(draft, id);
  if (result.ok()) {
    save(storage_key, grant);
  }
  return result;
}

schema::registry_result_t control_registry::approve_break_glass(
    const std::string_view key,
    const schema::actor_t& approver,
    const std::string& notes) {
  auto id = schema::make_id(key);
  auto storage_key = schema::key::make_break_glass_key(id);

  auto lock = std::scoped_lock{mutex_};
  auto grant = load<schema::break_glass_t>(storage_key);
  if (!grant) {
    return make_error(schema::error_code::not_found,
                      fmt::format("break-glass '{}' not found", key), id);
  }
  if (grant->status != schema::break_glass_status_t::pending) {
    return make_error(schema::error_code::invalid_transition,
                      fmt::format("break-glass '{}' is {}", key,
                                  schema::to_string(grant->status)),
                      id);
  }
  if (grant->requested_by.id == approver.id) {
    return make_error(schema::error_code::validation_error,
                      "break-glass cannot be approved by its requester", id);
  }

  auto now = clock_();
  grant->status = schema::break_glass_status_t::approved;
  grant->decided_by = approver;
  grant->decided_at = now;
  grant->decision_notes = notes;
  grant->valid_from = now;
  grant->valid_until = now + grant->duration_minutes * kMillisecondsPerMinute;

  auto draft = make_draft(
      schema::audit_event_type_t::break_glass_activated,
      fmt::format("Break-glass '{}' approved", grant->key), approver,
      "break_glass", id, grant->key);
  draft.context.emplace(
      "valid_until",
      schema::make_context_value(static_cast<int64_t>(*grant->valid_until)));
  auto result = record(draft, id);
  if (result.ok()) {
    save(storage_key, *grant);
  }
  return result;
}

schema::registry_result_t control_registry::deny_break_glass(
    const std::string_view key,
    const schema::actor_t& approver,
    const std::string& notes) {
  auto id = schema::make_id(key);
  auto storage_key = schema::key::make_break_glass_key(id);

  auto lock = std::scoped_lock{mutex_};
  auto grant = load<schema::break_glass_t>(storage_key);
  if (!grant) {
    return make_error(schema::error_code::not_found,
                      fmt::format("break-glass '{}' not found", key), id);
  }
  if (grant->status != schema::break_glass_status_t::pending) {
    return make_error(schema::error_code::invalid_transition,
                      fmt::format("break-glass '{}' is {}", key,
                                  schema::to_string(grant->status)),
                      id);
  }
  grant->status = schema::break_glass_status_t::denied;
  grant->decided_by = approver;
  grant->decided_at = clock_();
  grant->decision_notes = notes;

  auto draft = make_draft(schema::audit_event_type_t::break_glass_denied,
                          fmt::format("Break-glass '{}' denied", grant->key),
                          approver, "break_glass", id, grant->key);
  draft.outcome = schema::audit_outcome_t::blocked;
  auto result = record(draft, id);
  if (result.ok()) {
    save(storage_key, *grant);
  }
  return result;
}

schema::registry_result_t control_registry::revoke_break_glass(
    const std::string_view key,
    const schema::actor_t& actor,
    const std::string& notes) {
  auto id = schema::make_id(key);
  auto storage_key = schema::key::make_break_glass_key(id);

  auto lock = std::scoped_lock{mutex_};
  auto grant = load<schema::break_glass_t>(storage_key);
  if (!grant) {
    return make_error(schema::error_code::not_found,
                      fmt::format("break-glass '{}' not found", key), id);
  }
  if (grant->status != schema::break_glass_status_t::approved) {
    return make_error(schema::error_code::invalid_transition,
                      fmt::format("break-glass '{}' is {}", key,
                                  schema::to_string(grant->status)),
                      id);
  }
  grant->status = schema::break_glass_status_t::revoked;
  grant->revoked_by = actor;
  grant->revoked_at = clock_();
  grant->decision_notes = notes;

  auto draft = make_draft(schema::audit_event_type_t::break_glass_closed,
                          fmt::format("Break-glass '{}' revoked", grant->key),
                          actor, "break_glass", id, grant->key);
  draft.context.emplace("status", schema::make_context_value("REVOKED"));
  auto result = record(draft, id);
  if (result.ok()) {
    save(storage_key, *grant);
  }
  return result;
}

schema::registry_result_t control_registry::review_break_glass(
    const std::string_view key,
    const schema::actor_t& reviewer,
    const std::string& notes) {
  auto id = schema::make_id(key);
  if (notes.empty()) {
    return make_error(schema::error_code::validation_error,
                      "post-incident review notes are required", id);
  }
  auto storage_key = schema::key::make_break_glass_key(id);

  auto lock = std::scoped_lock{mutex_};
  sweep_expired_locked();
  auto grant = load<schema::break_glass_t>(storage_key);
  if (!grant) {
    return make_error(schema::error_code::not_found,
                      fmt::format("break-glass '{}' not found", key), id);
  }
  if (grant->status != schema::break_glass_status_t::expired &&
      grant->status != schema::break_glass_status_t::revoked) {
    return make_error(
        schema::error_code::invalid_transition,
        fmt::format("break-glass '{}' must be closed before review", key), id);
  }
  if (grant->post_incident_reviewed) {
    return make_error(schema::error_code::invalid_transition,
                      fmt::format("break-glass '{}' is already reviewed", key),
                      id);
  }
  grant->post_incident_reviewed = true;
  grant->post_incident_notes = notes;

  auto draft = make_draft(
      schema::audit_event_type_t::break_glass_closed,
      fmt::format("Break-glass '{}' post-incident review completed",
                  grant->key),
      reviewer, "break_glass", id, grant->key);
  draft.context.emplace("post_incident_reviewed",
                        schema::make_context_value(true));
  auto result = record(draft, id);
  if (result.ok()) {
    save(storage_key, *grant);
  }
  return result;
}

uint32_t control_registry::sweep_expired() {
  auto lock = std::scoped_lock{mutex_};
  return sweep_expired_locked();
}

uint32_t control_registry::sweep_expired_locked() {
  auto now = clock_();
  auto closed = uint32_t{};
  auto system = registry_actor();

  for (auto& kill_switch : load_all<schema::kill_switch_t>(
           store_, schema::key::kKillSwitchPrefix)) {
    if (!kill_switch.active || !kill_switch.auto_deactivate_at ||
        *kill_switch.auto_deactivate_at > now) {
      continue;
    }
    kill_switch.active = false;
    kill_switch.deactivated_at = now;
    kill_switch.deactivated_by = system;
    kill_switch.resolution_notes = "auto-deactivated";

    auto draft = make_draft(
        schema::audit_event_type_t::kill_switch_deactivated,
        fmt::format("Kill switch '{}' auto-deactivated", kill_switch.key),
        system, "kill_switch", kill_switch.id, kill_switch.key);
    draft.context.emplace("auto_deactivated", schema::make_context_value(true));
    if (record(draft, kill_switch.id).ok()) {
      save(schema::key::make_kill_switch_key(kill_switch.id), kill_switch);
      ++closed;
    }
  }

  for (auto& grant : load_all<schema::break_glass_t>(
           store_, schema::key::kBreakGlassPrefix)) {
    if (grant.status != schema::break_glass_status_t::approved ||
        !grant.valid_until || *grant.valid_until >= now) {
      continue;
    }
    grant.status = schema::break_glass_status_t::expired;

    auto draft = make_draft(
        schema::audit_event_type_t::break_glass_closed,
        fmt::format("Break-glass '{}' expired", grant.key), system,
        "break_glass", grant.id, grant.key);
    draft.context.emplace("status", schema::make_context_value("EXPIRED"));
    if (record(draft, grant.id).ok()) {
      save(schema::key::make_break_glass_key(grant.id), grant);
      ++closed;
    }
  }
  return closed;
}

std::optional<schema::kill_switch_t> control_registry::find_kill_switch(
    const std::string_view key) const {
  auto lock = std::scoped_lock{mutex_};
  return load<schema::kill_switch_t>(
      schema::key::make_kill_switch_key(schema::make_id(key)));
}

std::vector<schema::kill_switch_t> control_registry::list_kill_switches()
    const {
  auto lock = std::scoped_lock{mutex_};
  return load_all<schema::kill_switch_t>(store_,
                                         schema::key::kKillSwitchPrefix);
}

std::vector<schema::kill_switch_t> control_registry::active_kill_switches(
    const gate::kill_switch_query& query) {
  auto lock = std::scoped_lock{mutex_};
  sweep_expired_locked();
  auto active = std::vector<schema::kill_switch_t>{};
  for (auto& kill_switch : load_all<schema::kill_switch_t>(
           store_, schema::key::kKillSwitchPrefix)) {
    if (kill_switch.active && gate::in_scope(kill_switch, query)) {
      active.push_back(std::move(kill_switch));
    }
  }
  return active;
}

std::vector<schema::kill_switch_t> control_registry::kill_switches_in_force(
    const gate::kill_switch_query& query) const {
  auto lock = std::scoped_lock{mutex_};
  auto now = clock_();
  auto active = std::vector<schema::kill_switch_t>{};
  for (auto& kill_switch : load_all<schema::kill_switch_t>(
           store_, schema::key::kKillSwitchPrefix)) {
    auto due = kill_switch.auto_deactivate_at &&
               *kill_switch.auto_deactivate_at <= now;
    if (kill_switch.active && !due && gate::in_scope(kill_switch, query)) {
      active.push_back(std::move(kill_switch));
    }
  }
  return active;
}

std::optional<schema::control_policy_t> control_registry::find_policy(
    const std::string_view key) const {
  auto lock = std::scoped_lock{mutex_};
  return load<schema::control_policy_t>(
      schema::key::make_control_policy_key(schema::make_id(key)));
}

std::vector<schema::control_policy_t> control_registry::list_policies(
    const bool active_only) const {
  auto lock = std::scoped_lock{mutex_};
  auto policies = load_all<schema::control_policy_t>(
      store_, schema::key::kControlPolicyPrefix);
  if (active_only) {
    std::erase_if(policies, [](const auto& policy) { return !policy.active; });
  }
  std::ranges::sort(policies, [](const auto& lhs, const auto& rhs) {
    if (lhs.priority != rhs.priority) {
      return lhs.priority < rhs.priority;
    }
    return lhs.id < rhs.id;
  });
  return policies;
}

std::vector<schema::control_policy_t> control_registry::active_policies(
    const schema::hash32_t& gate_id) const {
  auto lock = std::scoped_lock{mutex_};
  auto gate = load<schema::enforcement_gate_t>(
      schema::key::make_enforcement_gate_key(gate_id));
  if (!gate) {
    return {};
  }
  auto policies = std::vector<schema::control_policy_t>{};
  for (const auto& policy_id : gate->policy_ids) {
    auto policy = load<schema::control_policy_t>(
        schema::key::make_control_policy_key(policy_id));
    if (policy && policy->active) {
      policies.push_back(std::move(*policy));
    }
  }
  std::ranges::sort(policies, [](const auto& lhs, const auto& rhs) {
    if (lhs.priority != rhs.priority) {
      return lhs.priority < rhs.priority;
    }
    return lhs.id < rhs.id;
  });
  return policies;
}

std::optional<schema::enforcement_gate_t> control_registry::find_gate(
    const std::string_view key) const {
  auto lock = std::scoped_lock{mutex_};
  return load<schema::enforcement_gate_t>(
      schema::key::make_enforcement_gate_key(schema::make_id(key)));
}

std::optional<schema::break_glass_t> control_registry::find_break_glass(
    const schema::hash32_t& id) const {
  auto lock = std::scoped_lock{mutex_};
  return load<schema::break_glass_t>(schema::key::make_break_glass_key(id));
}

std::optional<schema::break_glass_t> control_registry::find_break_glass(
    const std::string_view key) const {
  return find_break_glass(schema::make_id(key));
}

gate::policy_source control_registry::make_policy_source() const {
  return gate::policy_source{
      .active_kill_switches =
          [this](const gate::kill_switch_query& query) {
            return kill_switches_in_force(query);
          },
      .active_policies =
          [this](const schema::hash32_t& gate_id) {
            return active_policies(gate_id);
          },
      .find_gate = [this](std::string_view key) { return find_gate(key); },
      .find_break_glass =
          [this](const schema::hash32_t& id) { return find_break_glass(id); }};
}

}  // namespace sentinel::registry
