#include <sentinel/change/state_machine.hpp>
#include <sentinel/schema/encoding/scale/encoder.hpp>
#include <sentinel/schema/key/keys.hpp>

#include <spdlog/fmt/ranges.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <exception>
#include <set>

namespace sentinel::change {

namespace {

using encoder_t =
    schema::encoding::encoder<schema::encoding::scale_encoder_tag>;

schema::change_result_t make_error(
    const schema::error_code code,
    std::string log,
    std::optional<schema::change_request_t> request = std::nullopt) {
  spdlog::warn("Change request operation rejected: {}", log);
  return schema::change_result_t{
      .code = schema::to_code(code),
      .log = std::move(log),
      .codespace = std::string{schema::kChangeCodespace},
      .request = std::move(request)};
}

schema::change_result_t make_success(schema::change_request_t request) {
  return schema::change_result_t{
      .code = schema::to_code(schema::error_code::ok),
      .codespace = std::string{schema::kChangeCodespace},
      .request = std::move(request)};
}

schema::audit_event_draft_t make_draft(
    const schema::audit_event_type_t type,
    std::string action,
    const schema::audit_outcome_t outcome = schema::audit_outcome_t::success) {
  return schema::audit_event_draft_t{
      .type = type, .action = std::move(action), .outcome = outcome};
}

schema::context_value_t make_status_value(
    const schema::change_status_t status) {
  return schema::make_context_value(std::string{schema::to_string(status)});
}

bool within_window(const schema::change_request_t& request,
                   const schema::timestamp_milliseconds_t now) {
  return request.scheduled_start && request.scheduled_end &&
         now >= *request.scheduled_start && now <= *request.scheduled_end;
}

bool run_rollback(const rollback_executor_t& executor,
                  const schema::change_request_t& request) {
  if (!executor) {
    spdlog::warn(
        "No rollback executor configured; recording manual rollback of '{}'",
        request.key);
    return true;
  }
  try {
    return executor(request);
  } catch (const std::exception& e) {
    spdlog::error("Rollback procedure for '{}' threw: {}", request.key,
                  e.what());
    return false;
  }
}

}  // namespace

state_machine::state_machine(ledger::ledger& ledger,
                             storage::rocksdb_storage_t& store,
                             gate::evaluator& evaluator,
                             common::clock_source_t clock,
                             state_machine_options options,
                             rollback_executor_t rollback_executor,
                             notify::notifier_t notifier)
    : ledger_{ledger},
      store_{store},
      evaluator_{evaluator},
      clock_{std::move(clock)},
      options_{std::move(options)},
      rollback_executor_{std::move(rollback_executor)},
      notifier_{std::move(notifier)} {}

template <typename Operation>
schema::change_result_t state_machine::guarded(Operation&& operation) {
  auto result = [&] {
    auto lock = std::scoped_lock{mutex_};
    return operation();
  }();
  if (result.code == schema::to_code(schema::error_code::tamper_detected)) {
    auto event = notify::notification{
        .kind = notify::notification_kind_t::tamper_detected,
        .critical = true,
        .message = result.log};
    if (result.request) {
      event.subject_id = result.request->id;
      event.subject_key = result.request->key;
    }
    notify::notify_best_effort(notifier_, event);
  }
  return result;
}

template <typename Mutation>
schema::change_result_t state_machine::transition(
    schema::change_request_t& request,
    const change_event_t event,
    const schema::actor_t& actor,
    schema::audit_event_draft_t draft,
    Mutation&& mutate) {
  auto next = next_status(request.status, event);
  if (!next) {
    return make_error(schema::error_code::invalid_transition,
                      fmt::format("cannot {} change request '{}' in {}",
                                  to_string(event), request.key,
                                  schema::to_string(request.status)),
                      request);
  }
  return commit(request, *next, actor, std::move(draft),
                std::forward<Mutation>(mutate));
}

template <typename Mutation>
schema::change_result_t state_machine::commit(
    schema::change_request_t& request,
    const schema::change_status_t next,
    const schema::actor_t& actor,
    schema::audit_event_draft_t draft,
    Mutation&& mutate) {
  draft.actor = actor;
  draft.resource = schema::resource_ref_t{
      .type = "change_request", .id = request.id, .name = request.key};
  draft.context.insert_or_assign("prior_state",
                                 make_status_value(request.status));
  draft.context.insert_or_assign("new_state", make_status_value(next));
  draft.context.insert_or_assign(
      "revision",
      schema::make_context_value(static_cast<int64_t>(request.revision + 1)));

  auto appended = ledger_.append(draft);
  if (!appended.ok()) {
    return make_error(static_cast<schema::error_code>(appended.code),
                      fmt::format("{}: {}", draft.action, appended.log),
                      request);
  }

  auto updated = request;
  mutate(updated);
  updated.status = next;
  ++updated.revision;
  updated.updated_at = clock_();
  updated.audit_event_ids.push_back(appended.sequence);
  save(updated);

  spdlog::info("Change request '{}' {} -> {} (ledger #{})", updated.key,
               schema::to_string(request.status),
               schema::to_string(updated.status), appended.sequence);
  request = std::move(updated);
  return make_success(request);
}

schema::change_result_t state_machine::load_for(
    const std::string_view key,
    const uint64_t expected_revision,
    const change_event_t event) const {
  auto request = load(schema::make_id(key));
  if (!request) {
    return make_error(schema::error_code::not_found,
                      fmt::format("change request '{}' not found", key));
  }
  if (request->revision != expected_revision) {
    return make_error(
        schema::error_code::conflict,
        fmt::format("change request '{}' is at revision {}, expected {}", key,
                    request->revision, expected_revision),
        request);
  }
  if (request->rollback.in_progress) {
    return make_error(
        schema::error_code::conflict,
        fmt::format("change request '{}' is being rolled back", key),
        request);
  }
  if (!next_status(request->status, event)) {
    return make_error(schema::error_code::invalid_transition,
                      fmt::format("cannot {} change request '{}' in {}",
                                  to_string(event), key,
                                  schema::to_string(request->status)),
                      request);
  }
  return make_success(std::move(*request));
}

std::optional<schema::change_request_t> state_machine::load(
    const schema::hash32_t& id) const {
  auto encoder = encoder_t{};
  auto key = schema::key::make_change_request_key(id);
  return store_.get<schema::change_request_t>(
      encoder, schema::bytes_view_t{key.data(), key.size()});
}

void state_machine::save(const schema::change_request_t& request) const {
  auto encoder = encoder_t{};
  auto key = schema::key::make_change_request_key(request.id);
  store_.put(encoder, schema::bytes_view_t{key.data(), key.size()}, request);
}

schema::duration_milliseconds_t state_machine::default_window(
    const std::optional<schema::change_risk_level_t>& risk_level) const {
  if (!risk_level) {
    return options_.medium_window;
  }
  switch (*risk_level) {
    case schema::change_risk_level_t::low:
      return options_.low_window;
    case schema::change_risk_level_t::medium:
      return options_.medium_window;
    case schema::change_risk_level_t::high:
      return options_.high_window;
    case schema::change_risk_level_t::critical:
      return options_.critical_window;
  }
  return options_.medium_window;
}

schema::change_result_t state_machine::create(
    const schema::actor_t& actor,
    const schema::change_request_draft_t& draft) {
  if (draft.key.empty() || draft.title.empty()) {
    return make_error(schema::error_code::validation_error,
                      "change request key and title are required");
  }

  return guarded([&] {
    auto id = schema::make_id(draft.key);
    if (load(id)) {
      return make_error(
          schema::error_code::already_exists,
          fmt::format("change request '{}' already exists", draft.key));
    }

    auto now = clock_();
    auto request = schema::change_request_t{};
    request.id = id;
    request.key = draft.key;
    request.type = draft.type;
    request.risk_level = draft.risk_level;
    request.title = draft.title;
    request.description = draft.description;
    request.rationale = draft.rationale;
    request.rollback_procedure = draft.rollback_procedure;
    request.change_details = draft.change_details;
    request.impact_notes = draft.impact_notes;
    request.workflow_id = draft.workflow_id;
    request.capability_id = draft.capability_id;
    request.policy_id = draft.policy_id;
    request.requested_by = actor;
    request.requested_at = now;
    request.requested_start = draft.requested_start;
    request.requested_end = draft.requested_end;
    request.verification.required = draft.verification_required;
    request.verification.criteria = draft.verification_criteria;
    request.rollback.required = draft.rollback_required;
    request.created_at = now;
    request.updated_at = now;

    auto event = make_draft(
        schema::audit_event_type_t::change_request_created,
        fmt::format("Change request '{}' created", request.key));
    event.actor = actor;
    event.resource = schema::resource_ref_t{
        .type = "change_request", .id = request.id, .name = request.key};
    event.context.emplace("new_state", make_status_value(request.status));
    event.context.emplace("change_type",
                          schema::make_context_value(
                              std::string{schema::to_string(request.type)}));
    if (request.risk_level) {
      event.context.emplace("risk_level",
                            schema::make_context_value(std::string{
                                schema::to_string(*request.risk_level)}));
    }
    auto appended = ledger_.append(event);
    if (!appended.ok()) {
      return make_error(static_cast<schema::error_code>(appended.code),
                        fmt::format("{}: {}", event.action, appended.log));
    }
    request.audit_event_ids.push_back(appended.sequence);
    save(request);
    spdlog::info("Change request '{}' created (ledger #{})", request.key,
                 appended.sequence);
    return make_success(std::move(request));
  });
}

schema::change_result_t state_machine::update_draft(
    const std::string_view key,
    const uint64_t expected_revision,
    const schema::actor_t& actor,
    const schema::change_request_draft_t& draft) {
  if (draft.title.empty()) {
    return make_error(schema::error_code::validation_error,
                      "change request title is required");
  }

  return guarded([&] {
    auto request = load(schema::make_id(key));
    if (!request) {
      return make_error(schema::error_code::not_found,
                        fmt::format("change request '{}' not found", key));
    }
    if (request->revision != expected_revision) {
      return make_error(
          schema::error_code::conflict,
          fmt::format("change request '{}' is at revision {}, expected {}",
                      key, request->revision, expected_revision),
          request);
    }
    if (request->status != schema::change_status_t::draft) {
      return make_error(schema::error_code::invalid_transition,
                        fmt::format("change request '{}' is {}; only drafts "
                                    "can be edited",
                                    key, schema::to_string(request->status)),
                        request);
    }

    auto event = make_draft(
        schema::audit_event_type_t::change_request_updated,
        fmt::format("Change request '{}' draft updated", request->key));
    event.actor = actor;
    event.resource = schema::resource_ref_t{
        .type = "change_request", .id = request->id, .name = request->key};
    event.context.emplace("revision", schema::make_context_value(
                                          static_cast<int64_t>(
                                              request->revision + 1)));
    auto appended = ledger_.append(event);
    if (!appended.ok()) {
      return make_error(static_cast<schema::error_code>(appended.code),
                        fmt::format("{}: {}", event.action, appended.log),
                        request);
    }

    request->type = draft.type;
    request->risk_level = draft.risk_level;
    request->title = draft.title;
    request->description = draft.description;
    request->rationale = draft.rationale;
    request->rollback_procedure = draft.rollback_procedure;
    request->change_details = draft.change_details;
    request->impact_notes = draft.impact_notes;
    request->requested_start = draft.requested_start;
    request->requested_end = draft.requested_end;
    request->verification.required = draft.verification_required;
    request->verification.criteria = draft.verification_criteria;
    request->rollback.required = draft.rollback_required;
    ++request->revision;
    request->updated_at = clock_();
    request->audit_event_ids.push_back(appended.sequence);
    save(*request);
    return make_success(std::move(*request));
  });
}

schema::change_result_t state_machine::approve_and_schedule(
    schema::change_request_t& request,
    const schema::actor_t& approver,
    const std::string& notes,
    const bool auto_approved) {
  auto now = clock_();
  auto approval = make_draft(
      schema::audit_event_type_t::change_approved,
      fmt::format("Change request '{}' approved", request.key));
  approval.context.emplace("auto_approved",
                           schema::make_context_value(auto_approved));
  auto approved = transition(
      request,
      auto_approved ? change_event_t::auto_approve : change_event_t::approve,
      approver, std::move(approval), [&](schema::change_request_t& updated) {
        updated.approval =
            schema::sign_off_t{.actor = approver, .at = now, .notes = notes};
        updated.auto_approved = auto_approved;
      });
  if (!approved.ok()) {
    return approved;
  }

  auto start = request.requested_start.value_or(now);
  auto end = request.requested_end.value_or(
      start + default_window(request.risk_level));
  auto scheduling = make_draft(
      schema::audit_event_type_t::change_scheduled,
      fmt::format("Change request '{}' scheduled", request.key));
  scheduling.context.emplace(
      "scheduled_start",
      schema::make_context_value(static_cast<int64_t>(start)));
  scheduling.context.emplace(
      "scheduled_end", schema::make_context_value(static_cast<int64_t>(end)));
  return transition(request, change_event_t::schedule, approver,
                    std::move(scheduling),
                    [&](schema::change_request_t& updated) {
                      updated.scheduled_start = start;
                      updated.scheduled_end = end;
                    });
}

schema::change_result_t state_machine::submit(const std::string_view key,
                                              const uint64_t expected_revision,
                                              const schema::actor_t& actor) {
  return guarded([&] {
    auto loaded = load_for(key, expected_revision, change_event_t::submit);
    if (!loaded.ok()) {
      return loaded;
    }
    auto request = std::move(*loaded.request);

    if (request.description.empty() || request.rationale.empty() ||
        !request.risk_level || request.rollback_procedure.empty()) {
      return make_error(schema::error_code::validation_error,
                        fmt::format("change request '{}' needs a description, "
                                    "rationale, risk level and rollback "
                                    "procedure before submission",
                                    key),
                        request);
    }
    auto now = clock_();
    auto start = request.requested_start.value_or(now);
    if (request.requested_end && *request.requested_end <= start) {
      return make_error(
          schema::error_code::validation_error,
          fmt::format("change request '{}' window ends before it starts", key),
          request);
    }

    auto submission = make_draft(
        schema::audit_event_type_t::change_request_submitted,
        fmt::format("Change request '{}' submitted", request.key));
    submission.context.emplace(
        "risk_level", schema::make_context_value(
                          std::string{schema::to_string(*request.risk_level)}));
    auto submitted = transition(
        request, change_event_t::submit, actor, std::move(submission),
        [&](schema::change_request_t& updated) { updated.submitted_at = now; });
    if (!submitted.ok() ||
        *request.risk_level != schema::change_risk_level_t::low ||
        !options_.auto_approve_low_risk) {
      return submitted;
    }
    return approve_and_schedule(request,
                                schema::make_system_actor("sentinel.change"),
                                "auto-approved: low risk", true);
  });
}

schema::change_result_t state_machine::start_review(
    const std::string_view key,
    const uint64_t expected_revision,
    const schema::actor_t& reviewer) {
  return guarded([&] {
    auto loaded =
        load_for(key, expected_revision, change_event_t::start_review);
    if (!loaded.ok()) {
      return loaded;
    }
    auto request = std::move(*loaded.request);
    auto now = clock_();
    return transition(
        request, change_event_t::start_review, reviewer,
        make_draft(schema::audit_event_type_t::change_request_reviewed,
                   fmt::format("Review of change request '{}' started",
                               request.key)),
        [&](schema::change_request_t& updated) {
          updated.reviewer = reviewer;
          updated.review_started_at = now;
        });
  });
}

schema::change_result_t state_machine::review(const std::string_view key,
                                              const uint64_t expected_revision,
                                              const schema::actor_t& reviewer,
                                              const std::string& notes) {
  return guarded([&] {
    auto loaded =
        load_for(key, expected_revision, change_event_t::complete_review);
    if (!loaded.ok()) {
      return loaded;
    }
    auto request = std::move(*loaded.request);
    if (request.reviewer && request.reviewer->id != reviewer.id) {
      return make_error(
          schema::error_code::validation_error,
          fmt::format("change request '{}' is under review by '{}'", key,
                      request.reviewer->name),
          request);
    }
    auto now = clock_();
    auto event = make_draft(
        schema::audit_event_type_t::change_request_reviewed,
        fmt::format("Review of change request '{}' completed", request.key));
    event.context.emplace("review_completed", schema::make_context_value(true));
    return transition(request, change_event_t::complete_review, reviewer,
                      std::move(event),
                      [&](schema::change_request_t& updated) {
                        updated.review = schema::sign_off_t{
                            .actor = reviewer, .at = now, .notes = notes};
                      });
  });
}

schema::change_result_t state_machine::approve(const std::string_view key,
                                               const uint64_t expected_revision,
                                               const schema::actor_t& approver,
                                               const std::string& notes) {
  return guarded([&] {
    auto loaded = load_for(key, expected_revision, change_event_t::approve);
    if (!loaded.ok()) {
      return loaded;
    }
    auto request = std::move(*loaded.request);
    if (!request.review) {
      return make_error(
          schema::error_code::invalid_transition,
          fmt::format("change request '{}' has no completed review", key),
          request);
    }
    if (request.review->actor.id == approver.id) {
      return make_error(
          schema::error_code::validation_error,
          fmt::format("change request '{}' cannot be approved by its reviewer",
                      key),
          request);
    }
    return approve_and_schedule(request, approver, notes, false);
  });
}

schema::change_result_t state_machine::reject(const std::string_view key,
                                              const uint64_t expected_revision,
                                              const schema::actor_t& actor,
                                              const std::string& reason) {
  return guarded([&] {
    auto loaded = load_for(key, expected_revision, change_event_t::reject);
    if (!loaded.ok()) {
      return loaded;
    }
    auto request = std::move(*loaded.request);
    if (reason.empty()) {
      return make_error(schema::error_code::validation_error,
                        "a rejection reason is required", request);
    }
    auto now = clock_();
    auto event =
        make_draft(schema::audit_event_type_t::change_rejected,
                   fmt::format("Change request '{}' rejected", request.key));
    event.context.emplace("reason", schema::make_context_value(reason));
    return transition(request, change_event_t::reject, actor, std::move(event),
                      [&](schema::change_request_t& updated) {
                        updated.rejection = schema::sign_off_t{
                            .actor = actor, .at = now, .notes = reason};
                      });
  });
}

schema::change_result_t state_machine::cancel(const std::string_view key,
                                              const uint64_t expected_revision,
                                              const schema::actor_t& actor,
                                              const std::string& reason) {
  return guarded([&] {
    auto loaded = load_for(key, expected_revision, change_event_t::cancel);
    if (!loaded.ok()) {
      return loaded;
    }
    auto request = std::move(*loaded.request);
    auto now = clock_();
    auto event =
        make_draft(schema::audit_event_type_t::change_cancelled,
                   fmt::format("Change request '{}' cancelled", request.key));
    event.context.emplace("reason", schema::make_context_value(reason));
    return transition(request, change_event_t::cancel, actor, std::move(event),
                      [&](schema::change_request_t& updated) {
                        updated.cancellation = schema::sign_off_t{
                            .actor = actor, .at = now, .notes = reason};
                      });
  });
}

schema::change_result_t state_machine::reschedule(
    const std::string_view key,
    const uint64_t expected_revision,
    const schema::actor_t& actor,
    const schema::timestamp_milliseconds_t start,
    const schema::timestamp_milliseconds_t end) {
  if (end <= start) {
    return make_error(schema::error_code::validation_error,
                      "execution window must end after it starts");
  }
  return guarded([&] {
    auto loaded = load_for(key, expected_revision, change_event_t::reschedule);
    if (!loaded.ok()) {
      return loaded;
    }
    auto request = std::move(*loaded.request);
    auto event =
        make_draft(schema::audit_event_type_t::change_scheduled,
                   fmt::format("Change request '{}' rescheduled", request.key));
    event.context.emplace("rescheduled", schema::make_context_value(true));
    event.context.emplace(
        "scheduled_start",
        schema::make_context_value(static_cast<int64_t>(start)));
    event.context.emplace(
        "scheduled_end", schema::make_context_value(static_cast<int64_t>(end)));
    return transition(request, change_event_t::reschedule, actor,
                      std::move(event),
                      [&](schema::change_request_t& updated) {
                        updated.scheduled_start = start;
                        updated.scheduled_end = end;
                      });
  });
}

schema::change_result_t state_machine::begin_execution(
    const std::string_view key,
    const uint64_t expected_revision,
    const schema::actor_t& actor,
    const schema::context_map_t& context) {
  auto prepared = guarded([&] {
    auto loaded =
        load_for(key, expected_revision, change_event_t::begin_execution);
    if (!loaded.ok()) {
      return loaded;
    }
    const auto& request = *loaded.request;
    if (!within_window(request, clock_())) {
      return make_error(
          schema::error_code::window_expired,
          fmt::format("change request '{}' is outside its execution window",
                      key),
          request);
    }
    return loaded;
  });
  if (!prepared.ok()) {
    return prepared;
  }

  const auto& request = *prepared.request;
  auto gate_context = context;
  gate_context.try_emplace("operation", schema::make_context_value("write"));
  gate_context.try_emplace("change_key",
                           schema::make_context_value(request.key));
  gate_context.try_emplace(
      "change_type",
      schema::make_context_value(std::string{schema::to_string(request.type)}));
  if (request.risk_level) {
    gate_context.try_emplace("risk_level",
                             schema::make_context_value(std::string{
                                 schema::to_string(*request.risk_level)}));
  }
  auto decision = evaluator_.evaluate(gate::evaluation_request{
      .gate_key = options_.production_gate_key,
      .actor = actor,
      .context = std::move(gate_context),
      .request_id = fmt::format("{}#{}", request.key, request.revision),
      .correlation_id = request.key});

  return guarded([&] {
    auto loaded =
        load_for(key, expected_revision, change_event_t::begin_execution);
    if (!loaded.ok()) {
      return loaded;
    }
    auto current = std::move(*loaded.request);
    auto now = clock_();
    if (!within_window(current, now)) {
      return make_error(
          schema::error_code::window_expired,
          fmt::format("execution window of change request '{}' closed while "
                      "the production gate was evaluated",
                      key),
          current);
    }

    if (decision.permits_execution()) {
      auto event = make_draft(
          schema::audit_event_type_t::change_execution_started,
          fmt::format("Change request '{}' execution started", current.key));
      event.context.emplace("gate_outcome",
                            schema::make_context_value(std::string{
                                schema::to_string(decision.outcome)}));
      event.context.emplace("gate_execution_id",
                            schema::make_context_value(
                                schema::to_hex(decision.execution_id)));
      auto started = transition(
          current, change_event_t::begin_execution, actor, std::move(event),
          [&](schema::change_request_t& updated) {
            updated.execution.started_at = now;
            updated.execution.gate_execution_id = decision.execution_id;
          });
      started.gate_execution_id = decision.execution_id;
      return started;
    }

    auto event = make_draft(
        schema::audit_event_type_t::change_execution_blocked,
        fmt::format("Change request '{}' execution blocked by gate '{}'",
                    current.key, options_.production_gate_key),
        schema::audit_outcome_t::blocked);
    event.context.emplace("gate_outcome",
                          schema::make_context_value(std::string{
                              schema::to_string(decision.outcome)}));
    event.context.emplace(
        "gate_execution_id",
        schema::make_context_value(schema::to_hex(decision.execution_id)));
    auto blocked = transition(
        current, change_event_t::block_execution, actor, std::move(event),
        [&](schema::change_request_t& updated) {
          updated.execution.gate_execution_id = decision.execution_id;
        });
    blocked.gate_execution_id = decision.execution_id;
    if (!blocked.ok()) {
      return blocked;
    }
    spdlog::warn("Change request '{}' blocked at gate '{}': {}", current.key,
                 options_.production_gate_key,
                 schema::to_string(decision.outcome));
    blocked.code = schema::to_code(schema::error_code::execution_blocked);
    blocked.log = fmt::format("production gate returned {}",
                              schema::to_string(decision.outcome));
    if (!decision.log.empty()) {
      blocked.log += fmt::format(": {}", decision.log);
    }
    return blocked;
  });
}

schema::change_result_t state_machine::complete_execution(
    const std::string_view key,
    const uint64_t expected_revision,
    const schema::actor_t& actor,
    const bool success,
    const std::string& notes) {
  auto result = guarded([&] {
    auto loaded =
        load_for(key, expected_revision, change_event_t::complete_success);
    if (!loaded.ok()) {
      return loaded;
    }
    auto request = std::move(*loaded.request);
    auto now = clock_();
    auto record = [&](schema::change_request_t& updated) {
      updated.execution.completed_at = now;
      updated.execution.success = success;
      updated.execution.notes = notes;
    };

    if (success) {
      auto event = make_draft(
          schema::audit_event_type_t::change_execution_completed,
          fmt::format("Change request '{}' execution completed", request.key));
      event.context.emplace(
          "verification_required",
          schema::make_context_value(request.verification.required));
      return transition(request,
                        request.verification.required
                            ? change_event_t::require_verification
                            : change_event_t::complete_success,
                        actor, std::move(event), record);
    }

    auto event = make_draft(
        schema::audit_event_type_t::change_execution_failed,
        fmt::format("Change request '{}' execution failed", request.key),
        schema::audit_outcome_t::failure);
    event.context.emplace("notes", schema::make_context_value(notes));
    return transition(request, change_event_t::complete_failure, actor,
                      std::move(event), record);
  });
  if (!result.ok() || success) {
    return result;
  }
  return rollback(key, result.request->revision, actor,
                  fmt::format("execution failed: {}", notes));
}

schema::change_result_t state_machine::verify(
    const std::string_view key,
    const uint64_t expected_revision,
    const schema::actor_t& actor,
    const std::vector<schema::verification_result_t>& results) {
  auto result = guarded([&] {
    auto loaded = load_for(key, expected_revision, change_event_t::verify_pass);
    if (!loaded.ok()) {
      return loaded;
    }
    auto request = std::move(*loaded.request);

    auto failed = std::set<std::string>{};
    for (const auto& criterion : request.verification.criteria) {
      auto passed = std::ranges::any_of(results, [&](const auto& reported) {
        return reported.criterion_key == criterion.key && reported.passed;
      });
      if (!passed) {
        failed.insert(criterion.key);
      }
    }
    for (const auto& reported : results) {
      if (!reported.passed) {
        failed.insert(reported.criterion_key);
      }
    }
    auto passed = failed.empty();

    auto now = clock_();
    auto event = make_draft(
        schema::audit_event_type_t::change_verified,
        fmt::format("Change request '{}' verification {}", request.key,
                    passed ? "passed" : "failed"),
        passed ? schema::audit_outcome_t::success
               : schema::audit_outcome_t::failure);
    event.context.emplace("passed", schema::make_context_value(passed));
    if (!passed) {
      event.context.emplace("failed_criteria",
                            schema::make_context_value(
                                fmt::format("{}", fmt::join(failed, ","))));
    }
    return transition(
        request,
        passed ? change_event_t::verify_pass : change_event_t::verify_fail,
        actor, std::move(event), [&](schema::change_request_t& updated) {
          updated.verification.completed = true;
          updated.verification.passed = passed;
          updated.verification.results = results;
          updated.verification.verified_at = now;
        });
  });
  if (!result.ok() ||
      result.request->status != schema::change_status_t::failed) {
    return result;
  }
  return rollback(key, result.request->revision, actor, "verification failed");
}

schema::change_result_t state_machine::rollback(
    const std::string_view key,
    const uint64_t expected_revision,
    const schema::actor_t& actor,
    const std::string& reason) {
  auto claimed = guarded([&] {
    auto loaded = load_for(key, expected_revision, change_event_t::rollback);
    if (!loaded.ok()) {
      return loaded;
    }
    auto request = std::move(*loaded.request);
    auto now = clock_();
    auto event = make_draft(
        schema::audit_event_type_t::change_rollback_started,
        fmt::format("Rollback of change request '{}' started", request.key));
    event.context.emplace("reason", schema::make_context_value(reason));
    return commit(request, request.status, actor, std::move(event),
                  [&](schema::change_request_t& updated) {
                    updated.rollback.in_progress = true;
                    updated.rollback.started_at = now;
                  });
  });
  if (!claimed.ok()) {
    return claimed;
  }

  auto successful = run_rollback(rollback_executor_, *claimed.request);

  auto result = guarded([&] {
    auto request = load(claimed.request->id);
    if (!request || request->revision != claimed.request->revision ||
        !request->rollback.in_progress) {
      return make_error(
          schema::error_code::conflict,
          fmt::format("rollback claim on change request '{}' was lost", key),
          std::move(request));
    }
    auto now = clock_();
    auto event = make_draft(
        schema::audit_event_type_t::change_rolled_back,
        fmt::format("Change request '{}' rolled back", request->key),
        successful ? schema::audit_outcome_t::success
                   : schema::audit_outcome_t::failure);
    event.context.emplace("reason", schema::make_context_value(reason));
    event.context.emplace("rollback_successful",
                          schema::make_context_value(successful));
    return transition(*request, change_event_t::rollback, actor,
                      std::move(event),
                      [&](schema::change_request_t& updated) {
                        updated.rollback.in_progress = false;
                        updated.rollback.executed = true;
                        updated.rollback.executed_at = now;
                        updated.rollback.successful = successful;
                      });
  });
  if (!result.ok()) {
    spdlog::critical(
        "Rollback of change request '{}' ran but was not recorded: {}", key,
        result.log);
    return result;
  }

  const auto& request = *result.request;
  auto sequence = request.audit_event_ids.back();
  notify::notify_best_effort(
      notifier_,
      notify::notification{
          .kind = notify::notification_kind_t::rollback_executed,
          .subject_id = request.id,
          .subject_key = request.key,
          .message = reason,
          .ledger_sequence = sequence});
  if (successful) {
    return result;
  }

  spdlog::critical("Rollback procedure for change request '{}' failed",
                   request.key);
  notify::notify_best_effort(
      notifier_,
      notify::notification{.kind = notify::notification_kind_t::rollback_failed,
                           .critical = true,
                           .subject_id = request.id,
                           .subject_key = request.key,
                           .message = reason,
                           .ledger_sequence = sequence});
  result.code = schema::to_code(schema::error_code::rollback_failure);
  result.log = fmt::format("rollback procedure for '{}' failed", request.key);
  return result;
}

std::optional<schema::change_request_t> state_machine::find(
    const std::string_view key) const {
  auto lock = std::scoped_lock{mutex_};
  return load(schema::make_id(key));
}

std::vector<schema::change_request_t> state_machine::list(
    const std::optional<schema::change_status_t>& status,
    const std::optional<schema::change_risk_level_t>& risk_level) const {
  auto encoder = encoder_t{};
  auto prefix = schema::key::make_prefix(schema::key::kChangeRequestPrefix);
  auto requests = std::vector<schema::change_request_t>{};
  auto lock = std::scoped_lock{mutex_};
  for (const auto& [key, value] : store_.list_by_prefix(
           schema::bytes_view_t{prefix.data(), prefix.size()})) {
    auto request = encoder.try_decode<schema::change_request_t>(
        schema::bytes_view_t{value.data(), value.size()});
    if (!request) {
      spdlog::warn("Failed decoding change request record");
      continue;
    }
    if ((status && request->status != *status) ||
        (risk_level && request->risk_level != *risk_level)) {
      continue;
    }
    requests.push_back(std::move(*request));
  }
  std::ranges::sort(requests, [](const auto& lhs, const auto& rhs) {
    if (lhs.created_at != rhs.created_at) {
      return lhs.created_at > rhs.created_at;
    }
    return lhs.key < rhs.key;
  });
  return requests;
}

}  // namespace sentinel::change
