#include <sentinel/blake3/hash.hpp>
#include <sentinel/gate/evaluator.hpp>
#include <sentinel/gate/fetch_workers.hpp>
#include <sentinel/gate/outcome_resolver.hpp>
#include <sentinel/schema/key/builder.hpp>
#include <sentinel/schema/key/keys.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <exception>
#include <functional>
#include <future>
#include <random>
#include <span>
#include <thread>

namespace sentinel::gate {

namespace {

using encoder_t =
    schema::encoding::encoder<schema::encoding::scale_encoder_tag>;
using steady_clock = std::chrono::steady_clock;

enum class fetch_status : uint8_t {
  ok = 0,
  failed = 1,
  timed_out = 2,
};

template <typename T>
struct fetch_result final {
  fetch_status status{fetch_status::failed};
  std::optional<T> value;
  std::string error;
};

/// Run `fetch` on a worker thread, retrying failures with exponential
/// backoff. Every wait and sleep is bounded by `deadline`; a worker still
/// running at the deadline is left to `workers`, which joins it.
template <typename T>
fetch_result<T> fetch_with_retry(fetch_workers& workers,
                                 std::function<T()> fetch,
                                 const steady_clock::time_point deadline,
                                 const evaluator_options& options,
                                 const std::string_view label) {
  auto result = fetch_result<T>{};
  auto attempts = std::max<uint32_t>(options.retry_attempts, 1);
  auto backoff = options.initial_backoff;

  for (auto attempt = uint32_t{1}; attempt <= attempts; ++attempt) {
    if (steady_clock::now() >= deadline) {
      result.status = fetch_status::timed_out;
      result.error = fmt::format("{} timed out", label);
      return result;
    }

    auto promise = std::make_shared<std::promise<T>>();
    auto future = promise->get_future();
    auto spawned = workers.spawn([promise, fetch]() {
      try {
        promise->set_value(fetch());
      } catch (const std::exception&) {
        promise->set_exception(std::current_exception());
      }
    });

    if (!spawned) {
      result.error =
          fmt::format("{} failed: no fetch worker available", label);
    } else if (future.wait_until(deadline) != std::future_status::ready) {
      result.status = fetch_status::timed_out;
      result.error = fmt::format("{} timed out", label);
      return result;
    } else {
      try {
        result.value = future.get();
        result.status = fetch_status::ok;
        return result;
      } catch (const std::exception& e) {
        result.error = fmt::format("{} failed: {}", label, e.what());
        spdlog::warn("Policy source {} attempt {}/{} failed: {}", label,
                     attempt, attempts, e.what());
      }
    }

    if (attempt == attempts) {
      break;
    }
    auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - steady_clock::now());
    auto pause = std::min({backoff, remaining, options.backoff_cap});
    if (pause.count() > 0) {
      std::this_thread::sleep_for(pause);
    }
    backoff = std::min(backoff * 2, options.backoff_cap);
  }

  result.status = fetch_status::failed;
  return result;
}

schema::audit_outcome_t to_audit_outcome(const schema::gate_outcome_t value) {
  switch (value) {
    case schema::gate_outcome_t::allow:
      return schema::audit_outcome_t::success;
    case schema::gate_outcome_t::warning:
    case schema::gate_outcome_t::degrade:
      return schema::audit_outcome_t::warning;
    case schema::gate_outcome_t::block:
    case schema::gate_outcome_t::hard_stop:
      return schema::audit_outcome_t::blocked;
  }
  return schema::audit_outcome_t::error;
}

}  // namespace

struct evaluator::evaluation_state final {
  const evaluation_request& request;
  schema::gate_execution_t execution;
  std::optional<schema::enforcement_gate_t> gate;
  bool is_write{true};
  steady_clock::time_point started;
};

evaluator::evaluator(ledger::ledger& ledger,
                     storage::rocksdb_storage_t& store,
                     policy_source source,
                     common::clock_source_t clock,
                     evaluator_options options)
    : ledger_{ledger},
      store_{store},
      source_{std::make_shared<const policy_source>(std::move(source))},
      clock_{std::move(clock)},
      options_{options},
      workers_{options.max_fetch_workers} {
  auto device = std::random_device{};
  for (auto& byte : instance_salt_) {
    byte = static_cast<uint8_t>(device());
  }
}

schema::gate_decision_t evaluator::evaluate(
    const std::string_view gate_key,
    const schema::actor_t& actor,
    const schema::context_map_t& context,
    const std::optional<std::chrono::milliseconds> timeout) {
  return evaluate(evaluation_request{.gate_key = std::string{gate_key},
                                     .actor = actor,
                                     .context = context,
                                     .timeout = timeout});
}

schema::gate_decision_t evaluator::evaluate(const evaluation_request& request) {
  try {
    return run(request);
  } catch (const std::exception& e) {
    spdlog::error("Gate '{}' evaluation failed: {}", request.gate_key,
                  e.what());
    return schema::gate_decision_t{
        .outcome = schema::gate_outcome_t::block,
        .log = fmt::format("evaluation failed: {}", e.what())};
  }
}

schema::gate_decision_t evaluator::run(const evaluation_request& request) {
  auto started = steady_clock::now();
  auto deadline = started + request.timeout.value_or(options_.default_timeout);
  auto state = evaluation_state{.request = request,
                                .is_write = is_write_operation(request.context),
                                .started = started};
  auto& execution = state.execution;
  execution.gate_id = schema::make_id(request.gate_key);
  execution.gate_key = request.gate_key;
  execution.request_id = request.request_id;
  execution.correlation_id = request.correlation_id;
  execution.actor = request.actor;
  execution.executed_at = clock_();
  execution.evidence.emplace_back("operation",
                                  state.is_write ? "write" : "read");

  auto source = source_;
  auto gate_fetch =
      fetch_with_retry<std::optional<schema::enforcement_gate_t>>(
          workers_,
          [source, key = request.gate_key]() { return source->find_gate(key); },
          deadline, options_, "find_gate");
  if (gate_fetch.status != fetch_status::ok) {
    if (gate_fetch.status == fetch_status::timed_out) {
      execution.evidence.emplace_back("timeout", "find_gate");
    }
    execution.errors.push_back(gate_fetch.error);
    execution.outcome = schema::gate_outcome_t::block;
    return finish(state);
  }
  if (!gate_fetch.value->has_value()) {
    execution.errors.push_back(
        fmt::format("unknown gate '{}'", request.gate_key));
    execution.outcome = schema::gate_outcome_t::block;
    return finish(state);
  }
  if (!(*gate_fetch.value)->active) {
    execution.errors.push_back(
        fmt::format("gate '{}' is inactive", request.gate_key));
    execution.outcome = schema::gate_outcome_t::block;
    return finish(state);
  }
  state.gate = std::move(**gate_fetch.value);
  const auto& gate = *state.gate;
  execution.gate_id = gate.id;

  if (gate.capture_inputs) {
    execution.evidence.emplace_back("input.gate_type",
                                    std::string{schema::to_string(gate.type)});
    execution.evidence.emplace_back("input.actor", request.actor.name);
  }
  if (gate.capture_context) {
    for (const auto& [name, value] : request.context) {
      execution.evidence.emplace_back("context." + name,
                                      schema::to_display_string(value));
    }
  }
  if (gate.capture_outputs) {
    for (const auto& [name, value] : request.outputs) {
      execution.evidence.emplace_back("output." + name,
                                      schema::to_display_string(value));
    }
  }

  auto break_glass_active = false;
  if (request.break_glass_id) {
    auto grant_fetch = fetch_with_retry<std::optional<schema::break_glass_t>>(
        workers_, [source, id = *request.break_glass_id]() {
          return source->find_break_glass(id);
        },
        deadline, options_, "find_break_glass");
    if (grant_fetch.status == fetch_status::ok &&
        grant_fetch.value->has_value() &&
        schema::is_usable(**grant_fetch.value, request.actor, gate.workflow_id,
                          execution.executed_at)) {
      break_glass_active = true;
      execution.evidence.emplace_back("break_glass",
                                      (*grant_fetch.value)->key);
    } else {
      execution.errors.push_back(
          fmt::format("break-glass {} is not usable and was ignored",
                      schema::to_hex(*request.break_glass_id)));
    }
  }

  auto degrade = false;
  if (gate.check_kill_switches || break_glass_active) {
    auto query = kill_switch_query{.workflow_id = gate.workflow_id,
                                   .capability_id = gate.capability_id};
    auto switch_fetch = fetch_with_retry<std::vector<schema::kill_switch_t>>(
        workers_,
        [source, query]() { return source->active_kill_switches(query); },
        deadline, options_, "active_kill_switches");
    if (switch_fetch.status != fetch_status::ok) {
      if (switch_fetch.status == fetch_status::timed_out) {
        execution.evidence.emplace_back("timeout", "active_kill_switches");
      }
      execution.errors.push_back(switch_fetch.error);
      execution.outcome = conservative_outcome(gate.mode);
      return finish(state);
    }
    auto switches = std::vector<schema::kill_switch_t>{};
    for (auto& kill_switch : *switch_fetch.value) {
      if (in_scope(kill_switch, query)) {
        switches.push_back(std::move(kill_switch));
      }
    }
    auto verdict = check_kill_switches(switches, state.is_write);
    execution.kill_switch_checks = std::move(verdict.checks);
    if (verdict.outcome) {
      execution.evidence.emplace_back("kill_switch", verdict.reason);
      execution.outcome = *verdict.outcome;
      return finish(state);
    }
    degrade = verdict.degrade;
  }

  auto outcome = schema::gate_outcome_t::allow;
  if (break_glass_active) {
    execution.evidence.emplace_back("policy_phase", "skipped by break-glass");
  } else {
    auto policy_fetch =
        fetch_with_retry<std::vector<schema::control_policy_t>>(
            workers_,
            [source, id = gate.id]() { return source->active_policies(id); },
            deadline, options_, "active_policies");
    if (policy_fetch.status != fetch_status::ok) {
      if (policy_fetch.status == fetch_status::timed_out) {
        execution.evidence.emplace_back("timeout", "active_policies");
      }
      execution.errors.push_back(policy_fetch.error);
      execution.outcome = conservative_outcome(gate.mode);
      return finish(state);
    }
    auto policies = std::vector<schema::control_policy_t>{};
    for (auto& policy : *policy_fetch.value) {
      if (policy.active) {
        policies.push_back(std::move(policy));
      }
    }
    auto verdict =
        evaluate_policies(std::move(policies), request.context,
                          gate.require_all_pass);
    execution.policy_results = std::move(verdict.results);
    execution.errors.insert(execution.errors.end(), verdict.errors.begin(),
                            verdict.errors.end());
    outcome = apply_enforcement_mode(verdict.outcome, gate.mode);
  }

  if (degrade) {
    execution.evidence.emplace_back(
        "degrade", state.is_write ? "applied" : "recorded for read");
  }
  execution.outcome = apply_degrade(outcome, degrade, state.is_write);
  return finish(state);
}

schema::gate_decision_t evaluator::finish(evaluation_state& state) {
  auto& execution = state.execution;
  const auto& request = state.request;
  execution.duration = static_cast<schema::duration_milliseconds_t>(
      std::chrono::duration_cast<std::chrono::milliseconds>(
          steady_clock::now() - state.started)
          .count());
  execution.id = make_execution_id(request, execution.executed_at);
  while (execution_exists(execution.id)) {
    spdlog::warn("Gate execution id {} already recorded; minting another",
                 schema::to_hex(execution.id));
    execution.id = make_execution_id(request, execution.executed_at);
  }

  auto draft = schema::audit_event_draft_t{
      .type = schema::is_blocking(execution.outcome)
                  ? schema::audit_event_type_t::gate_blocked
                  : schema::audit_event_type_t::gate_executed,
      .action = fmt::format("Gate '{}' evaluated: {}", execution.gate_key,
                            schema::to_string(execution.outcome)),
      .actor = request.actor,
      .resource = schema::resource_ref_t{.type = "enforcement_gate",
                                         .id = execution.gate_id,
                                         .name = execution.gate_key},
      .outcome = to_audit_outcome(execution.outcome),
      .context = {
          {"execution_id",
           schema::make_context_value(schema::to_hex(execution.id))},
          {"outcome", schema::make_context_value(
                          std::string{schema::to_string(execution.outcome)})},
          {"operation", schema::make_context_value(
                            state.is_write ? "write" : "read")},
          {"policies_evaluated",
           schema::make_context_value(
               static_cast<int64_t>(execution.policy_results.size()))},
          {"kill_switches_checked",
           schema::make_context_value(
               static_cast<int64_t>(execution.kill_switch_checks.size()))},
          {"errors", schema::make_context_value(
                         static_cast<int64_t>(execution.errors.size()))},
      }};
  if (state.gate) {
    draft.context.emplace(
        "gate_type", schema::make_context_value(
                         std::string{schema::to_string(state.gate->type)}));
    draft.context.emplace(
        "mode", schema::make_context_value(
                    std::string{schema::to_string(state.gate->mode)}));
  }

  auto appended = ledger_.append(draft);
  if (appended.ok()) {
    execution.ledger_sequence = appended.sequence;
  } else {
    spdlog::error("Gate '{}' could not be recorded: {}", execution.gate_key,
                  appended.log);
    execution.errors.push_back("ledger: " + appended.log);
    execution.outcome = schema::gate_outcome_t::block;
  }

  auto encoder = encoder_t{};
  auto key = schema::key::make_gate_execution_key(execution.id);
  store_.put(encoder, schema::bytes_view_t{key.data(), key.size()}, execution);

  if (schema::is_blocking(execution.outcome)) {
    spdlog::warn("Gate '{}' {} for {} ({})", execution.gate_key,
                 schema::to_string(execution.outcome), request.actor.name,
                 schema::to_hex(execution.id));
  } else {
    spdlog::debug("Gate '{}' {} for {} in {}ms", execution.gate_key,
                  schema::to_string(execution.outcome), request.actor.name,
                  execution.duration);
  }

  auto log = std::string{};
  for (const auto& error : execution.errors) {
    if (!log.empty()) {
      log += "; ";
    }
    log += error;
  }

  return schema::gate_decision_t{
      .outcome = execution.outcome,
      .execution_id = execution.id,
      .ledger_sequence = execution.ledger_sequence,
      .gate_type = state.gate ? std::optional{state.gate->type} : std::nullopt,
      .tolerate_warning = state.gate && state.gate->tolerate_warning,
      .log = std::move(log)};
}

schema::hash32_t evaluator::make_execution_id(
    const evaluation_request& request,
    const schema::timestamp_milliseconds_t at) {
  auto b = schema::key::builder{};
  b.write(std::string_view{"GATE_EXECUTION|"});
  b.write(std::span<const uint8_t>{instance_salt_});
  b.write(std::string_view{request.gate_key});
  b.write(std::string_view{"|"});
  b.write(std::string_view{request.request_id.value_or("")});
  b.write(at);
  b.write(execution_counter_.fetch_add(1));
  return blake3::hash(std::span<const uint8_t>{b.data.data(), b.data.size()});
}

bool evaluator::execution_exists(const schema::hash32_t& execution_id) const {
  auto key = schema::key::make_gate_execution_key(execution_id);
  return store_.get_raw(schema::bytes_view_t{key.data(), key.size()})
      .has_value();
}

std::optional<schema::gate_execution_t> evaluator::find_execution(
    const schema::hash32_t& execution_id) const {
  auto encoder = encoder_t{};
  auto key = schema::key::make_gate_execution_key(execution_id);
  return store_.get<schema::gate_execution_t>(
      encoder, schema::bytes_view_t{key.data(), key.size()});
}

}  // namespace sentinel::gate
