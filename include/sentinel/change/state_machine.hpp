#pragma once

#include <sentinel/change/transitions.hpp>
#include <sentinel/common/clock.hpp>
#include <sentinel/gate/evaluator.hpp>
#include <sentinel/ledger/ledger.hpp>
#include <sentinel/notify/notifier.hpp>
#include <sentinel/schema/audit_event.hpp>
#include <sentinel/schema/change_request.hpp>
#include <sentinel/schema/change_result.hpp>
#include <sentinel/storage/rocksdb/storage.hpp>

#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace sentinel::change {

struct state_machine_options final {
  // Default execution window per risk level, when the draft asks for none.
  schema::duration_milliseconds_t low_window{24 * 60 * 60 * 1000};
  schema::duration_milliseconds_t medium_window{8 * 60 * 60 * 1000};
  schema::duration_milliseconds_t high_window{4 * 60 * 60 * 1000};
  schema::duration_milliseconds_t critical_window{2 * 60 * 60 * 1000};
  bool auto_approve_low_risk{true};
  std::string production_gate_key{"production_change"};
};

/// Performs the request's rollback procedure. Returns false, or throws
/// std::exception, when the procedure failed.
using rollback_executor_t =
    std::function<bool(const schema::change_request_t&)>;

/// Lifecycle of governed production changes.
///
/// Every operation names the revision the caller last observed; a stale
/// revision fails with `conflict` and leaves the record untouched. Each state
/// change appends one ledger event and records its sequence on the request.
/// The production gate, the rollback executor and notifications run without
/// the state machine's lock held.
class state_machine final {
 public:
  state_machine(ledger::ledger& ledger,
                storage::rocksdb_storage_t& store,
                gate::evaluator& evaluator,
                common::clock_source_t clock,
                state_machine_options options = {},
                rollback_executor_t rollback_executor = {},
                notify::notifier_t notifier = {});

  schema::change_result_t create(const schema::actor_t& actor,
                                 const schema::change_request_draft_t& draft);
  schema::change_result_t update_draft(
      const std::string_view key,
      const uint64_t expected_revision,
      const schema::actor_t& actor,
      const schema::change_request_draft_t& draft);

  /// DRAFT to SUBMITTED. LOW risk continues through APPROVED to SCHEDULED.
  schema::change_result_t submit(const std::string_view key,
                                 const uint64_t expected_revision,
                                 const schema::actor_t& actor);
  schema::change_result_t start_review(const std::string_view key,
                                       const uint64_t expected_revision,
                                       const schema::actor_t& reviewer);
  schema::change_result_t review(const std::string_view key,
                                 const uint64_t expected_revision,
                                 const schema::actor_t& reviewer,
                                 const std::string& notes);
  /// PENDING_APPROVAL through APPROVED to SCHEDULED.
  schema::change_result_t approve(const std::string_view key,
                                  const uint64_t expected_revision,
                                  const schema::actor_t& approver,
                                  const std::string& notes);
  schema::change_result_t reject(const std::string_view key,
                                 const uint64_t expected_revision,
                                 const schema::actor_t& actor,
                                 const std::string& reason);
  schema::change_result_t cancel(const std::string_view key,
                                 const uint64_t expected_revision,
                                 const schema::actor_t& actor,
                                 const std::string& reason);
  schema::change_result_t reschedule(
      const std::string_view key,
      const uint64_t expected_revision,
      const schema::actor_t& actor,
      const schema::timestamp_milliseconds_t start,
      const schema::timestamp_milliseconds_t end);

  /// Checks the window, asks the production gate, then checks the window
  /// again. A refusal moves the request back to APPROVED and returns
  /// `execution_blocked`.
  schema::change_result_t begin_execution(
      const std::string_view key,
      const uint64_t expected_revision,
      const schema::actor_t& actor,
      const schema::context_map_t& context = {});
  /// A failed execution is rolled back automatically.
  schema::change_result_t complete_execution(const std::string_view key,
                                             const uint64_t expected_revision,
                                             const schema::actor_t& actor,
                                             const bool success,
                                             const std::string& notes);
  /// Every criterion must be reported and passing; otherwise the change is
  /// rolled back automatically.
  schema::change_result_t verify(
      const std::string_view key,
      const uint64_t expected_revision,
      const schema::actor_t& actor,
      const std::vector<schema::verification_result_t>& results);
  /// Claims the request (CHANGE_ROLLBACK_STARTED, one revision) before the
  /// executor runs, then records CHANGE_ROLLED_BACK. While claimed, every
  /// other operation on the request fails with `conflict`.
  schema::change_result_t rollback(const std::string_view key,
                                   const uint64_t expected_revision,
                                   const schema::actor_t& actor,
                                   const std::string& reason);

  std::optional<schema::change_request_t> find(
      const std::string_view key) const;
  /// Requests matching every given filter, newest first.
  std::vector<schema::change_request_t> list(
      const std::optional<schema::change_status_t>& status = std::nullopt,
      const std::optional<schema::change_risk_level_t>& risk_level =
          std::nullopt) const;

 private:
  template <typename Operation>
  schema::change_result_t guarded(Operation&& operation);

  template <typename Mutation>
  schema::change_result_t transition(schema::change_request_t& request,
                                     const change_event_t event,
                                     const schema::actor_t& actor,
                                     schema::audit_event_draft_t draft,
                                     Mutation&& mutate);
  // Appends the event and saves the request at `next`, bumping the revision.
  template <typename Mutation>
  schema::change_result_t commit(schema::change_request_t& request,
                                 const schema::change_status_t next,
                                 const schema::actor_t& actor,
                                 schema::audit_event_draft_t draft,
                                 Mutation&& mutate);

  schema::change_result_t load_for(const std::string_view key,
                                   const uint64_t expected_revision,
                                   const change_event_t event) const;
  std::optional<schema::change_request_t> load(
      const schema::hash32_t& id) const;
  void save(const schema::change_request_t& request) const;
  schema::duration_milliseconds_t default_window(
      const std::optional<schema::change_risk_level_t>& risk_level) const;
  schema::change_result_t approve_and_schedule(
      schema::change_request_t& request,
      const schema::actor_t& approver,
      const std::string& notes,
      const bool auto_approved);

  ledger::ledger& ledger_;
  storage::rocksdb_storage_t& store_;
  gate::evaluator& evaluator_;
  common::clock_source_t clock_;
  state_machine_options options_;
  rollback_executor_t rollback_executor_;
  notify::notifier_t notifier_;
  mutable std::mutex mutex_;
};

}  // namespace sentinel::change
