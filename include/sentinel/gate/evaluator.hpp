#pragma once

#include <sentinel/common/clock.hpp>
#include <sentinel/gate/fetch_workers.hpp>
#include <sentinel/gate/policy_source.hpp>
#include <sentinel/ledger/ledger.hpp>
#include <sentinel/schema/actor.hpp>
#include <sentinel/schema/context_value.hpp>
#include <sentinel/schema/gate_decision.hpp>
#include <sentinel/schema/gate_execution.hpp>
#include <sentinel/storage/rocksdb/storage.hpp>

#include <array>
#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace sentinel::gate {

struct evaluator_options final {
  // Total fetch attempts per policy-source call.
  uint32_t retry_attempts{3};
  std::chrono::milliseconds initial_backoff{10};
  std::chrono::milliseconds backoff_cap{250};
  std::chrono::milliseconds default_timeout{2000};
  // Fetch threads alive at once, including ones past their deadline.
  std::size_t max_fetch_workers{64};
};

struct evaluation_request final {
  std::string gate_key;
  schema::actor_t actor;
  schema::context_map_t context;
  // Captured only when the gate asks for outputs.
  schema::context_map_t outputs;
  std::optional<std::chrono::milliseconds> timeout;
  std::optional<std::string> request_id;
  std::optional<std::string> correlation_id;
  std::optional<schema::hash32_t> break_glass_id;
};

/// Resolves kill switches and control policies at a gate into one outcome.
///
/// Evaluations are independent and may run concurrently; the only shared
/// writes are the ledger append and the execution record. `evaluate` always
/// returns a terminal outcome and never throws. Policy-source fetches run on
/// threads owned by the evaluator and are joined before it is destroyed, so
/// the source must outlive the evaluator.
class evaluator final {
 public:
  evaluator(ledger::ledger& ledger,
            storage::rocksdb_storage_t& store,
            policy_source source,
            common::clock_source_t clock,
            evaluator_options options = {});

  schema::gate_decision_t evaluate(const evaluation_request& request);
  schema::gate_decision_t evaluate(
      const std::string_view gate_key,
      const schema::actor_t& actor,
      const schema::context_map_t& context,
      const std::optional<std::chrono::milliseconds> timeout = std::nullopt);

  std::optional<schema::gate_execution_t> find_execution(
      const schema::hash32_t& execution_id) const;

 private:
  struct evaluation_state;

  schema::gate_decision_t run(const evaluation_request& request);
  schema::gate_decision_t finish(evaluation_state& state);
  schema::hash32_t make_execution_id(const evaluation_request& request,
                                     const schema::timestamp_milliseconds_t at);
  bool execution_exists(const schema::hash32_t& execution_id) const;

  ledger::ledger& ledger_;
  storage::rocksdb_storage_t& store_;
  std::shared_ptr<const policy_source> source_;
  common::clock_source_t clock_;
  evaluator_options options_;
  // Distinguishes execution ids minted by different evaluator instances.
  std::array<uint8_t, 16> instance_salt_{};
  std::atomic<uint64_t> execution_counter_{0};
  // Declared last: joined before anything a fetch may still reference.
  fetch_workers workers_;
};

}  // namespace sentinel::gate
