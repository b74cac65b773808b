#pragma once

#include <sentinel/change/state_machine.hpp>
#include <sentinel/gate/evaluator.hpp>
#include <sentinel/ledger/ledger.hpp>
#include <sentinel/notify/notifier.hpp>
#include <sentinel/registry/control_registry.hpp>
#include <sentinel/schema/encoding/scale/encoder.hpp>
#include <sentinel/storage/rocksdb/storage.hpp>
#include <sentinel/testing/common.hpp>

#include <atomic>
#include <chrono>
#include <functional>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

namespace sentinel::testing {

using scale_encoder_t = sentinel::schema::encoding::encoder<
    sentinel::schema::encoding::scale_encoder_tag>;
using storage_t = sentinel::storage::rocksdb_storage_t;

inline sentinel::gate::evaluator_options fast_evaluator_options() {
  return sentinel::gate::evaluator_options{
      .retry_attempts = 2,
      .initial_backoff = std::chrono::milliseconds{1},
      .backoff_cap = std::chrono::milliseconds{5},
      .default_timeout = std::chrono::milliseconds{2000}};
}

/// One database, ledger, registry, gate evaluator and change state machine
/// sharing a manual clock. Notifications and rollback calls are recorded.
class governance_fixture final {
 public:
  explicit governance_fixture(const std::string_view db_prefix)
      : db_path_{make_db_path(db_prefix)},
        storage_{sentinel::storage::make_storage<
            sentinel::storage::rocksdb_storage_tag>(db_path_)},
        ledger_{storage_, clock_.source()},
        registry_{ledger_, storage_, clock_.source(), recorder()},
        evaluator_{ledger_, storage_, registry_.make_policy_source(),
                   clock_.source(), fast_evaluator_options()},
        state_machine_{ledger_,
                       storage_,
                       evaluator_,
                       clock_.source(),
                       sentinel::change::state_machine_options{},
                       [this](const sentinel::schema::change_request_t& r) {
                         ++rollback_calls_;
                         return rollback_executor_(r);
                       },
                       recorder()} {}

  governance_fixture(const governance_fixture&) = delete;
  governance_fixture& operator=(const governance_fixture&) = delete;
  governance_fixture(governance_fixture&&) = delete;
  governance_fixture& operator=(governance_fixture&&) = delete;

  ~governance_fixture() { remove_path(db_path_); }

  const std::string& db_path() const { return db_path_; }
  manual_clock& clock() { return clock_; }
  storage_t& storage() { return storage_; }
  sentinel::ledger::ledger& ledger() { return ledger_; }
  sentinel::registry::control_registry& registry() { return registry_; }
  sentinel::gate::evaluator& evaluator() { return evaluator_; }
  sentinel::change::state_machine& changes() { return state_machine_; }

  void set_rollback_executor(
      std::function<bool(const sentinel::schema::change_request_t&)> executor) {
    rollback_executor_ = std::move(executor);
  }
  int rollback_calls() const { return rollback_calls_.load(); }

  std::vector<sentinel::notify::notification> notifications() const {
    auto lock = std::scoped_lock{notifications_mutex_};
    return notifications_;
  }

 private:
  sentinel::notify::notifier_t recorder() {
    return [this](const sentinel::notify::notification& event) {
      auto lock = std::scoped_lock{notifications_mutex_};
      notifications_.push_back(event);
    };
  }

  std::string db_path_;
  manual_clock clock_;
  storage_t storage_;
  sentinel::ledger::ledger ledger_;
  sentinel::registry::control_registry registry_;
  sentinel::gate::evaluator evaluator_;
  sentinel::change::state_machine state_machine_;
  std::function<bool(const sentinel::schema::change_request_t&)>
      rollback_executor_{[](const auto&) { return true; }};
  std::atomic<int> rollback_calls_{};
  mutable std::mutex notifications_mutex_;
  std::vector<sentinel::notify::notification> notifications_;
};

}  // namespace sentinel::testing
