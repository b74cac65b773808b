#pragma once

#include <sentinel/common/clock.hpp>
#include <sentinel/schema/append_result.hpp>
#include <sentinel/schema/audit_event.hpp>
#include <sentinel/schema/verify_result.hpp>
#include <sentinel/storage/rocksdb/storage.hpp>

#include <atomic>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string_view>
#include <vector>

namespace sentinel::ledger {

/// Append-only, hash-chained audit log.
///
/// The single authoritative writer of the chain tip. Appends are serialized;
/// every appended event links to the self-hash of its predecessor, and the
/// event plus the new tip are written in one atomic batch. Any integrity
/// failure halts the ledger for the rest of the process lifetime.
class ledger final {
 public:
  ledger(storage::rocksdb_storage_t& store, common::clock_source_t clock);

  ledger(const ledger&) = delete;
  ledger& operator=(const ledger&) = delete;

  /// Sequence, link and stamp `draft`. When `expected_tip` is given and no
  /// longer matches the current tip the append fails with `conflict`.
  schema::append_result_t append(
      const schema::audit_event_draft_t& draft,
      const std::optional<schema::chain_tip_t>& expected_tip = std::nullopt);

  /// Recompute every hash and link in [from, to]. A failure halts the ledger.
  schema::verify_result_t verify_chain(const uint64_t from, const uint64_t to);
  schema::verify_result_t verify_chain();

  schema::chain_tip_t tip() const;
  uint64_t size() const;
  bool halted() const;

  std::optional<schema::audit_event_t> read(const uint64_t sequence) const;
  std::vector<schema::audit_event_t> read_range(const uint64_t from,
                                                const uint64_t to) const;

 private:
  void load_persisted_state();
  void halt(const std::string_view reason, const uint64_t sequence);
  std::optional<schema::audit_event_t> try_load(const uint64_t sequence) const;
  schema::append_result_t make_error(const schema::error_code code,
                                     std::string log) const;

  storage::rocksdb_storage_t& store_;
  common::clock_source_t clock_;
  mutable std::mutex mutex_;
  schema::chain_tip_t tip_;
  std::atomic<bool> halted_{false};
};

}  // namespace sentinel::ledger
