#include <sentinel/ledger/canonical.hpp>
#include <sentinel/ledger/ledger.hpp>
#include <sentinel/schema/key/keys.hpp>

#include <spdlog/spdlog.h>

#include <algorithm>

namespace sentinel::ledger {

namespace {

using encoder_t =
    schema::encoding::encoder<schema::encoding::scale_encoder_tag>;

schema::bytes_view_t view(const schema::bytes_t& bytes) {
  return schema::bytes_view_t{bytes.data(), bytes.size()};
}

}  // namespace

ledger::ledger(storage::rocksdb_storage_t& store, common::clock_source_t clock)
    : store_{store}, clock_{std::move(clock)} {
  load_persisted_state();
}

void ledger::load_persisted_state() {
  auto encoder = encoder_t{};
  auto raw_tip = store_.get_raw(view(schema::key::make_ledger_tip_key()));
  if (!raw_tip) {
    auto events = store_.list_by_prefix(
        view(schema::key::make_prefix(schema::key::kLedgerEventPrefix)));
    if (!events.empty()) {
      halt("events present without a chain tip", 1);
    }
    return;
  }

  auto tip = encoder.try_decode<schema::chain_tip_t>(view(*raw_tip));
  if (!tip) {
    halt("chain tip record is unreadable", 0);
    return;
  }
  tip_ = *tip;
  if (tip_.sequence == 0) {
    return;
  }

  auto event = try_load(tip_.sequence);
  if (!event || event->sequence != tip_.sequence ||
      event->event_hash != tip_.hash ||
      compute_event_hash(*event) != event->event_hash) {
    halt("tip event failed verification at startup", tip_.sequence);
    return;
  }
  spdlog::info("Ledger loaded at sequence {} ({})", tip_.sequence,
               schema::to_hex(*tip_.hash));
}

void ledger::halt(const std::string_view reason, const uint64_t sequence) {
  halted_ = true;
  spdlog::critical("Ledger tamper detected at sequence {}: {}; ledger halted",
                   sequence, reason);
}

std::optional<schema::audit_event_t> ledger::try_load(
    const uint64_t sequence) const {
  auto raw = store_.get_raw(view(schema::key::make_ledger_event_key(sequence)));
  if (!raw) {
    return std::nullopt;
  }
  auto encoder = encoder_t{};
  return encoder.try_decode<schema::audit_event_t>(view(*raw));
}

schema::append_result_t ledger::make_error(const schema::error_code code,
                                           std::string log) const {
  return schema::append_result_t{.code = schema::to_code(code),
                                 .log = std::move(log),
                                 .codespace =
                                     std::string{schema::kLedgerCodespace}};
}

schema::append_result_t ledger::append(
    const schema::audit_event_draft_t& draft,
    const std::optional<schema::chain_tip_t>& expected_tip) {
  auto lock = std::scoped_lock{mutex_};

  if (halted_) {
    return make_error(schema::error_code::tamper_detected, "ledger is halted");
  }
  if (expected_tip && *expected_tip != tip_) {
    return make_error(schema::error_code::conflict,
                      "chain tip moved; refresh and retry");
  }

  if (tip_.sequence > 0) {
    auto current = try_load(tip_.sequence);
    if (!current || current->sequence != tip_.sequence ||
        current->event_hash != tip_.hash ||
        compute_event_hash(*current) != current->event_hash) {
      halt("tip event failed re-verification before append", tip_.sequence);
      return make_error(schema::error_code::tamper_detected,
                        "tip event failed re-verification");
    }
  }

  auto next_sequence = tip_.sequence + 1;
  auto next_key = schema::key::make_ledger_event_key(next_sequence);
  if (store_.get_raw(view(next_key))) {
    halt("an event already occupies the next sequence", next_sequence);
    return make_error(schema::error_code::tamper_detected,
                      "duplicate sequence detected");
  }

  auto event = schema::audit_event_t{};
  event.sequence = next_sequence;
  event.type = draft.type;
  event.action = draft.action;
  event.actor = draft.actor;
  event.resource = draft.resource;
  event.outcome = draft.outcome;
  event.context = draft.context;
  event.previous_hash = tip_.hash;
  event.created_at = clock_();
  event.event_hash = compute_event_hash(event);

  auto next_tip = schema::chain_tip_t{.sequence = next_sequence,
                                      .hash = event.event_hash};
  auto encoder = encoder_t{};
  auto written = store_.write_batch(
      {{next_key, encoder.encode(event)},
       {schema::key::make_ledger_tip_key(), encoder.encode(next_tip)}});
  if (!written) {
    spdlog::error("Ledger append of '{}' failed to persist", event.action);
    return make_error(schema::error_code::storage_failure,
                      "failed to persist ledger event");
  }

  tip_ = next_tip;
  spdlog::debug("Ledger appended {} #{} {}", schema::to_string(event.type),
                event.sequence, schema::to_hex(event.event_hash));
  return schema::append_result_t{
      .code = schema::to_code(schema::error_code::ok),
      .codespace = std::string{schema::kLedgerCodespace},
      .sequence = event.sequence,
      .event_hash = event.event_hash};
}

schema::verify_result_t ledger::verify_chain() {
  auto current = tip();
  if (current.sequence == 0) {
    return schema::verify_result_t{.log = "ledger is empty"};
  }
  return verify_chain(1, current.sequence);
}

schema::verify_result_t ledger::verify_chain(const uint64_t from,
                                             const uint64_t to) {
  auto current = tip();
  if (from == 0 || from > to || to > current.sequence) {
    return schema::verify_result_t{
        .ok = false,
        .log = fmt::format("invalid range [{}, {}] for tip {}", from, to,
                           current.sequence)};
  }

  auto fail = [&](const uint64_t sequence, std::string log) {
    halt(log, sequence);
    return schema::verify_result_t{.ok = false,
                                   .first_mismatch = sequence,
                                   .checked = sequence - from,
                                   .log = std::move(log)};
  };

  auto expected_previous = std::optional<schema::hash32_t>{};
  if (from > 1) {
    auto anchor = try_load(from - 1);
    if (!anchor) {
      return fail(from - 1, "anchor event is missing or unreadable");
    }
    expected_previous = anchor->event_hash;
  }

  for (auto sequence = from; sequence <= to; ++sequence) {
    auto event = try_load(sequence);
    if (!event) {
      return fail(sequence, "event is missing or unreadable");
    }
    if (event->sequence != sequence) {
      return fail(sequence, fmt::format("stored sequence {} does not match key",
                                        event->sequence));
    }
    if (event->previous_hash != expected_previous) {
      return fail(sequence, "previous hash does not link to predecessor");
    }
    if (compute_event_hash(*event) != event->event_hash) {
      return fail(sequence, "recomputed hash does not match stored hash");
    }
    expected_previous = event->event_hash;
  }

  if (to == current.sequence && expected_previous != current.hash) {
    return fail(to, "chain tip does not match last event");
  }

  return schema::verify_result_t{.ok = true, .checked = to - from + 1};
}

schema::chain_tip_t ledger::tip() const {
  auto lock = std::scoped_lock{mutex_};
  return tip_;
}

uint64_t ledger::size() const {
  return tip().sequence;
}

bool ledger::halted() const {
  return halted_;
}

std::optional<schema::audit_event_t> ledger::read(
    const uint64_t sequence) const {
  if (sequence == 0) {
    return std::nullopt;
  }
  return try_load(sequence);
}

std::vector<schema::audit_event_t> ledger::read_range(const uint64_t from,
                                                      const uint64_t to) const {
  auto events = std::vector<schema::audit_event_t>{};
  auto upper = std::min(to, tip().sequence);
  for (auto sequence = std::max<uint64_t>(from, 1); sequence <= upper;
       ++sequence) {
    auto event = try_load(sequence);
    if (!event) {
      break;
    }
    events.push_back(std::move(*event));
  }
  return events;
}

}  // namespace sentinel::ledger
