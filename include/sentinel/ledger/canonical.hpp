#pragma once

#include <sentinel/schema/audit_event.hpp>
#include <sentinel/schema/primitives.hpp>

#include <string>

namespace sentinel::ledger {

/// `YYYY-MM-DDTHH:MM:SS.mmmZ` in UTC.
std::string format_iso8601(const schema::timestamp_milliseconds_t timestamp);

/// Deterministic byte string of every hashed field of an event. Strings are
/// length prefixed, each field carries a one-byte tag, optional fields carry
/// an explicit presence tag, and context entries are written in ascending key
/// order. `previous_hash` and `event_hash` are not part of it.
schema::bytes_t canonical_bytes(const schema::audit_event_t& event);

/// BLAKE3(canonical_bytes(event) || previous_hash), with nothing appended for
/// the first event.
schema::hash32_t compute_event_hash(const schema::audit_event_t& event);

}  // namespace sentinel::ledger
