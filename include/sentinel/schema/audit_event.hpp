#pragma once

#include <sentinel/schema/actor.hpp>
#include <sentinel/schema/audit_event_type.hpp>
#include <sentinel/schema/audit_outcome.hpp>
#include <sentinel/schema/context_value.hpp>
#include <sentinel/schema/primitives.hpp>

#include <cstdint>
#include <optional>
#include <string>

// Schema type: audit event.
// Governance workflow: one immutable, hash-chained ledger record.
namespace sentinel::schema {

struct resource_ref_t final {
  std::string type;
  hash32_t id{};
  std::string name;

  bool operator==(const resource_ref_t&) const = default;
};

/// Caller-supplied part of an event; the ledger assigns the rest.
struct audit_event_draft_t final {
  audit_event_type_t type{};
  std::string action;
  actor_t actor;
  std::optional<resource_ref_t> resource;
  audit_outcome_t outcome{audit_outcome_t::success};
  context_map_t context;
};

template <uint16_t Version>
struct audit_event;

template <>
struct audit_event<1> final {
  uint16_t version{1};
  uint64_t sequence{};
  audit_event_type_t type{};
  std::string action;
  actor_t actor;
  std::optional<resource_ref_t> resource;
  audit_outcome_t outcome{audit_outcome_t::success};
  context_map_t context;
  std::optional<hash32_t> previous_hash;
  hash32_t event_hash{};
  timestamp_milliseconds_t created_at{};
};

using audit_event_t = audit_event<1>;

/// Position of the chain head. An empty ledger has sequence 0 and no hash.
struct chain_tip_t final {
  uint64_t sequence{};
  std::optional<hash32_t> hash;

  bool operator==(const chain_tip_t&) const = default;
};

}  // namespace sentinel::schema
