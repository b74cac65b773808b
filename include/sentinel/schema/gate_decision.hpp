#pragma once

#include <sentinel/schema/enforcement_gate.hpp>
#include <sentinel/schema/gate_outcome.hpp>
#include <sentinel/schema/primitives.hpp>

#include <cstdint>
#include <optional>
#include <string>

namespace sentinel::schema {

template <uint16_t Version>
struct gate_decision;

/// What a caller of the gate evaluator receives; the full itemized record is
/// retrievable by execution id.
template <>
struct gate_decision<1> final {
  uint16_t version{1};
  gate_outcome_t outcome{gate_outcome_t::block};
  hash32_t execution_id{};
  std::optional<uint64_t> ledger_sequence;
  std::optional<gate_type_t> gate_type;
  bool tolerate_warning{};
  std::string log;

  /// ALLOW, or WARNING at a gate that tolerates it.
  bool permits_execution() const {
    return outcome == gate_outcome_t::allow ||
           (outcome == gate_outcome_t::warning && tolerate_warning);
  }
};

using gate_decision_t = gate_decision<1>;

}  // namespace sentinel::schema
