#pragma once

#include <sentinel/schema/actor.hpp>
#include <sentinel/schema/control_policy.hpp>
#include <sentinel/schema/enum_string.hpp>
#include <sentinel/schema/gate_outcome.hpp>
#include <sentinel/schema/kill_switch.hpp>
#include <sentinel/schema/primitives.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

// Schema type: gate execution.
// Governance workflow: append-only result of one gate evaluation, itemized
// per policy and per kill switch.
namespace sentinel::schema {

enum class policy_check_result_t : uint8_t {
  pass = 0,
  fail = 1,
  error = 2,
};

inline constexpr auto kPolicyCheckResultMappings = std::array{
    enum_mapping_t<policy_check_result_t>{"PASS", policy_check_result_t::pass},
    enum_mapping_t<policy_check_result_t>{"FAIL", policy_check_result_t::fail},
    enum_mapping_t<policy_check_result_t>{"ERROR",
                                          policy_check_result_t::error},
};

inline constexpr std::string_view to_string(const policy_check_result_t value) {
  return to_string(value, kPolicyCheckResultMappings).value_or("UNKNOWN");
}

struct policy_evaluation_t final {
  hash32_t policy_id{};
  std::string policy_key;
  int32_t priority{};
  bool applied{};
  std::optional<policy_outcome_t> recommendation;
  policy_check_result_t result{policy_check_result_t::pass};
  std::string reason;
};

struct kill_switch_check_t final {
  hash32_t switch_id{};
  std::string switch_key;
  kill_switch_mode_t mode{kill_switch_mode_t::hard_stop};
  kill_switch_scope_t scope{global_scope_t{}};
  bool active{};
};

using evidence_entry_t = std::pair<std::string, std::string>;

template <uint16_t Version>
struct gate_execution;

template <>
struct gate_execution<1> final {
  uint16_t version{1};
  hash32_t id{};
  hash32_t gate_id{};
  std::string gate_key;
  std::optional<std::string> request_id;
  std::optional<std::string> correlation_id;
  actor_t actor;
  gate_outcome_t outcome{gate_outcome_t::block};
  std::vector<policy_evaluation_t> policy_results;
  std::vector<kill_switch_check_t> kill_switch_checks;
  std::vector<evidence_entry_t> evidence;
  duration_milliseconds_t duration{};
  std::vector<std::string> errors;
  timestamp_milliseconds_t executed_at{};
  std::optional<uint64_t> ledger_sequence;
};

using gate_execution_t = gate_execution<1>;

}  // namespace sentinel::schema
