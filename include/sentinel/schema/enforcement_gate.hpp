#pragma once

#include <sentinel/schema/enum_string.hpp>
#include <sentinel/schema/primitives.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

// Schema type: enforcement gate.
// Governance workflow: named checkpoint where kill switches and the listed
// control policies are evaluated before an action proceeds.
namespace sentinel::schema {

enum class gate_type_t : uint8_t {
  pre_execution = 0,
  post_execution = 1,
  capability_request = 2,
  production_change = 3,
  data_access = 4,
  model_deployment = 5,
  break_glass_entry = 6,
};

inline constexpr auto kGateTypeMappings = std::array{
    enum_mapping_t<gate_type_t>{"PRE_EXECUTION", gate_type_t::pre_execution},
    enum_mapping_t<gate_type_t>{"POST_EXECUTION", gate_type_t::post_execution},
    enum_mapping_t<gate_type_t>{"CAPABILITY_REQUEST",
                                gate_type_t::capability_request},
    enum_mapping_t<gate_type_t>{"PRODUCTION_CHANGE",
                                gate_type_t::production_change},
    enum_mapping_t<gate_type_t>{"DATA_ACCESS", gate_type_t::data_access},
    enum_mapping_t<gate_type_t>{"MODEL_DEPLOYMENT",
                                gate_type_t::model_deployment},
    enum_mapping_t<gate_type_t>{"BREAK_GLASS_ENTRY",
                                gate_type_t::break_glass_entry},
};

template <>
inline std::optional<gate_type_t> try_from_string<gate_type_t>(
    const std::string_view value) {
  return from_string(value, kGateTypeMappings);
}

inline constexpr std::string_view to_string(const gate_type_t value) {
  return to_string(value, kGateTypeMappings).value_or("UNKNOWN");
}

enum class enforcement_mode_t : uint8_t {
  blocking = 0,
  monitoring = 1,
};

inline constexpr auto kEnforcementModeMappings = std::array{
    enum_mapping_t<enforcement_mode_t>{"BLOCKING",
                                       enforcement_mode_t::blocking},
    enum_mapping_t<enforcement_mode_t>{"MONITORING",
                                       enforcement_mode_t::monitoring},
};

template <>
inline std::optional<enforcement_mode_t> try_from_string<enforcement_mode_t>(
    const std::string_view value) {
  return from_string(value, kEnforcementModeMappings);
}

inline constexpr std::string_view to_string(const enforcement_mode_t value) {
  return to_string(value, kEnforcementModeMappings).value_or("UNKNOWN");
}

template <uint16_t Version>
struct enforcement_gate;

template <>
struct enforcement_gate<1> final {
  uint16_t version{1};
  hash32_t id{};
  std::string key;
  std::string name;
  gate_type_t type{gate_type_t::pre_execution};
  std::optional<hash32_t> workflow_id;
  std::optional<hash32_t> capability_id;
  std::vector<hash32_t> policy_ids;
  enforcement_mode_t mode{enforcement_mode_t::blocking};
  bool require_all_pass{true};
  bool check_kill_switches{true};
  bool capture_inputs{true};
  bool capture_outputs{false};
  bool capture_context{true};
  bool tolerate_warning{false};
  bool active{true};
  timestamp_milliseconds_t created_at{};
};

using enforcement_gate_t = enforcement_gate<1>;

}  // namespace sentinel::schema
