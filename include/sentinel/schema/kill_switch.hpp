#pragma once

#include <sentinel/schema/actor.hpp>
#include <sentinel/schema/enum_string.hpp>
#include <sentinel/schema/primitives.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

// Schema type: kill switch.
// Governance workflow: highest-precedence control. Checked first at every
// gate; a hard stop cannot be bypassed by any other control.
namespace sentinel::schema {

enum class kill_switch_mode_t : uint8_t {
  hard_stop = 0,
  soft_stop = 1,
  read_only = 2,
  degrade = 3,
};

inline constexpr auto kKillSwitchModeMappings = std::array{
    enum_mapping_t<kill_switch_mode_t>{"HARD_STOP",
                                       kill_switch_mode_t::hard_stop},
    enum_mapping_t<kill_switch_mode_t>{"SOFT_STOP",
                                       kill_switch_mode_t::soft_stop},
    enum_mapping_t<kill_switch_mode_t>{"READ_ONLY",
                                       kill_switch_mode_t::read_only},
    enum_mapping_t<kill_switch_mode_t>{"DEGRADE", kill_switch_mode_t::degrade},
};

template <>
inline std::optional<kill_switch_mode_t> try_from_string<kill_switch_mode_t>(
    const std::string_view value) {
  return from_string(value, kKillSwitchModeMappings);
}

inline constexpr std::string_view to_string(const kill_switch_mode_t value) {
  return to_string(value, kKillSwitchModeMappings).value_or("UNKNOWN");
}

/// Lower is more severe.
inline constexpr int severity_rank(const kill_switch_mode_t mode) {
  switch (mode) {
    case kill_switch_mode_t::hard_stop:
      return 0;
    case kill_switch_mode_t::soft_stop:
      return 1;
    case kill_switch_mode_t::read_only:
      return 2;
    case kill_switch_mode_t::degrade:
      return 3;
  }
  return 4;
}

enum class kill_switch_trigger_t : uint8_t {
  manual = 0,
  incident = 1,
  security = 2,
  compliance = 3,
  automated = 4,
  data_anomaly = 5,
};

inline constexpr auto kKillSwitchTriggerMappings = std::array{
    enum_mapping_t<kill_switch_trigger_t>{"MANUAL",
                                          kill_switch_trigger_t::manual},
    enum_mapping_t<kill_switch_trigger_t>{"INCIDENT",
                                          kill_switch_trigger_t::incident},
    enum_mapping_t<kill_switch_trigger_t>{"SECURITY",
                                          kill_switch_trigger_t::security},
    enum_mapping_t<kill_switch_trigger_t>{"COMPLIANCE",
                                          kill_switch_trigger_t::compliance},
    enum_mapping_t<kill_switch_trigger_t>{"AUTOMATED",
                                          kill_switch_trigger_t::automated},
    enum_mapping_t<kill_switch_trigger_t>{
        "DATA_ANOMALY", kill_switch_trigger_t::data_anomaly},
};

template <>
inline std::optional<kill_switch_trigger_t>
try_from_string<kill_switch_trigger_t>(const std::string_view value) {
  return from_string(value, kKillSwitchTriggerMappings);
}

inline constexpr std::string_view to_string(const kill_switch_trigger_t value) {
  return to_string(value, kKillSwitchTriggerMappings).value_or("UNKNOWN");
}

struct global_scope_t final {
  bool operator==(const global_scope_t&) const = default;
};

struct workflow_scope_t final {
  hash32_t workflow_id{};
  bool operator==(const workflow_scope_t&) const = default;
};

struct capability_scope_t final {
  hash32_t capability_id{};
  bool operator==(const capability_scope_t&) const = default;
};

using kill_switch_scope_t =
    std::variant<global_scope_t, workflow_scope_t, capability_scope_t>;

std::string to_string(const kill_switch_scope_t& scope);

template <uint16_t Version>
struct kill_switch;

template <>
struct kill_switch<1> final {
  uint16_t version{1};
  hash32_t id{};
  std::string key;
  std::string name;
  kill_switch_scope_t scope{global_scope_t{}};
  kill_switch_mode_t mode{kill_switch_mode_t::hard_stop};
  kill_switch_trigger_t trigger{kill_switch_trigger_t::manual};
  bool active{};
  std::optional<timestamp_milliseconds_t> activated_at;
  std::optional<actor_t> activated_by;
  std::optional<timestamp_milliseconds_t> deactivated_at;
  std::optional<actor_t> deactivated_by;
  std::optional<timestamp_milliseconds_t> auto_deactivate_at;
  std::string reason;
  std::string resolution_notes;
  std::optional<std::string> incident_id;
  timestamp_milliseconds_t created_at{};
};

using kill_switch_t = kill_switch<1>;

}  // namespace sentinel::schema
