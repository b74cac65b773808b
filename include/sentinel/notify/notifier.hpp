#pragma once

#include <sentinel/schema/enum_string.hpp>
#include <sentinel/schema/primitives.hpp>

#include <array>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace sentinel::notify {

enum class notification_kind_t : uint8_t {
  hard_stop_activated = 0,
  rollback_executed = 1,
  rollback_failed = 2,
  tamper_detected = 3,
};

inline constexpr auto kNotificationKindMappings = std::array{
    schema::enum_mapping_t<notification_kind_t>{
        "HARD_STOP_ACTIVATED", notification_kind_t::hard_stop_activated},
    schema::enum_mapping_t<notification_kind_t>{
        "ROLLBACK_EXECUTED", notification_kind_t::rollback_executed},
    schema::enum_mapping_t<notification_kind_t>{
        "ROLLBACK_FAILED", notification_kind_t::rollback_failed},
    schema::enum_mapping_t<notification_kind_t>{
        "TAMPER_DETECTED", notification_kind_t::tamper_detected},
};

inline constexpr std::string_view to_string(const notification_kind_t value) {
  return schema::to_string(value, kNotificationKindMappings)
      .value_or("UNKNOWN");
}

struct notification final {
  notification_kind_t kind{notification_kind_t::rollback_executed};
  bool critical{};
  schema::hash32_t subject_id{};
  std::string subject_key;
  std::string message;
  std::optional<uint64_t> ledger_sequence;
};

/// Fire-and-forget delivery owned by the embedding application.
using notifier_t = std::function<void(const notification&)>;

/// Invoke `notifier` if set. Failures are logged and never propagate.
void notify_best_effort(const notifier_t& notifier, const notification& event);

}  // namespace sentinel::notify
