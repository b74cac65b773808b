#pragma once

#include <sentinel/schema/change_request.hpp>
#include <sentinel/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

namespace sentinel::change {

/// Every input the change-request lifecycle reacts to.
enum class change_event_t : uint8_t {
  submit = 0,
  auto_approve = 1,
  start_review = 2,
  complete_review = 3,
  approve = 4,
  schedule = 5,
  reschedule = 6,
  begin_execution = 7,
  block_execution = 8,
  complete_success = 9,
  require_verification = 10,
  complete_failure = 11,
  verify_pass = 12,
  verify_fail = 13,
  rollback = 14,
  reject = 15,
  cancel = 16,
};

inline constexpr auto kChangeEventMappings = std::array{
    schema::enum_mapping_t<change_event_t>{"SUBMIT", change_event_t::submit},
    schema::enum_mapping_t<change_event_t>{"AUTO_APPROVE",
                                           change_event_t::auto_approve},
    schema::enum_mapping_t<change_event_t>{"START_REVIEW",
                                           change_event_t::start_review},
    schema::enum_mapping_t<change_event_t>{"COMPLETE_REVIEW",
                                           change_event_t::complete_review},
    schema::enum_mapping_t<change_event_t>{"APPROVE", change_event_t::approve},
    schema::enum_mapping_t<change_event_t>{"SCHEDULE",
                                           change_event_t::schedule},
    schema::enum_mapping_t<change_event_t>{"RESCHEDULE",
                                           change_event_t::reschedule},
    schema::enum_mapping_t<change_event_t>{"BEGIN_EXECUTION",
                                           change_event_t::begin_execution},
    schema::enum_mapping_t<change_event_t>{"BLOCK_EXECUTION",
                                           change_event_t::block_execution},
    schema::enum_mapping_t<change_event_t>{"COMPLETE_SUCCESS",
                                           change_event_t::complete_success},
    schema::enum_mapping_t<change_event_t>{
        "REQUIRE_VERIFICATION", change_event_t::require_verification},
    schema::enum_mapping_t<change_event_t>{"COMPLETE_FAILURE",
                                           change_event_t::complete_failure},
    schema::enum_mapping_t<change_event_t>{"VERIFY_PASS",
                                           change_event_t::verify_pass},
    schema::enum_mapping_t<change_event_t>{"VERIFY_FAIL",
                                           change_event_t::verify_fail},
    schema::enum_mapping_t<change_event_t>{"ROLLBACK",
                                           change_event_t::rollback},
    schema::enum_mapping_t<change_event_t>{"REJECT", change_event_t::reject},
    schema::enum_mapping_t<change_event_t>{"CANCEL", change_event_t::cancel},
};

inline constexpr std::string_view to_string(const change_event_t value) {
  return schema::to_string(value, kChangeEventMappings).value_or("UNKNOWN");
}

/// Total transition function. std::nullopt marks an undefined pair, which
/// callers report as invalid_transition.
std::optional<schema::change_status_t> next_status(
    const schema::change_status_t status,
    const change_event_t event);

}  // namespace sentinel::change
