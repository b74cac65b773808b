#include <sentinel/change/transitions.hpp>

namespace sentinel::change {

std::optional<schema::change_status_t> next_status(
    const schema::change_status_t status,
    const change_event_t event) {
  using schema::change_status_t;

  if (schema::is_terminal(status)) {
    return std::nullopt;
  }

  switch (event) {
    case change_event_t::submit:
      if (status == change_status_t::draft) {
        return change_status_t::submitted;
      }
      break;
    case change_event_t::auto_approve:
      if (status == change_status_t::submitted) {
        return change_status_t::approved;
      }
      break;
    case change_event_t::start_review:
      if (status == change_status_t::submitted) {
        return change_status_t::under_review;
      }
      break;
    case change_event_t::complete_review:
      if (status == change_status_t::under_review) {
        return change_status_t::pending_approval;
      }
      break;
    case change_event_t::approve:
      if (status == change_status_t::pending_approval) {
        return change_status_t::approved;
      }
      break;
    case change_event_t::schedule:
      if (status == change_status_t::approved) {
        return change_status_t::scheduled;
      }
      break;
    case change_event_t::reschedule:
      if (status == change_status_t::approved ||
          status == change_status_t::scheduled) {
        return change_status_t::scheduled;
      }
      break;
    case change_event_t::begin_execution:
      if (status == change_status_t::approved ||
          status == change_status_t::scheduled) {
        return change_status_t::in_progress;
      }
      break;
    case change_event_t::block_execution:
      if (status == change_status_t::approved ||
          status == change_status_t::scheduled) {
        return change_status_t::approved;
      }
      break;
    case change_event_t::complete_success:
      if (status == change_status_t::in_progress) {
        return change_status_t::completed;
      }
      break;
    case change_event_t::require_verification:
      if (status == change_status_t::in_progress) {
        return change_status_t::verifying;
      }
      break;
    case change_event_t::complete_failure:
      if (status == change_status_t::in_progress) {
        return change_status_t::failed;
      }
      break;
    case change_event_t::verify_pass:
      if (status == change_status_t::verifying) {
        return change_status_t::completed;
      }
      break;
    case change_event_t::verify_fail:
      if (status == change_status_t::verifying) {
        return change_status_t::failed;
      }
      break;
    case change_event_t::rollback:
      if (status == change_status_t::in_progress ||
          status == change_status_t::verifying ||
          status == change_status_t::failed) {
        return change_status_t::rolled_back;
      }
      break;
    case change_event_t::reject:
      if (status == change_status_t::submitted ||
          status == change_status_t::under_review ||
          status == change_status_t::pending_approval) {
        return change_status_t::rejected;
      }
      break;
    case change_event_t::cancel:
      if (status == change_status_t::draft ||
          status == change_status_t::submitted ||
          status == change_status_t::under_review ||
          status == change_status_t::pending_approval) {
        return change_status_t::cancelled;
      }
      break;
  }
  return std::nullopt;
}

}  // namespace sentinel::change
