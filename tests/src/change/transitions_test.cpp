#include <gtest/gtest.h>
#include <sentinel/change/transitions.hpp>

#include <cstdint>
#include <optional>
#include <vector>

namespace {

using sentinel::change::change_event_t;
using sentinel::change::next_status;
using sentinel::schema::change_status_t;

const auto kAllStatuses = std::vector<change_status_t>{
    change_status_t::draft,       change_status_t::submitted,
    change_status_t::under_review, change_status_t::pending_approval,
    change_status_t::approved,    change_status_t::scheduled,
    change_status_t::in_progress, change_status_t::verifying,
    change_status_t::completed,   change_status_t::failed,
    change_status_t::rolled_back, change_status_t::rejected,
    change_status_t::cancelled,
};

std::vector<change_event_t> all_events() {
  auto events = std::vector<change_event_t>{};
  for (auto value = uint8_t{0};
       value <= static_cast<uint8_t>(change_event_t::cancel); ++value) {
    events.push_back(static_cast<change_event_t>(value));
  }
  return events;
}

}  // namespace

TEST(change_transitions, happy_path_through_review_and_verification) {
  auto status = std::optional{change_status_t::draft};
  for (auto event :
       {change_event_t::submit, change_event_t::start_review,
        change_event_t::complete_review, change_event_t::approve,
        change_event_t::schedule, change_event_t::begin_execution,
        change_event_t::require_verification, change_event_t::verify_pass}) {
    ASSERT_TRUE(status.has_value());
    status = next_status(*status, event);
  }
  EXPECT_EQ(status, change_status_t::completed);
}

TEST(change_transitions, low_risk_shortcut) {
  EXPECT_EQ(
      next_status(change_status_t::submitted, change_event_t::auto_approve),
      change_status_t::approved);
  EXPECT_EQ(next_status(change_status_t::approved, change_event_t::schedule),
            change_status_t::scheduled);
  EXPECT_FALSE(next_status(change_status_t::pending_approval,
                           change_event_t::auto_approve)
                   .has_value());
}

TEST(change_transitions, approval_requires_pending_approval) {
  EXPECT_FALSE(next_status(change_status_t::submitted, change_event_t::approve)
                   .has_value());
  EXPECT_FALSE(
      next_status(change_status_t::under_review, change_event_t::approve)
          .has_value());
  EXPECT_EQ(
      next_status(change_status_t::pending_approval, change_event_t::approve),
      change_status_t::approved);
}

TEST(change_transitions, blocked_execution_returns_to_approved) {
  EXPECT_EQ(
      next_status(change_status_t::scheduled, change_event_t::block_execution),
      change_status_t::approved);
  EXPECT_EQ(
      next_status(change_status_t::approved, change_event_t::block_execution),
      change_status_t::approved);
  EXPECT_EQ(next_status(change_status_t::approved, change_event_t::reschedule),
            change_status_t::scheduled);
  EXPECT_FALSE(next_status(change_status_t::in_progress,
                           change_event_t::block_execution)
                   .has_value());
}

TEST(change_transitions, failure_paths_end_rolled_back) {
  EXPECT_EQ(next_status(change_status_t::in_progress,
                        change_event_t::complete_failure),
            change_status_t::failed);
  EXPECT_EQ(
      next_status(change_status_t::verifying, change_event_t::verify_fail),
      change_status_t::failed);
  for (auto from : {change_status_t::in_progress, change_status_t::verifying,
                    change_status_t::failed}) {
    EXPECT_EQ(next_status(from, change_event_t::rollback),
              change_status_t::rolled_back)
        << sentinel::schema::to_string(from);
  }
  EXPECT_FALSE(next_status(change_status_t::scheduled, change_event_t::rollback)
                   .has_value());
}

TEST(change_transitions, reject_and_cancel_only_before_approval) {
  for (auto from : {change_status_t::submitted, change_status_t::under_review,
                    change_status_t::pending_approval}) {
    EXPECT_EQ(next_status(from, change_event_t::reject),
              change_status_t::rejected);
    EXPECT_EQ(next_status(from, change_event_t::cancel),
              change_status_t::cancelled);
  }
  EXPECT_EQ(next_status(change_status_t::draft, change_event_t::cancel),
            change_status_t::cancelled);
  EXPECT_FALSE(
      next_status(change_status_t::draft, change_event_t::reject).has_value());
  EXPECT_FALSE(next_status(change_status_t::approved, change_event_t::cancel)
                   .has_value());
  EXPECT_FALSE(next_status(change_status_t::in_progress, change_event_t::reject)
                   .has_value());
}

TEST(change_transitions, terminal_states_accept_nothing) {
  auto events = all_events();
  ASSERT_EQ(events.size(), 17u);
  for (auto status : kAllStatuses) {
    if (!sentinel::schema::is_terminal(status)) {
      continue;
    }
    for (auto event : events) {
      EXPECT_FALSE(next_status(status, event).has_value())
          << sentinel::schema::to_string(status) << " + "
          << sentinel::change::to_string(event);
    }
  }
}

TEST(change_transitions, function_is_total_and_lands_on_known_states) {
  auto defined = 0;
  for (auto status : kAllStatuses) {
    for (auto event : all_events()) {
      auto next = next_status(status, event);
      if (!next) {
        continue;
      }
      ++defined;
      EXPECT_NE(sentinel::schema::to_string(*next), "UNKNOWN");
      EXPECT_NE(*next, change_status_t::draft);
    }
  }
  EXPECT_EQ(defined, 27);
}

TEST(change_transitions, event_names) {
  EXPECT_EQ(sentinel::change::to_string(change_event_t::begin_execution),
            "BEGIN_EXECUTION");
  EXPECT_EQ(sentinel::change::to_string(change_event_t::verify_fail),
            "VERIFY_FAIL");
  EXPECT_EQ(sentinel::change::to_string(static_cast<change_event_t>(200)),
            "UNKNOWN");
}
