#include <sentinel/notify/notifier.hpp>

#include <spdlog/spdlog.h>

#include <exception>

namespace sentinel::notify {

void notify_best_effort(const notifier_t& notifier, const notification& event) {
  if (event.critical) {
    spdlog::critical("{} {}: {}", to_string(event.kind), event.subject_key,
                     event.message);
  } else {
    spdlog::info("{} {}: {}", to_string(event.kind), event.subject_key,
                 event.message);
  }
  if (!notifier) {
    return;
  }
  try {
    notifier(event);
  } catch (const std::exception& e) {
    spdlog::warn("Notification {} for '{}' was not delivered: {}",
                 to_string(event.kind), event.subject_key, e.what());
  }
}

}  // namespace sentinel::notify
