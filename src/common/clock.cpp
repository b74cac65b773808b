#include <sentinel/common/clock.hpp>

#include <chrono>

namespace sentinel::common {

clock_source_t system_clock() {
  return []() {
    return static_cast<sentinel::schema::timestamp_milliseconds_t>(
        std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::system_clock::now().time_since_epoch())
            .count());
  };
}

}  // namespace sentinel::common
