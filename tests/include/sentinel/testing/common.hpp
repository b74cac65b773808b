#pragma once

#include <sentinel/common/clock.hpp>
#include <sentinel/schema/actor.hpp>
#include <sentinel/schema/primitives.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>
#include <system_error>

namespace sentinel::testing {

inline std::string make_db_path(const std::string_view prefix) {
  static auto counter = std::atomic<uint64_t>{};
  const auto now =
      std::chrono::high_resolution_clock::now().time_since_epoch().count();
  const auto path = std::filesystem::temp_directory_path() /
                    (std::string{prefix} + "_" +
                     std::to_string(static_cast<unsigned long long>(now)) +
                     "_" + std::to_string(counter.fetch_add(1)));
  return path.string();
}

inline void remove_path(const std::string& path) {
  auto error = std::error_code{};
  std::filesystem::remove_all(path, error);
}

inline sentinel::schema::actor_t make_actor(
    const std::string_view name,
    const sentinel::schema::actor_type_t type =
        sentinel::schema::actor_type_t::user) {
  return sentinel::schema::actor_t{.id = sentinel::schema::make_id(name),
                                   .type = type,
                                   .name = std::string{name}};
}

inline constexpr sentinel::schema::timestamp_milliseconds_t kEpoch =
    1'700'000'000'000;
inline constexpr sentinel::schema::duration_milliseconds_t kMinute = 60'000;
inline constexpr sentinel::schema::duration_milliseconds_t kHour = 60 * kMinute;

/// Settable time source shared by every component built from `source()`.
class manual_clock final {
 public:
  explicit manual_clock(const sentinel::schema::timestamp_milliseconds_t start =
                            kEpoch)
      : now_{std::make_shared<
            std::atomic<sentinel::schema::timestamp_milliseconds_t>>(start)} {}

  sentinel::common::clock_source_t source() const {
    return [now = now_] { return now->load(); };
  }

  sentinel::schema::timestamp_milliseconds_t now() const {
    return now_->load();
  }
  void advance(const sentinel::schema::duration_milliseconds_t by) {
    now_->fetch_add(by);
  }
  void set(const sentinel::schema::timestamp_milliseconds_t at) {
    now_->store(at);
  }

 private:
  std::shared_ptr<std::atomic<sentinel::schema::timestamp_milliseconds_t>>
      now_;
};

}  // namespace sentinel::testing
