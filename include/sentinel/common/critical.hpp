#pragma once

#include <csignal>
#include <exception>
#include <string_view>

#include <spdlog/spdlog.h>

namespace sentinel::common {

[[noreturn]] inline void critical(const std::string_view message) {
  spdlog::critical("{}", message);
  spdlog::shutdown();
  std::raise(SIGTERM);
  std::terminate();
}

[[noreturn]] inline void critical(const std::string_view message,
                                  const std::string_view detail) {
  spdlog::critical("{}: {}", message, detail);
  spdlog::shutdown();
  std::raise(SIGTERM);
  std::terminate();
}

}  // namespace sentinel::common
