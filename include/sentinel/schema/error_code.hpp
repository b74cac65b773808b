#pragma once

#include <cstdint>
#include <string_view>

namespace sentinel::schema {

enum class error_code : uint32_t {
  ok = 0,
  validation_error = 1,
  invalid_transition = 2,
  window_expired = 3,
  conflict = 4,
  tamper_detected = 5,
  policy_evaluation_error = 6,
  rollback_failure = 7,
  not_found = 8,
  already_exists = 9,
  storage_failure = 10,
  execution_blocked = 11,
};

inline constexpr std::string_view kLedgerCodespace{"sentinel.ledger"};
inline constexpr std::string_view kGateCodespace{"sentinel.gate"};
inline constexpr std::string_view kChangeCodespace{"sentinel.change"};
inline constexpr std::string_view kRegistryCodespace{"sentinel.registry"};

inline constexpr uint32_t to_code(const error_code value) {
  return static_cast<uint32_t>(value);
}

}  // namespace sentinel::schema
