#pragma once

#include <sentinel/schema/change_request.hpp>
#include <sentinel/schema/error_code.hpp>

#include <cstdint>
#include <optional>
#include <string>

namespace sentinel::schema {

template <uint16_t Version>
struct change_result;

/// Outcome of one change-request operation. `request` holds the persisted
/// record after the operation, or the unchanged record when it failed after
/// loading.
template <>
struct change_result<1> final {
  uint16_t version{1};
  uint32_t code{};
  std::string log;
  std::string codespace;
  std::optional<change_request_t> request;
  std::optional<hash32_t> gate_execution_id;

  bool ok() const { return code == to_code(error_code::ok); }
};

using change_result_t = change_result<1>;

}  // namespace sentinel::schema
