#pragma once

#include <sentinel/schema/primitives.hpp>

#include <cstdint>
#include <map>
#include <string>
#include <string_view>
#include <variant>

// Schema type: context value.
// Governance workflow: structured request context evaluated by policy
// conditions and recorded on ledger events. std::monostate is an explicit
// null, distinct from an absent key.
namespace sentinel::schema {

using context_value_t =
    std::variant<std::monostate, bool, int64_t, std::string>;

/// Ordered by key so iteration is already canonical.
using context_map_t = std::map<std::string, context_value_t, std::less<>>;

inline context_value_t make_context_value(const char* value) {
  return context_value_t{std::string{value}};
}

inline context_value_t make_context_value(std::string value) {
  return context_value_t{std::move(value)};
}

inline context_value_t make_context_value(const bool value) {
  return context_value_t{value};
}

inline context_value_t make_context_value(const int64_t value) {
  return context_value_t{value};
}

/// Render for logs and the CLI: null, true/false, integers, raw strings.
std::string to_display_string(const context_value_t& value);

/// Parse a CLI token: "null", "true", "false", integers, otherwise string.
context_value_t parse_context_value(const std::string_view token);

}  // namespace sentinel::schema
