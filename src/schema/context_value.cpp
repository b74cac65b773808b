#include <sentinel/schema/context_value.hpp>

#include <charconv>

namespace sentinel::schema {

std::string to_display_string(const context_value_t& value) {
  return std::visit(
      overloaded{[](const std::monostate&) { return std::string{"null"}; },
                 [](const bool v) { return std::string{v ? "true" : "false"}; },
                 [](const int64_t v) { return std::to_string(v); },
                 [](const std::string& v) { return v; }},
      value);
}

context_value_t parse_context_value(const std::string_view token) {
  if (token == "null") {
    return std::monostate{};
  }
  if (token == "true") {
    return true;
  }
  if (token == "false") {
    return false;
  }
  auto parsed = int64_t{};
  const auto* end = token.data() + token.size();
  auto [ptr, ec] = std::from_chars(token.data(), end, parsed);
  if (ec == std::errc{} && ptr == end && !token.empty()) {
    return parsed;
  }
  return std::string{token};
}

}  // namespace sentinel::schema
