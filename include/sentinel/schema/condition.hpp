#pragma once

#include <sentinel/schema/context_value.hpp>
#include <sentinel/schema/enum_string.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

// Schema type: condition.
// Governance workflow: predicate a control policy evaluates against a request
// context. Stored as a flat node arena; node 0 is the root and an empty arena
// always applies.
namespace sentinel::schema {

enum class condition_kind_t : uint8_t {
  always = 0,
  equals = 1,
  in_set = 2,
  all_of = 3,
  any_of = 4,
  none_of = 5,
};

inline constexpr auto kConditionKindMappings = std::array{
    enum_mapping_t<condition_kind_t>{"always", condition_kind_t::always},
    enum_mapping_t<condition_kind_t>{"equals", condition_kind_t::equals},
    enum_mapping_t<condition_kind_t>{"in_set", condition_kind_t::in_set},
    enum_mapping_t<condition_kind_t>{"all_of", condition_kind_t::all_of},
    enum_mapping_t<condition_kind_t>{"any_of", condition_kind_t::any_of},
    enum_mapping_t<condition_kind_t>{"none_of", condition_kind_t::none_of},
};

inline constexpr std::string_view to_string(const condition_kind_t value) {
  return to_string(value, kConditionKindMappings).value_or("unknown");
}

struct condition_node_t final {
  condition_kind_t kind{condition_kind_t::always};
  // equals / in_set
  std::string key;
  std::vector<context_value_t> values;
  // all_of / any_of / none_of: indices into the owning arena
  std::vector<uint32_t> children;

  bool operator==(const condition_node_t&) const = default;
};

struct condition_t final {
  std::vector<condition_node_t> nodes;

  bool empty() const { return nodes.empty(); }
  bool operator==(const condition_t&) const = default;
};

condition_t make_always();
condition_t make_equals(std::string key, context_value_t value);
condition_t make_in_set(std::string key, std::vector<context_value_t> values);
condition_t make_all_of(std::vector<condition_t> children);
condition_t make_any_of(std::vector<condition_t> children);
condition_t make_none_of(std::vector<condition_t> children);

/// Exact equality on every entry: the flat key/value form of a condition.
condition_t make_equality_map(const context_map_t& expected);

}  // namespace sentinel::schema
