#pragma once

#include <sentinel/schema/condition.hpp>
#include <sentinel/schema/context_value.hpp>

#include <cstdint>
#include <optional>
#include <string>

namespace sentinel::gate {

enum class condition_match_t : uint8_t {
  matched = 0,
  not_matched = 1,
  error = 2,
};

struct condition_evaluation final {
  condition_match_t match{condition_match_t::not_matched};
  std::string reason;
};

inline constexpr uint32_t kMaxConditionDepth = 32;

/// Structural check of a condition arena: the nodes must form one tree rooted
/// at node 0, every child listed after its parent and no node shared, within
/// kMaxConditionDepth. Returns the first problem found.
std::optional<std::string> validate_condition(
    const schema::condition_t& condition);

/// Pure interpreter over the condition arena. Arenas failing
/// `validate_condition` evaluate to an error. An empty condition always
/// matches; a missing context key never matches.
condition_evaluation evaluate_condition(const schema::condition_t& condition,
                                        const schema::context_map_t& context);

}  // namespace sentinel::gate
