#include <sentinel/gate/condition_evaluator.hpp>

#include <spdlog/fmt/fmt.h>

#include <algorithm>
#include <vector>

namespace sentinel::gate {

namespace {

struct interpreter final {
  const schema::condition_t& condition;
  const schema::context_map_t& context;
  std::string error;

  condition_match_t fail(std::string reason) {
    if (error.empty()) {
      error = std::move(reason);
    }
    return condition_match_t::error;
  }

  condition_match_t eval(const uint32_t index, const uint32_t depth) {
    if (depth > kMaxConditionDepth) {
      return fail(fmt::format("condition nested deeper than {}",
                              kMaxConditionDepth));
    }
    if (index >= condition.nodes.size()) {
      return fail(fmt::format("condition node {} out of range", index));
    }
    const auto& node = condition.nodes[index];
    switch (node.kind) {
      case schema::condition_kind_t::always:
        return condition_match_t::matched;
      case schema::condition_kind_t::equals:
      case schema::condition_kind_t::in_set:
        return eval_leaf(node, index);
      case schema::condition_kind_t::all_of:
      case schema::condition_kind_t::any_of:
      case schema::condition_kind_t::none_of:
        return eval_composite(node, index, depth);
    }
    return fail(fmt::format("condition node {} has an unknown kind", index));
  }

  condition_match_t eval_leaf(const schema::condition_node_t& node,
                              const uint32_t index) {
    if (node.key.empty()) {
      return fail(fmt::format("condition node {} has an empty key", index));
    }
    if (node.values.empty()) {
      return fail(fmt::format("condition node {} has no values", index));
    }
    if (node.kind == schema::condition_kind_t::equals &&
        node.values.size() != 1) {
      return fail(
          fmt::format("equals node {} must have exactly one value", index));
    }
    auto found = context.find(node.key);
    if (found == context.end()) {
      return condition_match_t::not_matched;
    }
    auto hit = std::ranges::find(node.values, found->second) !=
               node.values.end();
    return hit ? condition_match_t::matched : condition_match_t::not_matched;
  }

  condition_match_t eval_composite(const schema::condition_node_t& node,
                                   const uint32_t index,
                                   const uint32_t depth) {
    if (node.children.empty()) {
      return fail(fmt::format("{} node {} has no children",
                              schema::to_string(node.kind), index));
    }
    auto matched = size_t{};
    for (const auto child : node.children) {
      if (child <= index) {
        return fail(fmt::format("condition node {} refers backwards to {}",
                                index, child));
      }
      auto result = eval(child, depth + 1);
      if (result == condition_match_t::error) {
        return result;
      }
      if (result == condition_match_t::matched) {
        ++matched;
      }
    }
    auto all = matched == node.children.size();
    switch (node.kind) {
      case schema::condition_kind_t::all_of:
        return all ? condition_match_t::matched
                   : condition_match_t::not_matched;
      case schema::condition_kind_t::any_of:
        return matched > 0 ? condition_match_t::matched
                           : condition_match_t::not_matched;
      default:
        return matched == 0 ? condition_match_t::matched
                            : condition_match_t::not_matched;
    }
  }
};

}  // namespace

std::optional<std::string> validate_condition(
    const schema::condition_t& condition) {
  const auto size = condition.nodes.size();
  auto parents = std::vector<uint32_t>(size, 0);
  auto depth = std::vector<uint32_t>(size, 1);
  for (auto index = uint32_t{0}; index < size; ++index) {
    const auto& node = condition.nodes[index];
    if (index > 0 && parents[index] != 1) {
      return fmt::format("condition node {} has {} parents, expected one",
                         index, parents[index]);
    }
    if (depth[index] > kMaxConditionDepth) {
      return fmt::format("condition nested deeper than {}",
                         kMaxConditionDepth);
    }
    for (const auto child : node.children) {
      if (child <= index) {
        return fmt::format("condition node {} refers backwards to {}", index,
                           child);
      }
      if (child >= size) {
        return fmt::format("condition node {} out of range", child);
      }
      ++parents[child];
      depth[child] = depth[index] + 1;
    }
  }
  return std::nullopt;
}

condition_evaluation evaluate_condition(const schema::condition_t& condition,
                                        const schema::context_map_t& context) {
  if (condition.empty()) {
    return condition_evaluation{.match = condition_match_t::matched,
                                .reason = "empty condition"};
  }
  if (auto problem = validate_condition(condition)) {
    return condition_evaluation{.match = condition_match_t::error,
                                .reason = std::move(*problem)};
  }
  auto run = interpreter{.condition = condition, .context = context};
  auto match = run.eval(0, 1);
  switch (match) {
    case condition_match_t::matched:
      return condition_evaluation{.match = match, .reason = "matched"};
    case condition_match_t::not_matched:
      return condition_evaluation{.match = match, .reason = "not matched"};
    case condition_match_t::error:
      break;
  }
  return condition_evaluation{.match = condition_match_t::error,
                              .reason = std::move(run.error)};
}

}  // namespace sentinel::gate
