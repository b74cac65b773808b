#include <sentinel/schema/condition.hpp>

#include <iterator>

namespace sentinel::schema {

namespace {

condition_t make_composite(const condition_kind_t kind,
                           std::vector<condition_t> children) {
  auto out = condition_t{};
  out.nodes.push_back(condition_node_t{.kind = kind});
  for (auto& child : children) {
    if (child.nodes.empty()) {
      child = make_always();
    }
    // Re-base the child's arena behind everything written so far.
    auto offset = static_cast<uint32_t>(out.nodes.size());
    out.nodes[0].children.push_back(offset);
    for (auto& node : child.nodes) {
      for (auto& index : node.children) {
        index += offset;
      }
      out.nodes.push_back(std::move(node));
    }
  }
  return out;
}

}  // namespace

condition_t make_always() {
  return condition_t{.nodes = {condition_node_t{}}};
}

condition_t make_equals(std::string key, context_value_t value) {
  return condition_t{
      .nodes = {condition_node_t{.kind = condition_kind_t::equals,
                                 .key = std::move(key),
                                 .values = {std::move(value)}}}};
}

condition_t make_in_set(std::string key, std::vector<context_value_t> values) {
  return condition_t{
      .nodes = {condition_node_t{.kind = condition_kind_t::in_set,
                                 .key = std::move(key),
                                 .values = std::move(values)}}};
}

condition_t make_all_of(std::vector<condition_t> children) {
  return make_composite(condition_kind_t::all_of, std::move(children));
}

condition_t make_any_of(std::vector<condition_t> children) {
  return make_composite(condition_kind_t::any_of, std::move(children));
}

condition_t make_none_of(std::vector<condition_t> children) {
  return make_composite(condition_kind_t::none_of, std::move(children));
}

condition_t make_equality_map(const context_map_t& expected) {
  if (expected.empty()) {
    return condition_t{};
  }
  auto children = std::vector<condition_t>{};
  children.reserve(expected.size());
  for (const auto& [key, value] : expected) {
    children.push_back(make_equals(key, value));
  }
  return make_all_of(std::move(children));
}

}  // namespace sentinel::schema
