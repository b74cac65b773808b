#include <gtest/gtest.h>
#include <sentinel/gate/condition_evaluator.hpp>

namespace {

using sentinel::gate::condition_match_t;
using sentinel::schema::make_context_value;

sentinel::schema::context_map_t make_context() {
  auto context = sentinel::schema::context_map_t{};
  context.emplace("env", make_context_value("prod"));
  context.emplace("after_hours", make_context_value(true));
  context.emplace("replicas", make_context_value(int64_t{3}));
  context.emplace("owner", sentinel::schema::context_value_t{std::monostate{}});
  return context;
}

condition_match_t match(const sentinel::schema::condition_t& condition) {
  return sentinel::gate::evaluate_condition(condition, make_context()).match;
}

}  // namespace

TEST(condition_evaluator, empty_condition_always_matches) {
  EXPECT_EQ(match(sentinel::schema::condition_t{}), condition_match_t::matched);
  EXPECT_EQ(match(sentinel::schema::make_always()),
            condition_match_t::matched);
}

TEST(condition_evaluator, equals_compares_type_and_value) {
  EXPECT_EQ(match(sentinel::schema::make_equals("env",
                                                make_context_value("prod"))),
            condition_match_t::matched);
  EXPECT_EQ(match(sentinel::schema::make_equals(
                "replicas", make_context_value("3"))),
            condition_match_t::not_matched);
  EXPECT_EQ(match(sentinel::schema::make_equals(
                "owner",
                sentinel::schema::context_value_t{std::monostate{}})),
            condition_match_t::matched);
}

TEST(condition_evaluator, missing_key_never_matches) {
  EXPECT_EQ(match(sentinel::schema::make_equals("region",
                                                make_context_value("eu"))),
            condition_match_t::not_matched);
  EXPECT_EQ(match(sentinel::schema::make_none_of({sentinel::schema::make_equals(
                "region", make_context_value("eu"))})),
            condition_match_t::matched);
}

TEST(condition_evaluator, composites_combine_children) {
  auto prod = sentinel::schema::make_equals("env", make_context_value("prod"));
  auto staging =
      sentinel::schema::make_equals("env", make_context_value("staging"));
  auto late =
      sentinel::schema::make_equals("after_hours", make_context_value(true));

  EXPECT_EQ(match(sentinel::schema::make_all_of({prod, late})),
            condition_match_t::matched);
  EXPECT_EQ(match(sentinel::schema::make_all_of({staging, late})),
            condition_match_t::not_matched);
  EXPECT_EQ(match(sentinel::schema::make_any_of({staging, late})),
            condition_match_t::matched);
  EXPECT_EQ(match(sentinel::schema::make_none_of({staging})),
            condition_match_t::matched);
  EXPECT_EQ(match(sentinel::schema::make_in_set(
                "replicas", {make_context_value(int64_t{1}),
                             make_context_value(int64_t{3})})),
            condition_match_t::matched);
}

TEST(condition_evaluator, equality_map_requires_every_entry) {
  auto expected = sentinel::schema::context_map_t{};
  expected.emplace("env", make_context_value("prod"));
  expected.emplace("after_hours", make_context_value(true));
  EXPECT_EQ(match(sentinel::schema::make_equality_map(expected)),
            condition_match_t::matched);

  expected.insert_or_assign("after_hours", make_context_value(false));
  EXPECT_EQ(match(sentinel::schema::make_equality_map(expected)),
            condition_match_t::not_matched);
}

TEST(condition_evaluator, malformed_nodes_are_errors) {
  auto no_values = sentinel::schema::condition_t{
      .nodes = {{.kind = sentinel::schema::condition_kind_t::in_set,
                 .key = "env"}}};
  EXPECT_EQ(match(no_values), condition_match_t::error);

  auto empty_key = sentinel::schema::condition_t{
      .nodes = {{.kind = sentinel::schema::condition_kind_t::equals,
                 .values = {make_context_value("prod")}}}};
  EXPECT_EQ(match(empty_key), condition_match_t::error);

  auto two_values = sentinel::schema::condition_t{
      .nodes = {{.kind = sentinel::schema::condition_kind_t::equals,
                 .key = "env",
                 .values = {make_context_value("prod"),
                            make_context_value("dev")}}}};
  EXPECT_EQ(match(two_values), condition_match_t::error);

  auto childless = sentinel::schema::condition_t{
      .nodes = {{.kind = sentinel::schema::condition_kind_t::any_of}}};
  EXPECT_EQ(match(childless), condition_match_t::error);

  auto dangling = sentinel::schema::condition_t{
      .nodes = {{.kind = sentinel::schema::condition_kind_t::all_of,
                 .children = {7}}}};
  EXPECT_EQ(match(dangling), condition_match_t::error);

  auto cycle = sentinel::schema::condition_t{
      .nodes = {{.kind = sentinel::schema::condition_kind_t::all_of,
                 .children = {0}}}};
  auto evaluation =
      sentinel::gate::evaluate_condition(cycle, make_context());
  EXPECT_EQ(evaluation.match, condition_match_t::error);
  EXPECT_FALSE(evaluation.reason.empty());
}

TEST(condition_evaluator, rejects_excessive_depth) {
  auto condition =
      sentinel::schema::make_equals("env", make_context_value("prod"));
  for (auto i = uint32_t{0}; i < sentinel::gate::kMaxConditionDepth; ++i) {
    condition = sentinel::schema::make_all_of({condition});
  }
  EXPECT_EQ(match(condition), condition_match_t::error);
}

TEST(condition_evaluator, shared_children_are_rejected) {
  // Each level lists the next twice; as a tree this would fan out to 2^28
  // leaves.
  constexpr auto kLevels = uint32_t{28};
  auto doubled = sentinel::schema::condition_t{};
  for (auto i = uint32_t{0}; i < kLevels; ++i) {
    doubled.nodes.push_back(
        {.kind = sentinel::schema::condition_kind_t::all_of,
         .children = {i + 1, i + 1}});
  }
  doubled.nodes.push_back({.kind = sentinel::schema::condition_kind_t::equals,
                           .key = "env",
                           .values = {make_context_value("prod")}});
  ASSERT_EQ(doubled.nodes.size(), 29u);
  EXPECT_TRUE(sentinel::gate::validate_condition(doubled).has_value());
  EXPECT_EQ(match(doubled), condition_match_t::error);

  auto leaf = sentinel::schema::condition_node_t{
      .kind = sentinel::schema::condition_kind_t::equals,
      .key = "env",
      .values = {make_context_value("prod")}};
  auto diamond = sentinel::schema::condition_t{
      .nodes = {{.kind = sentinel::schema::condition_kind_t::any_of,
                 .children = {1, 2}},
                {.kind = sentinel::schema::condition_kind_t::all_of,
                 .children = {3}},
                {.kind = sentinel::schema::condition_kind_t::none_of,
                 .children = {3}},
                leaf}};
  EXPECT_EQ(match(diamond), condition_match_t::error);

  auto orphan = sentinel::schema::condition_t{.nodes = {leaf, leaf}};
  EXPECT_EQ(match(orphan), condition_match_t::error);
}

TEST(condition_evaluator, built_conditions_are_valid_trees) {
  auto prod = sentinel::schema::make_equals("env", make_context_value("prod"));
  auto nested = sentinel::schema::make_any_of(
      {sentinel::schema::make_all_of({prod, prod}),
       sentinel::schema::make_none_of({prod})});
  EXPECT_FALSE(sentinel::gate::validate_condition(nested).has_value());
  EXPECT_FALSE(sentinel::gate::validate_condition(
                   sentinel::schema::condition_t{})
                   .has_value());
  EXPECT_EQ(match(nested), condition_match_t::matched);
}
