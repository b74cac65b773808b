#include <gtest/gtest.h>
#include <sentinel/schema/context_value.hpp>
#include <sentinel/schema/kill_switch.hpp>
#include <sentinel/schema/primitives.hpp>

TEST(primitives, make_id_is_stable_per_key) {
  auto first = sentinel::schema::make_id("production_change");
  auto second = sentinel::schema::make_id("production_change");
  auto other = sentinel::schema::make_id("data_access");
  EXPECT_EQ(first, second);
  EXPECT_NE(first, other);
  EXPECT_NE(first, sentinel::schema::hash32_t{});
}

TEST(primitives, hex_round_trips_hash) {
  auto id = sentinel::schema::make_id("gate");
  auto hex = sentinel::schema::to_hex(id);
  EXPECT_EQ(hex.size(), 64u);
  auto parsed = sentinel::schema::try_make_hash32(hex);
  ASSERT_TRUE(parsed.has_value());
  EXPECT_EQ(*parsed, id);
}

TEST(primitives, try_from_hex_rejects_invalid_input) {
  EXPECT_FALSE(sentinel::schema::try_from_hex("abc").has_value());
  EXPECT_FALSE(sentinel::schema::try_from_hex("zz").has_value());
  EXPECT_FALSE(sentinel::schema::try_make_hash32("0102").has_value());
}

TEST(context_value, parses_cli_tokens) {
  using sentinel::schema::context_value_t;
  EXPECT_EQ(sentinel::schema::parse_context_value("null"),
            context_value_t{std::monostate{}});
  EXPECT_EQ(sentinel::schema::parse_context_value("true"),
            context_value_t{true});
  EXPECT_EQ(sentinel::schema::parse_context_value("-42"),
            context_value_t{int64_t{-42}});
  EXPECT_EQ(sentinel::schema::parse_context_value("prod"),
            context_value_t{std::string{"prod"}});
  EXPECT_EQ(sentinel::schema::parse_context_value("12ab"),
            context_value_t{std::string{"12ab"}});
}

TEST(context_value, null_is_distinct_from_false_and_empty_string) {
  auto null_value = sentinel::schema::context_value_t{std::monostate{}};
  EXPECT_NE(null_value, sentinel::schema::make_context_value(false));
  EXPECT_NE(null_value, sentinel::schema::make_context_value(""));
  EXPECT_EQ(sentinel::schema::to_display_string(null_value), "null");
  EXPECT_EQ(sentinel::schema::to_display_string(
                sentinel::schema::make_context_value(int64_t{7})),
            "7");
}

TEST(kill_switch, scope_renders_kind_and_target) {
  auto workflow = sentinel::schema::make_id("payments");
  EXPECT_EQ(sentinel::schema::to_string(
                sentinel::schema::kill_switch_scope_t{
                    sentinel::schema::global_scope_t{}}),
            "GLOBAL");
  EXPECT_EQ(sentinel::schema::to_string(sentinel::schema::kill_switch_scope_t{
                sentinel::schema::workflow_scope_t{.workflow_id = workflow}}),
            "WORKFLOW:" + sentinel::schema::to_hex(workflow));
}

TEST(kill_switch, severity_orders_hard_stop_first) {
  using sentinel::schema::kill_switch_mode_t;
  EXPECT_LT(sentinel::schema::severity_rank(kill_switch_mode_t::hard_stop),
            sentinel::schema::severity_rank(kill_switch_mode_t::soft_stop));
  EXPECT_LT(sentinel::schema::severity_rank(kill_switch_mode_t::soft_stop),
            sentinel::schema::severity_rank(kill_switch_mode_t::read_only));
  EXPECT_LT(sentinel::schema::severity_rank(kill_switch_mode_t::read_only),
            sentinel::schema::severity_rank(kill_switch_mode_t::degrade));
}
