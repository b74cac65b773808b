#include <gtest/gtest.h>
#include <sentinel/schema/encoding/scale/encoder.hpp>
#include <sentinel/schema/key/keys.hpp>
#include <sentinel/storage/rocksdb/storage.hpp>
#include <sentinel/testing/common.hpp>

#include <string>

namespace {

using encoder_t = sentinel::schema::encoding::encoder<
    sentinel::schema::encoding::scale_encoder_tag>;

sentinel::schema::bytes_view_t view(const sentinel::schema::bytes_t& bytes) {
  return sentinel::schema::bytes_view_t{bytes.data(), bytes.size()};
}

}  // namespace

TEST(storage, get_returns_nullopt_for_missing_key) {
  auto db = sentinel::testing::make_db_path("sentinel_storage_missing");
  {
    auto storage = sentinel::storage::make_storage<
        sentinel::storage::rocksdb_storage_tag>(db);
    auto encoder = encoder_t{};
    auto key = sentinel::schema::key::make_kill_switch_key(
        sentinel::schema::make_id("missing"));
    EXPECT_FALSE(
        storage.get<sentinel::schema::kill_switch_t>(encoder, view(key))
            .has_value());
    EXPECT_FALSE(storage.get_raw(view(key)).has_value());
  }
  sentinel::testing::remove_path(db);
}

TEST(storage, typed_put_and_get_round_trip) {
  auto db = sentinel::testing::make_db_path("sentinel_storage_typed");
  {
    auto storage = sentinel::storage::make_storage<
        sentinel::storage::rocksdb_storage_tag>(db);
    auto encoder = encoder_t{};
    auto gate = sentinel::schema::enforcement_gate_t{};
    gate.id = sentinel::schema::make_id("production_change");
    gate.key = "production_change";
    gate.type = sentinel::schema::gate_type_t::production_change;
    gate.policy_ids = {sentinel::schema::make_id("p1"),
                       sentinel::schema::make_id("p2")};
    auto key = sentinel::schema::key::make_enforcement_gate_key(gate.id);
    storage.put(encoder, view(key), gate);

    auto loaded =
        storage.get<sentinel::schema::enforcement_gate_t>(encoder, view(key));
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(loaded->key, gate.key);
    EXPECT_EQ(loaded->policy_ids, gate.policy_ids);
  }
  sentinel::testing::remove_path(db);
}

TEST(storage, write_batch_persists_every_entry) {
  auto db = sentinel::testing::make_db_path("sentinel_storage_batch");
  {
    auto storage = sentinel::storage::make_storage<
        sentinel::storage::rocksdb_storage_tag>(db);
    auto first = sentinel::schema::key::make_ledger_event_key(1);
    auto tip = sentinel::schema::key::make_ledger_tip_key();
    ASSERT_TRUE(storage.write_batch(
        {{first, sentinel::schema::bytes_t{0x01}},
         {tip, sentinel::schema::bytes_t{0x02, 0x03}}}));

    EXPECT_EQ(storage.get_raw(view(first)),
              std::optional{sentinel::schema::bytes_t{0x01}});
    EXPECT_EQ(storage.get_raw(view(tip)),
              std::optional{sentinel::schema::bytes_t{0x02, 0x03}});
  }
  sentinel::testing::remove_path(db);
}

TEST(storage, list_by_prefix_is_ordered_and_bounded) {
  auto db = sentinel::testing::make_db_path("sentinel_storage_prefix");
  {
    auto storage = sentinel::storage::make_storage<
        sentinel::storage::rocksdb_storage_tag>(db);
    for (auto sequence : {uint64_t{300}, uint64_t{2}, uint64_t{17}}) {
      auto key = sentinel::schema::key::make_ledger_event_key(sequence);
      auto value = sentinel::schema::bytes_t{static_cast<uint8_t>(sequence)};
      storage.put_raw(view(key), view(value));
    }
    auto outside = sentinel::schema::key::make_ledger_tip_key();
    auto marker = sentinel::schema::bytes_t{0xFF};
    storage.put_raw(view(outside), view(marker));

    auto prefix = sentinel::schema::key::make_prefix(
        sentinel::schema::key::kLedgerEventPrefix);
    auto entries = storage.list_by_prefix(view(prefix));
    ASSERT_EQ(entries.size(), 3u);
    EXPECT_EQ(sentinel::schema::key::parse_ledger_event_key(
                  view(entries[0].first)),
              std::optional<uint64_t>{2});
    EXPECT_EQ(sentinel::schema::key::parse_ledger_event_key(
                  view(entries[1].first)),
              std::optional<uint64_t>{17});
    EXPECT_EQ(sentinel::schema::key::parse_ledger_event_key(
                  view(entries[2].first)),
              std::optional<uint64_t>{300});
  }
  sentinel::testing::remove_path(db);
}
