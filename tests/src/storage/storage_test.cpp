#include <onlyswap/schema/encoding/scale/encoder.hpp>
#include <onlyswap/storage/rocksdb/storage.hpp>
#include <onlyswap/storage/storage.hpp>
#include <onlyswap/testing/ledger_fixture.hpp>
#include <gtest/gtest.h>

#include <optional>
#include <string>

namespace {

using storage_t = onlyswap::storage::rocksdb_storage_t;
using encoder_t = onlyswap::schema::encoding::scale_encoder_t;

onlyswap::schema::bytes_t key(const std::string& value) {
  return onlyswap::schema::make_bytes(value);
}

onlyswap::schema::bytes_view_t view(const onlyswap::schema::bytes_t& bytes) {
  return onlyswap::schema::make_bytes_view(bytes);
}

}  // namespace

TEST(storage, defaults_are_stable) {
  auto committed = onlyswap::storage::committed_state{};
  EXPECT_EQ(committed.sequence, 0u);
  EXPECT_TRUE(onlyswap::schema::is_zero(committed.state_root));

  auto entry = onlyswap::storage::key_value_entry_t{};
  EXPECT_TRUE(entry.first.empty());
  EXPECT_TRUE(entry.second.empty());
}

TEST(storage, apply_writes_batch_and_committed_state) {
  auto db = onlyswap::testing::make_db_path("onlyswap_storage_apply");
  {
    auto storage =
        onlyswap::storage::make_storage<onlyswap::storage::rocksdb_storage_tag>(
            db);
    EXPECT_FALSE(storage.load_committed_state().has_value());

    auto state = onlyswap::storage::committed_state{
        .sequence = 1, .state_root = onlyswap::testing::make_hash(10)};
    storage.apply({{key("a"), onlyswap::schema::bytes_t{1}},
                   {key("b"), onlyswap::schema::bytes_t{2}}},
                  state);
    EXPECT_EQ(storage.get(view(key("a"))), onlyswap::schema::bytes_t{1});

    auto next = onlyswap::storage::committed_state{
        .sequence = 2, .state_root = onlyswap::testing::make_hash(11)};
    storage.apply({{key("a"), std::nullopt}}, next);
    EXPECT_FALSE(storage.get(view(key("a"))).has_value());
    EXPECT_EQ(storage.get(view(key("b"))), onlyswap::schema::bytes_t{2});

    auto loaded = storage.load_committed_state();
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(loaded->sequence, 2u);
    EXPECT_EQ(loaded->state_root, next.state_root);
  }
  onlyswap::testing::remove_path(db);
}

TEST(storage, encoded_values_round_trip) {
  auto db = onlyswap::testing::make_db_path("onlyswap_storage_encoded");
  {
    auto storage =
        onlyswap::storage::make_storage<onlyswap::storage::rocksdb_storage_tag>(
            db);
    auto encoder = encoder_t{};
    auto hash = onlyswap::testing::make_hash(3);
    storage.put(encoder, view(key("hash")), hash);
    EXPECT_EQ(storage.get<onlyswap::schema::hash32_t>(encoder,
                                                      view(key("hash"))),
              hash);
    EXPECT_FALSE(storage.get<onlyswap::schema::hash32_t>(encoder,
                                                         view(key("missing")))
                     .has_value());
  }
  onlyswap::testing::remove_path(db);
}

TEST(storage, list_by_prefix_stops_at_prefix_boundary) {
  auto db = onlyswap::testing::make_db_path("onlyswap_storage_prefix");
  {
    auto storage =
        onlyswap::storage::make_storage<onlyswap::storage::rocksdb_storage_tag>(
            db);
    storage.apply({{key("EVT|1"), onlyswap::schema::bytes_t{1}},
                   {key("EVT|2"), onlyswap::schema::bytes_t{2}},
                   {key("EVU|1"), onlyswap::schema::bytes_t{3}}},
                  onlyswap::storage::committed_state{
                      .sequence = 1,
                      .state_root = onlyswap::testing::make_hash(1)});

    auto entries = storage.list_by_prefix(view(key("EVT|")));
    ASSERT_EQ(entries.size(), 2u);
    EXPECT_EQ(entries[0].first, key("EVT|1"));
    EXPECT_EQ(entries[1].second, onlyswap::schema::bytes_t{2});
    EXPECT_TRUE(storage.list_by_prefix(view(key("NONE|"))).empty());
  }
  onlyswap::testing::remove_path(db);
}

TEST(storage, ledger_state_survives_reopen) {
  auto db = onlyswap::testing::make_db_path("onlyswap_storage_reopen");
  auto token = onlyswap::testing::make_hash(1);
  auto account = onlyswap::testing::make_hash(2);
  auto committed = onlyswap::storage::committed_state{};
  {
    auto storage =
        onlyswap::storage::make_storage<onlyswap::storage::rocksdb_storage_tag>(
            db);
    auto chain = onlyswap::execution::ledger{1, storage, 1000};
    ASSERT_EQ(chain.tokens().mint(token, account, 77).code, 0u);
    committed = chain.commit();
  }
  {
    auto storage =
        onlyswap::storage::make_storage<onlyswap::storage::rocksdb_storage_tag>(
            db);
    auto chain = onlyswap::execution::ledger{1, storage, 1000};
    EXPECT_EQ(chain.tokens().balance_of(token, account), 77);
    EXPECT_EQ(chain.state().last_committed().sequence, committed.sequence);
    EXPECT_EQ(chain.state().last_committed().state_root, committed.state_root);
    EXPECT_EQ(chain.event_count(), 1u);
  }
  onlyswap::testing::remove_path(db);
}
