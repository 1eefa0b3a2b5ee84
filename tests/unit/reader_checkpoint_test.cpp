#include <catch2/catch_test_macros.hpp>

#include <memory>
#include <string>
#include <vector>

#include <shardmark/checkpoint/checkpoint_mark.hpp>
#include <shardmark/checkpoint/reader_checkpoint.hpp>
#include <shardmark/checkpoint/shard_reader.hpp>
#include <tests/support/checkpoint_fixtures.hpp>

using namespace shardmark;
using checkpoint::ReaderCheckpoint;
using checkpoint::ShardCheckpoint;
using checkpoint::ShardRecordsIterator;

TEST_CASE("construction copies the source positions", "[checkpoint][reader]") {
  auto shards = test_support::positions(3);
  ReaderCheckpoint ck{std::span<const ShardCheckpoint>(shards)};

  shards[0] = test_support::position("shardId-999", "1");
  shards.pop_back();

  REQUIRE(ck.size() == 3);
  REQUIRE(ck[0].shard_id() == test_support::shard_name(0));
  REQUIRE(ck[2].shard_id() == test_support::shard_name(2));
}

TEST_CASE("empty checkpoint is valid", "[checkpoint][reader]") {
  ReaderCheckpoint ck{std::vector<ShardCheckpoint>{}};
  REQUIRE(ck.empty());
  REQUIRE(ck.size() == 0);
  REQUIRE(ck.begin() == ck.end());
  REQUIRE(ck.to_string() == "[]");
  REQUIRE(ck == ReaderCheckpoint{});
}

TEST_CASE("iteration is restartable and in stored order", "[checkpoint][reader]") {
  auto shards = test_support::positions(5);
  ReaderCheckpoint ck(shards);

  std::vector<ShardCheckpoint> first(ck.begin(), ck.end());
  std::vector<ShardCheckpoint> second;
  for (const auto& s : ck) second.push_back(s);

  REQUIRE(first == shards);
  REQUIRE(second == shards);
  REQUIRE(ck.shard_checkpoints().size() == 5);
}

TEST_CASE("equality is structural over the ordered sequence", "[checkpoint][reader]") {
  auto shards = test_support::positions(3);
  ReaderCheckpoint a(shards);
  ReaderCheckpoint b(shards);
  REQUIRE(a == b);

  std::vector<ShardCheckpoint> reversed(shards.rbegin(), shards.rend());
  REQUIRE_FALSE(a == ReaderCheckpoint(reversed));
  REQUIRE_FALSE(a == test_support::reader_checkpoint(2));
}

TEST_CASE("to_string lists every position in order", "[checkpoint][reader]") {
  auto shards = std::vector{
      test_support::position("shardId-000000000000", "42"),
      ShardCheckpoint::trim_horizon("orders", "shardId-000000000001").value(),
  };
  ReaderCheckpoint ck(shards);
  REQUIRE(ck.to_string() ==
          "[ShardCheckpoint{stream=orders, shard=shardId-000000000000, type=AFTER_SEQUENCE_NUMBER, seq=42}, "
          "ShardCheckpoint{stream=orders, shard=shardId-000000000001, type=TRIM_HORIZON}]");
  REQUIRE(ck.to_string() == ReaderCheckpoint(shards).to_string());
}

TEST_CASE("acknowledge always succeeds and changes nothing", "[checkpoint][reader][lifecycle]") {
  auto ck = test_support::reader_checkpoint(4);
  const auto copy = ck;
  REQUIRE(ck.acknowledge().has_value());
  REQUIRE(ck.acknowledge().has_value());
  REQUIRE(ck == copy);

  ReaderCheckpoint empty;
  checkpoint::CheckpointMark& mark = empty;
  REQUIRE(mark.acknowledge().has_value());
}

TEST_CASE("validate_unique_shards reports the first duplicate", "[checkpoint][reader][errors]") {
  REQUIRE(test_support::reader_checkpoint(6).validate_unique_shards().has_value());
  REQUIRE(ReaderCheckpoint{}.validate_unique_shards().has_value());

  auto shards = test_support::positions(3);
  shards.push_back(test_support::position(test_support::shard_name(1), "5000"));
  ReaderCheckpoint dup(shards);
  REQUIRE(dup.size() == 4);  // construction itself does not reject duplicates
  auto v = dup.validate_unique_shards();
  REQUIRE_FALSE(v.has_value());
  REQUIRE(v.error().code == core::error_code::precondition_failed);
  REQUIRE(v.error().message.find(test_support::shard_name(1)) != std::string::npos);

  // Same shard id on a different stream is a different shard.
  std::vector<ShardCheckpoint> two_streams{
      ShardCheckpoint::latest("orders", "shardId-000000000000").value(),
      ShardCheckpoint::latest("payments", "shardId-000000000000").value(),
  };
  REQUIRE(ReaderCheckpoint(two_streams).validate_unique_shards().has_value());
}

TEST_CASE("from_live_readers snapshots each reader once in order", "[checkpoint][reader][snapshot]") {
  auto shards = test_support::positions(4);
  std::vector<std::unique_ptr<test_support::FixedShardReader>> owned;
  std::vector<const ShardRecordsIterator*> readers;
  for (const auto& s : shards) {
    owned.push_back(std::make_unique<test_support::FixedShardReader>(s));
    readers.push_back(owned.back().get());
  }

  auto ck = ReaderCheckpoint::from_live_readers(readers);
  REQUIRE(ck.has_value());
  REQUIRE(*ck == ReaderCheckpoint(shards));
  for (const auto& r : owned) REQUIRE(r->reads() == 1);
}

TEST_CASE("from_live_readers accepts shared reader handles", "[checkpoint][reader][snapshot]") {
  auto shards = test_support::positions(3);
  std::vector<std::shared_ptr<ShardRecordsIterator>> readers;
  for (auto it = shards.rbegin(); it != shards.rend(); ++it)
    readers.push_back(std::make_shared<checkpoint::ShardPositionTracker>(*it));

  auto ck = ReaderCheckpoint::from_live_readers(readers);
  REQUIRE(ck.has_value());
  REQUIRE(ck->size() == 3);
  REQUIRE((*ck)[0] == shards[2]);
  REQUIRE((*ck)[2] == shards[0]);

  auto none = ReaderCheckpoint::from_live_readers(std::vector<std::shared_ptr<ShardRecordsIterator>>{});
  REQUIRE(none.has_value());
  REQUIRE(none->empty());
}

TEST_CASE("from_live_readers rejects a null reader", "[checkpoint][reader][snapshot][errors]") {
  test_support::FixedShardReader r0(test_support::position("shardId-000000000000", "1"));
  std::vector<const ShardRecordsIterator*> readers{&r0, nullptr};

  auto ck = ReaderCheckpoint::from_live_readers(readers);
  REQUIRE_FALSE(ck.has_value());
  REQUIRE(ck.error().code == core::error_code::precondition_failed);
  REQUIRE(ck.error().message.find("index 1") != std::string::npos);
}
