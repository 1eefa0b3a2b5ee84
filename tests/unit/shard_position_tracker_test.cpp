#include <catch2/catch_test_macros.hpp>

#include <atomic>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include <shardmark/checkpoint/reader_checkpoint.hpp>
#include <shardmark/checkpoint/shard_reader.hpp>
#include <tests/support/checkpoint_fixtures.hpp>

using namespace shardmark;
using checkpoint::RecordPosition;
using checkpoint::ShardCheckpoint;
using checkpoint::ShardIteratorType;
using checkpoint::ShardPositionTracker;

TEST_CASE("tracker advances past delivered records", "[checkpoint][tracker]") {
  ShardPositionTracker t(ShardCheckpoint::trim_horizon("orders", "shardId-0").value());
  REQUIRE(t.shard_id() == "shardId-0");

  REQUIRE(t.advance(RecordPosition{"10", 0, 0}).has_value());
  REQUIRE(t.checkpoint() == ShardCheckpoint::after_sequence("orders", "shardId-0", "10", 0).value());

  REQUIRE(t.advance(RecordPosition{"11", 0, 0}).has_value());
  REQUIRE(t.checkpoint().sequence_number() == "11");
}

TEST_CASE("tracker ignores records it is already past", "[checkpoint][tracker]") {
  ShardPositionTracker t(ShardCheckpoint::after_sequence("orders", "shardId-0", "50").value());
  REQUIRE(t.advance(RecordPosition{"40", 0, 0}).has_value());
  REQUIRE(t.advance(RecordPosition{"50", 0, 0}).has_value());
  REQUIRE(t.checkpoint().sequence_number() == "50");
  REQUIRE(t.checkpoint().iterator_type() == ShardIteratorType::AfterSequenceNumber);
}

TEST_CASE("tracker rejects malformed records and foreign positions", "[checkpoint][tracker][errors]") {
  ShardPositionTracker t(ShardCheckpoint::latest("orders", "shardId-0").value());
  auto bad = t.advance(RecordPosition{"not-a-number", 0, 0});
  REQUIRE_FALSE(bad.has_value());
  REQUIRE(t.checkpoint().iterator_type() == ShardIteratorType::Latest);

  auto foreign = t.reset(ShardCheckpoint::latest("orders", "shardId-1").value());
  REQUIRE_FALSE(foreign.has_value());
  REQUIRE(foreign.error().code == core::error_code::precondition_failed);

  REQUIRE(t.reset(ShardCheckpoint::at_sequence("orders", "shardId-0", "7").value()).has_value());
  REQUIRE(t.checkpoint().iterator_type() == ShardIteratorType::AtSequenceNumber);
}

TEST_CASE("snapshots taken while readers advance are per-shard consistent", "[checkpoint][tracker][snapshot]") {
  constexpr std::size_t kShards = 4;
  constexpr int kRecords = 2000;

  std::vector<std::shared_ptr<checkpoint::ShardRecordsIterator>> readers;
  std::vector<std::shared_ptr<ShardPositionTracker>> trackers;
  for (std::size_t i = 0; i < kShards; ++i) {
    auto t = std::make_shared<ShardPositionTracker>(
        ShardCheckpoint::trim_horizon("orders", test_support::shard_name(i)).value());
    trackers.push_back(t);
    readers.push_back(t);
  }

  std::atomic<bool> failed{false};
  std::vector<std::thread> writers;
  for (auto& t : trackers) {
    writers.emplace_back([&failed, t] {
      for (int r = 1; r <= kRecords; ++r) {
        if (!t->advance(RecordPosition{std::to_string(r), 0, 0}).has_value()) failed = true;
      }
    });
  }

  std::vector<std::string> last(kShards, "0");
  for (int round = 0; round < 200; ++round) {
    auto ck = checkpoint::ReaderCheckpoint::from_live_readers(readers);
    REQUIRE(ck.has_value());
    REQUIRE(ck->size() == kShards);
    for (std::size_t i = 0; i < kShards; ++i) {
      const auto& s = (*ck)[i];
      REQUIRE(s.shard_id() == test_support::shard_name(i));
      if (s.iterator_type() == ShardIteratorType::TrimHorizon) continue;
      REQUIRE(s.iterator_type() == ShardIteratorType::AfterSequenceNumber);
      // Positions of one shard never go backwards between snapshots.
      REQUIRE(checkpoint::compare_sequence_numbers(last[i], s.sequence_number()) <= 0);
      last[i] = s.sequence_number();
    }
  }
  for (auto& w : writers) w.join();
  REQUIRE_FALSE(failed.load());

  auto final_ck = checkpoint::ReaderCheckpoint::from_live_readers(readers);
  REQUIRE(final_ck.has_value());
  for (const auto& s : *final_ck) REQUIRE(s.sequence_number() == std::to_string(kRecords));
}
