#include "shardmark/checkpoint/shard_reader.hpp"

#include <mutex>
#include <utility>

namespace shardmark::checkpoint {

ShardPositionTracker::ShardPositionTracker(ShardCheckpoint initial) : current_(std::move(initial)) {}

auto ShardPositionTracker::shard_id() const -> std::string {
  std::shared_lock lock(mutex_);
  return current_.shard_id();
}

auto ShardPositionTracker::checkpoint() const -> ShardCheckpoint {
  std::shared_lock lock(mutex_);
  return current_;
}

auto ShardPositionTracker::advance(const RecordPosition& record) -> std::expected<void, core::error> {
  std::unique_lock lock(mutex_);
  if (!current_.is_before_or_at(record)) return {};
  auto next = current_.move_after(record);
  if (!next) return std::unexpected(next.error());
  current_ = std::move(*next);
  return {};
}

auto ShardPositionTracker::reset(ShardCheckpoint position) -> std::expected<void, core::error> {
  std::unique_lock lock(mutex_);
  if (position.stream_name() != current_.stream_name() || position.shard_id() != current_.shard_id()) {
    return std::unexpected(core::error{core::error_code::precondition_failed,
                                       "position for " + position.stream_name() + "/" + position.shard_id() +
                                           " given to tracker of " + current_.stream_name() + "/" +
                                           current_.shard_id(),
                                       "checkpoint.tracker"});
  }
  current_ = std::move(position);
  return {};
}

} // namespace shardmark::checkpoint
