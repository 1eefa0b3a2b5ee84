#include "shardmark/checkpoint/reader_checkpoint.hpp"

#include "shardmark/core/logging.hpp"

#include <algorithm>
#include <set>
#include <utility>

namespace shardmark::checkpoint {

namespace {

constexpr const char* kComponent = "checkpoint.reader";

auto divide_and_round_up(std::size_t numerator, std::size_t denominator) noexcept -> std::size_t {
  return (numerator + denominator - 1) / denominator;
}

} // namespace

ReaderCheckpoint::ReaderCheckpoint(std::span<const ShardCheckpoint> shard_checkpoints)
    : shard_checkpoints_(shard_checkpoints.begin(), shard_checkpoints.end()) {}

ReaderCheckpoint::ReaderCheckpoint(std::vector<ShardCheckpoint> shard_checkpoints) noexcept
    : shard_checkpoints_(std::move(shard_checkpoints)) {}

auto ReaderCheckpoint::from_live_readers(std::span<const ShardRecordsIterator* const> readers)
    -> std::expected<ReaderCheckpoint, core::error> {
  std::vector<ShardCheckpoint> snapshot;
  snapshot.reserve(readers.size());
  for (std::size_t i = 0; i < readers.size(); ++i) {
    if (readers[i] == nullptr) {
      return std::unexpected(core::error{core::error_code::precondition_failed,
                                         "null shard reader at index " + std::to_string(i), kComponent});
    }
    snapshot.push_back(readers[i]->checkpoint());
  }
  SHARDMARK_TRACE("snapshot of {} shard readers", snapshot.size());
  return ReaderCheckpoint(std::move(snapshot));
}

auto ReaderCheckpoint::from_live_readers(const std::vector<std::shared_ptr<ShardRecordsIterator>>& readers)
    -> std::expected<ReaderCheckpoint, core::error> {
  std::vector<const ShardRecordsIterator*> raw;
  raw.reserve(readers.size());
  for (const auto& r : readers) raw.push_back(r.get());
  return from_live_readers(std::span<const ShardRecordsIterator* const>(raw));
}

auto ReaderCheckpoint::split_into(std::int64_t desired_splits) const
    -> std::expected<std::vector<ReaderCheckpoint>, core::error> {
  if (desired_splits <= 0) {
    return std::unexpected(core::error{core::error_code::precondition_failed,
                                       "desired split count must be positive, got " + std::to_string(desired_splits),
                                       kComponent});
  }
  const std::size_t total = shard_checkpoints_.size();
  std::vector<ReaderCheckpoint> partitions;
  if (total == 0) {
    SHARDMARK_DEBUG("split of empty checkpoint into {} yields no partitions", desired_splits);
    return partitions;
  }

  // A split count above the shard count behaves like the shard count.
  const std::size_t n = static_cast<std::uint64_t>(desired_splits) < total
                            ? static_cast<std::size_t>(desired_splits)
                            : total;
  const std::size_t partition_size = divide_and_round_up(total, n);

  partitions.reserve(divide_and_round_up(total, partition_size));
  for (std::size_t first = 0; first < total; first += partition_size) {
    const std::size_t last = std::min(total, first + partition_size);
    partitions.emplace_back(std::vector<ShardCheckpoint>(shard_checkpoints_.begin() + static_cast<std::ptrdiff_t>(first),
                                                         shard_checkpoints_.begin() + static_cast<std::ptrdiff_t>(last)));
  }
  SHARDMARK_DEBUG("split {} shards into {} partitions of up to {} (requested {})", total, partitions.size(),
                  partition_size, desired_splits);
  return partitions;
}

auto ReaderCheckpoint::validate_unique_shards() const -> std::expected<void, core::error> {
  std::set<std::pair<std::string_view, std::string_view>> seen;
  for (const auto& ck : shard_checkpoints_) {
    if (!seen.emplace(ck.stream_name(), ck.shard_id()).second) {
      return std::unexpected(core::error{core::error_code::precondition_failed,
                                         "duplicate shard " + ck.stream_name() + "/" + ck.shard_id(), kComponent});
    }
  }
  return {};
}

auto ReaderCheckpoint::acknowledge() -> std::expected<void, core::error> {
  return {};
}

auto ReaderCheckpoint::to_string() const -> std::string {
  std::string out = "[";
  for (std::size_t i = 0; i < shard_checkpoints_.size(); ++i) {
    if (i) out += ", ";
    out += shard_checkpoints_[i].to_string();
  }
  out += "]";
  return out;
}

} // namespace shardmark::checkpoint
