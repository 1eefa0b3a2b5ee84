#pragma once

/** \file reader_checkpoint.hpp
 *  \brief Aggregate progress of a group of shard readers, and its splitter.
 *
 * A ReaderCheckpoint is an ordered, immutable list of ShardCheckpoint values.
 * It may cover any subset of the shards of a stream, from none to all of them.
 *
 * Thread-safety: instances are never modified after construction; every const
 * member may be called concurrently.
 *
 * Precondition: each (stream, shard) pair appears at most once. Construction
 * does not check this; validate_unique_shards() does.
 */

#include <cstddef>
#include <cstdint>
#include <expected>
#include <memory>
#include <span>
#include <string>
#include <vector>

#include "shardmark/error.hpp"
#include "shardmark/checkpoint/checkpoint_mark.hpp"
#include "shardmark/checkpoint/shard_checkpoint.hpp"
#include "shardmark/checkpoint/shard_reader.hpp"

namespace shardmark::checkpoint {

class ReaderCheckpoint final : public CheckpointMark {
public:
  using const_iterator = std::vector<ShardCheckpoint>::const_iterator;

  ReaderCheckpoint() = default;

  /** \brief Copies `shard_checkpoints` in order; the source may change afterwards. */
  explicit ReaderCheckpoint(std::span<const ShardCheckpoint> shard_checkpoints);
  explicit ReaderCheckpoint(std::vector<ShardCheckpoint> shard_checkpoints) noexcept;

  /** \brief Snapshot of the current position of each reader, in the given order.
   *  Each reader is read once; readers advanced concurrently by other threads
   *  yield a per-shard consistent (not globally consistent) snapshot.
   *  A null reader fails with precondition_failed.
   */
  [[nodiscard]] static auto from_live_readers(std::span<const ShardRecordsIterator* const> readers)
      -> std::expected<ReaderCheckpoint, core::error>;

  [[nodiscard]] static auto from_live_readers(
      const std::vector<std::shared_ptr<ShardRecordsIterator>>& readers)
      -> std::expected<ReaderCheckpoint, core::error>;

  /**
   * \brief Splits into at most `desired_splits` checkpoints of consecutive shards.
   *
   * Partition size is ceil(size() / desired_splits); the last partition may be
   * shorter. Fewer partitions than requested are produced when there are fewer
   * shards than splits, and none when the checkpoint is empty. Concatenating
   * the result in order gives back this checkpoint.
   *
   * \param desired_splits upper bound on the number of partitions, must be > 0
   * \return partitions in order, or precondition_failed when desired_splits <= 0
   */
  [[nodiscard]] auto split_into(std::int64_t desired_splits) const
      -> std::expected<std::vector<ReaderCheckpoint>, core::error>;

  /** \brief precondition_failed naming the first repeated (stream, shard) pair. */
  [[nodiscard]] auto validate_unique_shards() const -> std::expected<void, core::error>;

  /** \brief No-op at this layer; always succeeds. */
  auto acknowledge() -> std::expected<void, core::error> override;

  [[nodiscard]] auto begin() const noexcept -> const_iterator { return shard_checkpoints_.begin(); }
  [[nodiscard]] auto end() const noexcept -> const_iterator { return shard_checkpoints_.end(); }
  [[nodiscard]] auto size() const noexcept -> std::size_t { return shard_checkpoints_.size(); }
  [[nodiscard]] auto empty() const noexcept -> bool { return shard_checkpoints_.empty(); }
  [[nodiscard]] auto operator[](std::size_t i) const -> const ShardCheckpoint& { return shard_checkpoints_[i]; }
  [[nodiscard]] auto shard_checkpoints() const noexcept -> std::span<const ShardCheckpoint> {
    return shard_checkpoints_;
  }

  /// Diagnostics only: [ShardCheckpoint{...}, ...]
  [[nodiscard]] auto to_string() const -> std::string;

  friend bool operator==(const ReaderCheckpoint& a, const ReaderCheckpoint& b) {
    return a.shard_checkpoints_ == b.shard_checkpoints_;
  }

private:
  std::vector<ShardCheckpoint> shard_checkpoints_;
};

} // namespace shardmark::checkpoint
