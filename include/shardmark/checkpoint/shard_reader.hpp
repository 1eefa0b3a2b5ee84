#pragma once

/** \file shard_reader.hpp
 *  \brief Read-only view of a live shard reader, and a thread-safe position holder.
 */

#include <expected>
#include <shared_mutex>
#include <string>

#include "shardmark/error.hpp"
#include "shardmark/checkpoint/shard_checkpoint.hpp"

namespace shardmark::checkpoint {

/**
 * \brief Live reader bound to one shard.
 *
 * Snapshotting only calls checkpoint(); implementations must allow that call
 * while the reading loop advances the reader on another thread.
 */
class ShardRecordsIterator {
public:
  virtual ~ShardRecordsIterator() = default;

  [[nodiscard]] virtual auto shard_id() const -> std::string = 0;

  /** \brief Current position; each call is one consistent read. */
  [[nodiscard]] virtual auto checkpoint() const -> ShardCheckpoint = 0;
};

/**
 * \brief ShardRecordsIterator that only tracks the position.
 *
 * The reading loop calls advance() after handing a record downstream; any
 * thread may call checkpoint() concurrently.
 */
class ShardPositionTracker final : public ShardRecordsIterator {
public:
  explicit ShardPositionTracker(ShardCheckpoint initial);

  [[nodiscard]] auto shard_id() const -> std::string override;
  [[nodiscard]] auto checkpoint() const -> ShardCheckpoint override;

  /** \brief Move past `record`.
   *  Records the position is already past (is_before_or_at() == false) are
   *  ignored, so redelivered records never move the position backwards.
   */
  auto advance(const RecordPosition& record) -> std::expected<void, core::error>;

  /** \brief Replace the position; fails when `position` belongs to another shard. */
  auto reset(ShardCheckpoint position) -> std::expected<void, core::error>;

private:
  mutable std::shared_mutex mutex_;
  ShardCheckpoint current_;
};

} // namespace shardmark::checkpoint
