#pragma once

/** \file shard_checkpoint.hpp
 *  \brief Position of a consumer within a single shard of a stream.
 *
 * A ShardCheckpoint names its stream and shard and says where reading resumes:
 * at or after a sequence number, at the oldest retained record (trim horizon),
 * at the tip of the shard (latest), or at an arrival timestamp.
 *
 * Sequence numbers are decimal strings; the service issues values up to 128 bits,
 * so they are compared numerically on their digits rather than parsed.
 */

#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <string_view>

#include "shardmark/error.hpp"

namespace shardmark::checkpoint {

/** \brief Where a shard reader starts relative to the stored position. */
enum class ShardIteratorType : std::uint8_t {
  AtSequenceNumber,
  AfterSequenceNumber,
  TrimHorizon,
  Latest,
  AtTimestamp,
};

/** \brief Wire name of an iterator type, e.g. "AFTER_SEQUENCE_NUMBER". */
[[nodiscard]] auto to_string(ShardIteratorType type) noexcept -> std::string_view;

/** \brief Inverse of to_string; nullopt for unknown names (matching is exact). */
[[nodiscard]] auto parse_iterator_type(std::string_view name) noexcept
    -> std::optional<ShardIteratorType>;

/** \brief True when `s` is a non-empty run of ASCII digits. */
[[nodiscard]] auto is_valid_sequence_number(std::string_view s) noexcept -> bool;

/** \brief Numeric comparison of two decimal sequence numbers of any length.
 *  \return negative, zero or positive like std::string::compare
 */
[[nodiscard]] auto compare_sequence_numbers(std::string_view a, std::string_view b) noexcept -> int;

/** \brief Position of one record as seen by the shard reading loop. */
struct RecordPosition {
  std::string sequence_number;             /**< decimal sequence number */
  std::uint64_t sub_sequence_number{0};    /**< index inside an aggregated record */
  std::int64_t approximate_arrival_ms{0};  /**< service arrival time, epoch millis */
};

/**
 * \brief Immutable per-shard position.
 *
 * Field requirements (checked by create()):
 * - stream_name and shard_id are non-empty
 * - AtSequenceNumber / AfterSequenceNumber carry a valid sequence number and no timestamp
 * - AtTimestamp carries a timestamp and no sequence data
 * - TrimHorizon / Latest carry neither
 */
class ShardCheckpoint {
public:
  [[nodiscard]] static auto create(std::string stream_name, std::string shard_id,
                                   ShardIteratorType type,
                                   std::string sequence_number = {},
                                   std::optional<std::uint64_t> sub_sequence_number = std::nullopt,
                                   std::optional<std::int64_t> timestamp_ms = std::nullopt)
      -> std::expected<ShardCheckpoint, core::error>;

  [[nodiscard]] static auto trim_horizon(std::string stream_name, std::string shard_id)
      -> std::expected<ShardCheckpoint, core::error>;
  [[nodiscard]] static auto latest(std::string stream_name, std::string shard_id)
      -> std::expected<ShardCheckpoint, core::error>;
  [[nodiscard]] static auto at_timestamp(std::string stream_name, std::string shard_id,
                                         std::int64_t timestamp_ms)
      -> std::expected<ShardCheckpoint, core::error>;
  [[nodiscard]] static auto at_sequence(std::string stream_name, std::string shard_id,
                                        std::string sequence_number,
                                        std::optional<std::uint64_t> sub_sequence_number = std::nullopt)
      -> std::expected<ShardCheckpoint, core::error>;
  [[nodiscard]] static auto after_sequence(std::string stream_name, std::string shard_id,
                                           std::string sequence_number,
                                           std::optional<std::uint64_t> sub_sequence_number = std::nullopt)
      -> std::expected<ShardCheckpoint, core::error>;

  [[nodiscard]] auto stream_name() const noexcept -> const std::string& { return stream_name_; }
  [[nodiscard]] auto shard_id() const noexcept -> const std::string& { return shard_id_; }
  [[nodiscard]] auto iterator_type() const noexcept -> ShardIteratorType { return type_; }
  [[nodiscard]] auto sequence_number() const noexcept -> const std::string& { return sequence_number_; }
  [[nodiscard]] auto sub_sequence_number() const noexcept -> std::optional<std::uint64_t> {
    return sub_sequence_number_;
  }
  [[nodiscard]] auto timestamp_ms() const noexcept -> std::optional<std::int64_t> { return timestamp_ms_; }

  /** \brief Position just past `record` in the same shard.
   *  Fails with precondition_failed when the record's sequence number is not valid.
   */
  [[nodiscard]] auto move_after(const RecordPosition& record) const
      -> std::expected<ShardCheckpoint, core::error>;

  /** \brief True when reading from this position would deliver `record`.
   *  Sentinel positions accept every record. Equal sequence positions are
   *  accepted only for AtSequenceNumber.
   */
  [[nodiscard]] auto is_before_or_at(const RecordPosition& record) const noexcept -> bool;

  /// Diagnostics only: ShardCheckpoint{stream=..., shard=..., type=..., ...}
  [[nodiscard]] auto to_string() const -> std::string;

  friend bool operator==(const ShardCheckpoint&, const ShardCheckpoint&) = default;

private:
  ShardCheckpoint() = default;

  std::string stream_name_;
  std::string shard_id_;
  ShardIteratorType type_{ShardIteratorType::TrimHorizon};
  std::string sequence_number_;
  std::optional<std::uint64_t> sub_sequence_number_;
  std::optional<std::int64_t> timestamp_ms_;
};

} // namespace shardmark::checkpoint
