#pragma once

/** \file codec.hpp
 *  \brief Text encoding of a ReaderCheckpoint.
 *
 * Format (v1):
 *   header: "shardmark-reader-checkpoint v1"\n
 *   lines:  stream=<name> shard=<id> type=<TYPE> [seq=<digits>] [subseq=<u64>] [ts=<i64>]\n
 *
 * One line per shard, in checkpoint order. Blank lines are ignored on decode.
 * Names must be non-empty and contain no whitespace, '=' or control characters.
 */

#include <expected>
#include <string>
#include <string_view>

#include "shardmark/error.hpp"
#include "shardmark/checkpoint/reader_checkpoint.hpp"

namespace shardmark::checkpoint {

inline constexpr std::string_view kCodecHeader = "shardmark-reader-checkpoint v1";

/** \brief Encodes `ck`; invalid_argument when a name cannot be represented. */
[[nodiscard]] auto encode(const ReaderCheckpoint& ck) -> std::expected<std::string, core::error>;

/** \brief Decodes a v1 document. Any malformed input is data_integrity (never throws).
 *  Decoded checkpoints are checked with validate_unique_shards().
 */
[[nodiscard]] auto decode(std::string_view text) -> std::expected<ReaderCheckpoint, core::error>;

} // namespace shardmark::checkpoint
