#pragma once

/** \file store.hpp
 *  \brief Durable per-consumer storage of ReaderCheckpoint values.
 *
 * Layout: <dir>/reader.checkpoints/<consumer>.ckpt, encoded with codec.hpp.
 *
 * Atomic save (POSIX):
 * - Write contents to <consumer>.ckpt.tmp in the same directory
 * - fsync(tmp) when StoreOptions::durable is set
 * - rename(tmp, <consumer>.ckpt), replacing any previous checkpoint
 * - Best-effort fsync of the parent directory when durable
 * - On failure the tmp file is removed and io_failed is returned; the previous
 *   checkpoint, if any, is left intact.
 *
 * When SHARDMARK_ENABLE_ATOMIC_RENAME is 0 at compile time, save falls back to a
 * truncating write of the destination.
 */

#include <expected>
#include <filesystem>
#include <string>
#include <string_view>

#include "shardmark/error.hpp"
#include "shardmark/checkpoint/checkpoint_mark.hpp"
#include "shardmark/checkpoint/reader_checkpoint.hpp"

namespace shardmark::checkpoint {

struct StoreOptions {
  std::filesystem::path dir;  /**< root directory; reader.checkpoints/ is created below it */
  bool durable{true};         /**< fsync file and directory on save */
};

/**
 * \brief Store options from the environment.
 *  - SHARDMARK_CHECKPOINT_DIR (required, non-empty)
 *  - SHARDMARK_CHECKPOINT_DURABLE (optional, "0"/"false"/"off"/"no" disables fsync)
 *  \return options or config_invalid
 */
[[nodiscard]] auto load_store_options_from_env() -> std::expected<StoreOptions, core::error>;

/** \brief Path of the checkpoint file of `consumer` (no validation). */
[[nodiscard]] auto checkpoint_path(const StoreOptions& options, std::string_view consumer) -> std::filesystem::path;

[[nodiscard]] auto save_checkpoint(const StoreOptions& options, std::string_view consumer,
                                   const ReaderCheckpoint& ck) -> std::expected<void, core::error>;

/** \brief not_found when nothing was saved for `consumer`. */
[[nodiscard]] auto load_checkpoint(const StoreOptions& options, std::string_view consumer)
    -> std::expected<ReaderCheckpoint, core::error>;

/** \brief Removing a missing checkpoint succeeds. */
[[nodiscard]] auto remove_checkpoint(const StoreOptions& options, std::string_view consumer)
    -> std::expected<void, core::error>;

/**
 * \brief CheckpointMark whose acknowledgement persists the checkpoint.
 *
 * Used by runtimes that commit on acknowledge: the wrapped checkpoint is saved
 * under `consumer` each time acknowledge() is called.
 */
class PersistingCheckpointMark final : public CheckpointMark {
public:
  PersistingCheckpointMark(ReaderCheckpoint checkpoint, std::string consumer, StoreOptions options);

  auto acknowledge() -> std::expected<void, core::error> override;

  [[nodiscard]] auto checkpoint() const noexcept -> const ReaderCheckpoint& { return checkpoint_; }
  [[nodiscard]] auto consumer() const noexcept -> const std::string& { return consumer_; }

private:
  ReaderCheckpoint checkpoint_;
  std::string consumer_;
  StoreOptions options_;
};

} // namespace shardmark::checkpoint
