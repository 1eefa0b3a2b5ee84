#pragma once

/** \file checkpoint_mark.hpp
 *  \brief Completion hook the runtime calls once a checkpoint is durably committed.
 */

#include <expected>

#include "shardmark/error.hpp"

namespace shardmark::checkpoint {

/**
 * \brief Uniform lifecycle contract for checkpoints handed to the runtime.
 *
 * The runtime calls acknowledge() unconditionally after committing. The
 * in-memory ReaderCheckpoint never fails; persisting variants report store
 * errors through the returned expected.
 */
class CheckpointMark {
public:
  virtual ~CheckpointMark() = default;

  virtual auto acknowledge() -> std::expected<void, core::error> = 0;
};

} // namespace shardmark::checkpoint
