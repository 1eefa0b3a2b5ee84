#include "shardmark/checkpoint/store.hpp"

#include "shardmark/checkpoint/codec.hpp"
#include "shardmark/core/logging.hpp"
#include "shardmark/core/platform_utils.hpp"

#include <fstream>
#include <iterator>
#include <utility>

#if defined(__linux__) || defined(__APPLE__)
#include <fcntl.h>
#include <unistd.h>
#endif

#ifndef SHARDMARK_ENABLE_ATOMIC_RENAME
#if defined(__linux__) || defined(__APPLE__)
#define SHARDMARK_ENABLE_ATOMIC_RENAME 1
#else
#define SHARDMARK_ENABLE_ATOMIC_RENAME 0
#endif
#endif

#if SHARDMARK_ENABLE_ATOMIC_RENAME && !(defined(__linux__) || defined(__APPLE__))
#error "SHARDMARK_ENABLE_ATOMIC_RENAME requires POSIX fsync (Linux or Apple)"
#endif

namespace shardmark::checkpoint {

namespace {

constexpr const char* kComponent = "checkpoint.store";
constexpr const char* kFolder = "reader.checkpoints";

auto store_error(core::error_code code, std::string message) -> std::unexpected<core::error> {
  return std::unexpected(core::error{code, std::move(message), kComponent});
}

auto validate_consumer(std::string_view consumer) -> std::expected<void, core::error> {
  if (consumer.empty()) return store_error(core::error_code::invalid_argument, "empty consumer name");
  if (consumer.front() == '.') {
    return store_error(core::error_code::invalid_argument, "consumer name starts with '.'");
  }
  for (unsigned char c : consumer) {
    if (c < 0x20 || c == 0x7F || c == '/' || c == '\\') {
      return store_error(core::error_code::invalid_argument, "invalid character in consumer name");
    }
  }
  return {};
}

// A store directory that is missing means "nothing saved"; one that cannot be
// inspected, or is not a directory, is an I/O failure.
auto check_store_dir(const std::filesystem::path& dir) -> std::expected<void, core::error> {
  std::error_code ec;
  const auto st = std::filesystem::status(dir, ec);
  if (st.type() == std::filesystem::file_type::not_found) return {};
  if (ec) {
    SHARDMARK_WARN("cannot stat {}: {}", dir.string(), ec.message());
    return store_error(core::error_code::io_failed, "stat checkpoint folder failed");
  }
  if (!std::filesystem::is_directory(st)) {
    SHARDMARK_WARN("{} is not a directory", dir.string());
    return store_error(core::error_code::io_failed, "checkpoint folder is not a directory");
  }
  return {};
}

#if defined(__linux__) || defined(__APPLE__)
bool fsync_path(const std::filesystem::path& p) {
  int fd = ::open(p.string().c_str(), O_RDONLY);
  if (fd < 0) return false;
  const bool ok = ::fsync(fd) == 0;
  (void)::close(fd);
  return ok;
}
#endif

} // namespace

auto load_store_options_from_env() -> std::expected<StoreOptions, core::error> {
  auto dir = core::safe_getenv("SHARDMARK_CHECKPOINT_DIR");
  if (!dir || dir->empty()) {
    return std::unexpected(core::error{core::error_code::config_invalid,
                                       "SHARDMARK_CHECKPOINT_DIR is not set", "config"});
  }
  StoreOptions opts;
  opts.dir = *dir;
  opts.durable = core::env_flag("SHARDMARK_CHECKPOINT_DURABLE", true);
  return opts;
}

auto checkpoint_path(const StoreOptions& options, std::string_view consumer) -> std::filesystem::path {
  return options.dir / kFolder / (std::string(consumer) + ".ckpt");
}

auto save_checkpoint(const StoreOptions& options, std::string_view consumer, const ReaderCheckpoint& ck)
    -> std::expected<void, core::error> {
  if (auto v = validate_consumer(consumer); !v) return v;
  auto body = encode(ck);
  if (!body) {
    SHARDMARK_WARN("not saving checkpoint for consumer {}: {}", consumer, body.error().message);
    return std::unexpected(body.error());
  }

  const auto folder = options.dir / kFolder;
  std::error_code ec;
  std::filesystem::create_directories(folder, ec);
  if (ec) {
    SHARDMARK_WARN("cannot create {}: {}", folder.string(), ec.message());
    return store_error(core::error_code::io_failed, "mkdir checkpoint folder failed");
  }
  const auto p_dst = checkpoint_path(options, consumer);

#if SHARDMARK_ENABLE_ATOMIC_RENAME
  auto p_tmp = p_dst;
  p_tmp += ".tmp";
  // 1) Write tmp
  {
    std::ofstream out(p_tmp, std::ios::binary | std::ios::trunc);
    if (!out.good()) {
      SHARDMARK_WARN("cannot open {} for writing", p_tmp.string());
      return store_error(core::error_code::io_failed, "checkpoint tmp open failed");
    }
    out << *body;
    out.flush();
    if (!out.good()) {
      out.close();
      std::error_code rec; (void)std::filesystem::remove(p_tmp, rec);
      SHARDMARK_WARN("write to {} failed", p_tmp.string());
      return store_error(core::error_code::io_failed, "checkpoint tmp write failed");
    }
  }
  // 2) Ensure tmp contents durable
  if (options.durable && !fsync_path(p_tmp)) {
    std::error_code rec; (void)std::filesystem::remove(p_tmp, rec);
    SHARDMARK_WARN("fsync of {} failed", p_tmp.string());
    return store_error(core::error_code::io_failed, "checkpoint tmp fsync failed");
  }
  // 3) Atomic replace
  std::filesystem::rename(p_tmp, p_dst, ec);
  if (ec) {
    SHARDMARK_WARN("cannot replace {}: {}", p_dst.string(), ec.message());
    std::error_code rec; (void)std::filesystem::remove(p_tmp, rec);
    return store_error(core::error_code::io_failed, "checkpoint rename failed");
  }
  // 4) Best-effort directory durability
  if (options.durable) (void)fsync_path(folder);
#else
  std::ofstream out(p_dst, std::ios::binary | std::ios::trunc);
  if (out.good()) {
    out << *body;
    out.flush();
  }
  if (!out.good()) {
    SHARDMARK_WARN("write to {} failed", p_dst.string());
    return store_error(core::error_code::io_failed, "checkpoint write failed");
  }
#endif
  SHARDMARK_DEBUG("saved checkpoint of {} shards for consumer {}", ck.size(), consumer);
  return {};
}

auto load_checkpoint(const StoreOptions& options, std::string_view consumer)
    -> std::expected<ReaderCheckpoint, core::error> {
  if (auto v = validate_consumer(consumer); !v) return std::unexpected(v.error());
  if (auto d = check_store_dir(options.dir); !d) return std::unexpected(d.error());
  if (auto d = check_store_dir(options.dir / kFolder); !d) return std::unexpected(d.error());
  const auto p = checkpoint_path(options, consumer);
  std::error_code ec;
  const bool present = std::filesystem::exists(p, ec);
  if (ec) {
    SHARDMARK_WARN("cannot stat {}: {}", p.string(), ec.message());
    return store_error(core::error_code::io_failed, "stat checkpoint failed");
  }
  if (!present) {
    return store_error(core::error_code::not_found, "no checkpoint for consumer " + std::string(consumer));
  }
  std::ifstream in(p, std::ios::binary);
  if (!in.good()) {
    SHARDMARK_WARN("cannot open {}", p.string());
    return store_error(core::error_code::io_failed, "open checkpoint failed");
  }
  std::string text((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
  if (in.bad()) {
    SHARDMARK_WARN("read of {} failed", p.string());
    return store_error(core::error_code::io_failed, "read checkpoint failed");
  }

  auto ck = decode(text);
  if (!ck) {
    SHARDMARK_WARN("malformed checkpoint {}: {}", p.string(), ck.error().message);
    return std::unexpected(ck.error());
  }
  SHARDMARK_DEBUG("loaded checkpoint of {} shards for consumer {}", ck->size(), consumer);
  return ck;
}

auto remove_checkpoint(const StoreOptions& options, std::string_view consumer)
    -> std::expected<void, core::error> {
  if (auto v = validate_consumer(consumer); !v) return v;
  const auto p = checkpoint_path(options, consumer);
  std::error_code ec;
  (void)std::filesystem::remove(p, ec);
  if (ec) {
    SHARDMARK_WARN("cannot remove {}: {}", p.string(), ec.message());
    return store_error(core::error_code::io_failed, "remove checkpoint failed");
  }
  return {};
}

PersistingCheckpointMark::PersistingCheckpointMark(ReaderCheckpoint checkpoint, std::string consumer,
                                                   StoreOptions options)
    : checkpoint_(std::move(checkpoint)), consumer_(std::move(consumer)), options_(std::move(options)) {}

auto PersistingCheckpointMark::acknowledge() -> std::expected<void, core::error> {
  return save_checkpoint(options_, consumer_, checkpoint_);
}

} // namespace shardmark::checkpoint
