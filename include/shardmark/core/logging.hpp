#pragma once

/** \file logging.hpp
 *  \brief Library logger (spdlog) and SHARDMARK_* logging macros.
 *
 * The logger is created on first use. Its level comes from SHARDMARK_LOG_LEVEL
 * (trace, debug, info, warning, error, critical, quiet); unknown or unset values
 * select info. Compile-time filtering follows SPDLOG_ACTIVE_LEVEL, which the
 * build sets to trace so that runtime level selection is authoritative.
 */

#ifndef SPDLOG_ACTIVE_LEVEL
#  define SPDLOG_ACTIVE_LEVEL SPDLOG_LEVEL_TRACE
#endif

#include <memory>
#include <string_view>

#include <spdlog/spdlog.h>

namespace shardmark::detail {

/// Returns the shared library logger, creating it on first call.
[[nodiscard]] auto logger() -> const std::shared_ptr<spdlog::logger>&;

/// Maps a SHARDMARK_LOG_LEVEL value to a spdlog level. Matching is
/// case-insensitive; unknown values return `fallback`.
[[nodiscard]] auto parse_log_level(std::string_view name,
                                   spdlog::level::level_enum fallback = spdlog::level::info)
    -> spdlog::level::level_enum;

/// Overrides the runtime level of the library logger.
auto set_log_level(spdlog::level::level_enum level) -> void;

} // namespace shardmark::detail

#define SHARDMARK_TRACE(...) SPDLOG_LOGGER_TRACE(::shardmark::detail::logger(), __VA_ARGS__)
#define SHARDMARK_DEBUG(...) SPDLOG_LOGGER_DEBUG(::shardmark::detail::logger(), __VA_ARGS__)
#define SHARDMARK_INFO(...) SPDLOG_LOGGER_INFO(::shardmark::detail::logger(), __VA_ARGS__)
#define SHARDMARK_WARN(...) SPDLOG_LOGGER_WARN(::shardmark::detail::logger(), __VA_ARGS__)
#define SHARDMARK_ERROR(...) SPDLOG_LOGGER_ERROR(::shardmark::detail::logger(), __VA_ARGS__)
