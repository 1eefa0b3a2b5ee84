#include "shardmark/core/logging.hpp"

#include "shardmark/core/platform_utils.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

#include <cctype>
#include <string>

namespace shardmark::detail {

auto parse_log_level(std::string_view name, spdlog::level::level_enum fallback)
    -> spdlog::level::level_enum {
  std::string x(name);
  for (auto& ch : x)
    ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
  if (x == "quiet")
    return spdlog::level::off;
  if (x == "critical")
    return spdlog::level::critical;
  if (x == "error")
    return spdlog::level::err;
  if (x == "warning" || x == "warn")
    return spdlog::level::warn;
  if (x == "info")
    return spdlog::level::info;
  if (x == "debug")
    return spdlog::level::debug;
  if (x == "trace")
    return spdlog::level::trace;
  return fallback;
}

namespace {

std::shared_ptr<spdlog::logger> make_logger() {
  // Reuse a logger registered by the embedding application under our name.
  if (auto existing = spdlog::get("shardmark"))
    return existing;
  auto sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
  auto result = std::make_shared<spdlog::logger>("shardmark", std::move(sink));
  result->set_pattern("[%Y-%m-%dT%H:%M:%S.%e] [%n] [%^%l%$] %v");
  auto level = spdlog::level::info;
  if (auto env = core::safe_getenv("SHARDMARK_LOG_LEVEL"))
    level = parse_log_level(*env);
  result->set_level(level);
  return result;
}

} // namespace

auto logger() -> const std::shared_ptr<spdlog::logger>& {
  static const std::shared_ptr<spdlog::logger> instance = make_logger();
  return instance;
}

auto set_log_level(spdlog::level::level_enum level) -> void {
  logger()->set_level(level);
}

} // namespace shardmark::detail
