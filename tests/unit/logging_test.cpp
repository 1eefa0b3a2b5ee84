#include <catch2/catch_test_macros.hpp>

#include <shardmark/core/logging.hpp>

using shardmark::detail::parse_log_level;

TEST_CASE("log level names map to spdlog levels", "[logging][config]") {
  REQUIRE(parse_log_level("trace") == spdlog::level::trace);
  REQUIRE(parse_log_level("DEBUG") == spdlog::level::debug);
  REQUIRE(parse_log_level("info") == spdlog::level::info);
  REQUIRE(parse_log_level("warning") == spdlog::level::warn);
  REQUIRE(parse_log_level("warn") == spdlog::level::warn);
  REQUIRE(parse_log_level("error") == spdlog::level::err);
  REQUIRE(parse_log_level("critical") == spdlog::level::critical);
  REQUIRE(parse_log_level("quiet") == spdlog::level::off);
}

TEST_CASE("unknown log level names fall back", "[logging][config]") {
  REQUIRE(parse_log_level("loud") == spdlog::level::info);
  REQUIRE(parse_log_level("", spdlog::level::err) == spdlog::level::err);
}

TEST_CASE("library logger is shared and its level adjustable", "[logging]") {
  const auto& a = shardmark::detail::logger();
  const auto& b = shardmark::detail::logger();
  REQUIRE(a.get() == b.get());
  REQUIRE(a->name() == "shardmark");

  const auto before = a->level();
  shardmark::detail::set_log_level(spdlog::level::debug);
  REQUIRE(a->level() == spdlog::level::debug);
  SHARDMARK_DEBUG("logging test message {}", 1);
  shardmark::detail::set_log_level(before);
}
