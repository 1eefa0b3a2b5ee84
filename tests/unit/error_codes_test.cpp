#include <shardmark/error.hpp>
#include <catch2/catch_test_macros.hpp>

TEST_CASE("error codes stable subset", "[errors]") {
  using shardmark::core::error_code;
  REQUIRE(static_cast<unsigned>(error_code::ok) == 0u);
  REQUIRE(static_cast<unsigned>(error_code::io_failed) == 1001u);
  REQUIRE(static_cast<unsigned>(error_code::data_integrity) == 3001u);
  REQUIRE(static_cast<unsigned>(error_code::precondition_failed) == 4001u);
  REQUIRE(static_cast<unsigned>(error_code::not_found) == 6001u);
  REQUIRE(static_cast<unsigned>(error_code::internal) == 9001u);
}

TEST_CASE("error code names are stable", "[errors]") {
  using shardmark::core::error_code;
  using shardmark::core::to_string;
  REQUIRE(to_string(error_code::precondition_failed) == "precondition_failed");
  REQUIRE(to_string(error_code::config_invalid) == "config_invalid");
  REQUIRE(to_string(static_cast<error_code>(12345)) == "unknown");

  shardmark::core::error e{};
  REQUIRE(e.code == error_code::internal);
  REQUIRE(e.message.empty());
}
