#include <catch2/catch_test_macros.hpp>
#include <floorsheet/core/date.h>

#include <stdexcept>

using namespace floorsheet;
using namespace std::chrono;

TEST_CASE("TryParseDate accepts both separators", "[date]") {
  auto const expected = Date{year{2024}, January, day{2}};

  REQUIRE(TryParseDate("2024-01-02") == expected);
  REQUIRE(TryParseDate("2024/01/02") == expected);
  REQUIRE(TryParseDate("  2024-01-02\n") == expected);
}

TEST_CASE("TryParseDate rejects malformed text", "[date]") {
  REQUIRE_FALSE(TryParseDate(""));
  REQUIRE_FALSE(TryParseDate("2024-1-2"));
  REQUIRE_FALSE(TryParseDate("2024-01/02"));
  REQUIRE_FALSE(TryParseDate("2024-13-01"));
  REQUIRE_FALSE(TryParseDate("2023-02-29"));
  REQUIRE_FALSE(TryParseDate("yyyy-mm-dd"));
  REQUIRE(TryParseDate("2024-02-29"));
}

TEST_CASE("ParseDate throws on bad input", "[date]") {
  REQUIRE_THROWS_AS(ParseDate("02/01/2024"), std::invalid_argument);
  REQUIRE_NOTHROW(ParseDate("2024-01-02"));
}

TEST_CASE("FormatDate pads fields", "[date]") {
  REQUIRE(FormatDate(Date{year{2024}, March, day{5}}) == "2024-03-05");
  REQUIRE(FormatDate(ParseDate("2024/12/31")) == "2024-12-31");
}

TEST_CASE("Epoch day conversion", "[date]") {
  REQUIRE(ToDaysSinceEpoch(ParseDate("1970-01-01")) == 0);
  REQUIRE(ToDaysSinceEpoch(ParseDate("1970-01-02")) == 1);
  REQUIRE(ToDaysSinceEpoch(ParseDate("1969-12-31")) == -1);

  auto const date = ParseDate("2024-06-15");
  REQUIRE(FromDaysSinceEpoch(ToDaysSinceEpoch(date)) == date);
}

TEST_CASE("RetentionCutoff subtracts whole days", "[date][retention]") {
  auto const today = ParseDate("2024-03-01");

  REQUIRE(RetentionCutoff(today, 0) == today);
  REQUIRE(RetentionCutoff(today, 1) == ParseDate("2024-02-29"));
  REQUIRE(RetentionCutoff(today, 365) == ParseDate("2023-03-02"));
}
