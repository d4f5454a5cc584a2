#include <catch2/catch_test_macros.hpp>
#include <floorsheet/rollup/date_upsert.h>

#include "unit/common/fixtures.h"
#include <algorithm>

using namespace floorsheet;
using namespace floorsheet::test;

TEST_CASE("Upsert replaces every row of a recomputed date", "[date_upsert]") {
  DateSummaryList const persisted{
      DateRow("2024-01-01", Summary("B1", "NABIL", 10, 1000, 0, 0)),
      DateRow("2024-01-02", Summary("B1", "NABIL", 5, 500, 0, 0)),
      DateRow("2024-01-02", Summary("B9", "NICA", 1, 100, 0, 0)),
  };
  std::map<Date, BrokerStockSummaryList> const fresh{
      {D("2024-01-02"), {Summary("B2", "NABIL", 0, 0, 7, 700)}},
  };

  auto const result = rollup::UpsertByDate(persisted, fresh, D("2023-01-01"));

  REQUIRE(result.rows.size() == 2);
  REQUIRE(result.rows[0] == persisted[0]);
  REQUIRE(result.rows[1].date == D("2024-01-02"));
  REQUIRE(result.rows[1].summary.broker_id == "B2");
  REQUIRE(result.replaced_dates == std::vector<Date>{D("2024-01-02")});
  REQUIRE(result.added_dates.empty());
}

TEST_CASE("Upsert adds new dates and leaves others untouched", "[date_upsert]") {
  DateSummaryList const persisted{DateRow("2024-01-01", Summary("B1", "NABIL", 10, 1000, 0, 0))};
  std::map<Date, BrokerStockSummaryList> const fresh{
      {D("2024-01-03"), {Summary("B1", "NABIL", 1, 100, 0, 0)}},
  };

  auto const result = rollup::UpsertByDate(persisted, fresh, D("2023-01-01"));

  REQUIRE(result.rows.size() == 2);
  REQUIRE(result.rows[0] == persisted[0]);
  REQUIRE(result.added_dates == std::vector<Date>{D("2024-01-03")});
  REQUIRE(result.replaced_dates.empty());
}

TEST_CASE("Upsert retention-filters the persisted table", "[date_upsert][retention]") {
  DateSummaryList const persisted{
      DateRow("2023-06-01", Summary("B1", "NABIL", 10, 1000, 0, 0)),
      DateRow("2024-01-01", Summary("B1", "NABIL", 10, 1000, 0, 0)),
  };
  std::map<Date, BrokerStockSummaryList> const fresh{
      {D("2023-05-01"), {Summary("B1", "NABIL", 1, 100, 0, 0)}},
      {D("2024-01-02"), {Summary("B1", "NABIL", 1, 100, 0, 0)}},
  };

  auto const result = rollup::UpsertByDate(persisted, fresh, D("2023-12-01"));

  REQUIRE(result.retention_removed == 1);
  REQUIRE(result.expired_dates == std::vector<Date>{D("2023-05-01")});
  REQUIRE(std::ranges::all_of(result.rows,
                              [](auto const &row) { return row.date >= D("2023-12-01"); }));
  REQUIRE(result.rows.size() == 2);
}

TEST_CASE("Upserting the same summaries twice is idempotent", "[date_upsert]") {
  std::map<Date, BrokerStockSummaryList> const fresh{
      {D("2024-01-02"),
       {Summary("B1", "NABIL", 100, 10000, 40, 4200), Summary("B2", "NABIL", 40, 4200, 100, 10000)}},
  };

  auto const once = rollup::UpsertByDate({}, fresh, D("2023-01-01"));
  auto const twice = rollup::UpsertByDate(once.rows, fresh, D("2023-01-01"));

  REQUIRE(twice.rows == once.rows);
  REQUIRE(twice.replaced_dates == std::vector<Date>{D("2024-01-02")});
}

TEST_CASE("Upserted rows are ordered by date, broker and symbol", "[date_upsert]") {
  std::map<Date, BrokerStockSummaryList> const fresh{
      {D("2024-01-03"), {Summary("B2", "NICA", 1, 1, 0, 0), Summary("B1", "NICA", 1, 1, 0, 0)}},
      {D("2024-01-02"), {Summary("B3", "ADBL", 1, 1, 0, 0)}},
  };

  auto const result = rollup::UpsertByDate({}, fresh, D("2023-01-01"));

  REQUIRE(result.rows[0].summary.broker_id == "B3");
  REQUIRE(result.rows[1].summary.broker_id == "B1");
  REQUIRE(result.rows[2].summary.broker_id == "B2");
}
