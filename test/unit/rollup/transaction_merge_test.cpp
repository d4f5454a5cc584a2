#include <catch2/catch_test_macros.hpp>
#include <floorsheet/rollup/transaction_merge.h>

#include "unit/common/fixtures.h"

using namespace floorsheet;
using namespace floorsheet::test;

TEST_CASE("Merge keeps stored keys and takes the batch on collision", "[transaction_merge]") {
  auto const k1 = Trade("2024-01-02", "k1", "NABIL", "B1", "B2", 10, 100);
  auto const k2Old = Trade("2024-01-02", "k2", "NABIL", "B1", "B2", 20, 100);
  auto const k2New = Trade("2024-01-02", "k2", "NABIL", "B1", "B2", 20, 101);
  auto const k3 = Trade("2024-01-02", "k3", "NICA", "B3", "B4", 5, 900);

  auto const merged = rollup::MergeTransactions({k1, k2Old}, {k2New, k3});

  REQUIRE(merged.rows == TransactionList{k1, k2New, k3});
  REQUIRE(merged.added == 1);
  REQUIRE(merged.replaced == 1);
  REQUIRE(merged.unchanged == 0);
  REQUIRE(merged.duplicates() == 1);
  REQUIRE(merged.changed());
}

TEST_CASE("Re-fetching identical records changes nothing", "[transaction_merge]") {
  TransactionList const stored{Trade("2024-01-02", "1", "NABIL", "B1", "B2", 10, 100),
                               Trade("2024-01-02", "2", "NABIL", "B1", "B2", 20, 100)};

  auto const merged = rollup::MergeTransactions(stored, stored);

  REQUIRE(merged.rows == stored);
  REQUIRE(merged.unchanged == 2);
  REQUIRE(merged.added == 0);
  REQUIRE_FALSE(merged.changed());
}

TEST_CASE("The natural key includes the trading date", "[transaction_merge]") {
  auto const monday = Trade("2024-01-01", "100", "NABIL", "B1", "B2", 10, 100);
  auto const tuesday = Trade("2024-01-02", "100", "NABIL", "B1", "B2", 10, 100);

  auto const merged = rollup::MergeTransactions({monday}, {tuesday});

  REQUIRE(merged.rows.size() == 2);
  REQUIRE(merged.added == 1);
}

TEST_CASE("Duplicates inside one batch collapse to the last row", "[transaction_merge]") {
  auto const first = Trade("2024-01-02", "7", "NABIL", "B1", "B2", 10, 100);
  auto const last = Trade("2024-01-02", "7", "NABIL", "B1", "B2", 10, 102);

  auto const merged = rollup::MergeTransactions({}, {first, last});

  REQUIRE(merged.rows == TransactionList{last});
  REQUIRE(merged.batch_duplicates == 1);
  REQUIRE(merged.added == 1);
}

TEST_CASE("Duplicated stored keys force a rewrite", "[transaction_merge]") {
  auto const row = Trade("2024-01-02", "7", "NABIL", "B1", "B2", 10, 100);

  auto const merged = rollup::MergeTransactions({row, row}, {});

  REQUIRE(merged.rows.size() == 1);
  REQUIRE(merged.stored_duplicates == 1);
  REQUIRE(merged.changed());
}

TEST_CASE("Merged rows come out sorted by date then transaction number",
          "[transaction_merge]") {
  TransactionList const incoming{Trade("2024-01-03", "b", "NABIL", "B1", "B2", 1, 1),
                                 Trade("2024-01-02", "z", "NABIL", "B1", "B2", 1, 1),
                                 Trade("2024-01-03", "a", "NABIL", "B1", "B2", 1, 1)};

  auto const merged = rollup::MergeTransactions({}, incoming);

  REQUIRE(merged.rows[0].transaction_no == "z");
  REQUIRE(merged.rows[1].transaction_no == "a");
  REQUIRE(merged.rows[2].transaction_no == "b");

  auto sorted = incoming;
  rollup::SortTransactions(sorted);
  REQUIRE(sorted == merged.rows);
}
