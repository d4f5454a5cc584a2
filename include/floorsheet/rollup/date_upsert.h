//
// Date rollup write path: replace-by-date upsert into the persisted
// multi-date summary table.
//

#pragma once
#include <floorsheet/core/types.h>

#include <map>
#include <vector>

namespace floorsheet::rollup {

struct UpsertResult {
  // sorted by (date, broker_id, symbol)
  DateSummaryList rows;
  size_t retention_removed{0};     // persisted rows older than the cutoff
  std::vector<Date> replaced_dates; // recomputed dates that were already stored
  std::vector<Date> added_dates;    // recomputed dates new to the table
  std::vector<Date> expired_dates;  // recomputed dates older than the cutoff, dropped
};

// Retention-filters `persisted`, then for every date in `fresh` drops all
// persisted rows of that date and appends the freshly computed ones. Dates
// not in `fresh` are kept as they are.
UpsertResult UpsertByDate(DateSummaryList persisted,
                          std::map<Date, BrokerStockSummaryList> const &fresh,
                          Date const &cutoff);

void SortDateSummaries(DateSummaryList &rows);

} // namespace floorsheet::rollup
