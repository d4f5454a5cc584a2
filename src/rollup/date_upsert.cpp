#include <floorsheet/rollup/date_upsert.h>
#include <floorsheet/rollup/retention.h>

#include <algorithm>
#include <set>
#include <spdlog/spdlog.h>
#include <tuple>

namespace floorsheet::rollup {

void SortDateSummaries(DateSummaryList &rows) {
  std::ranges::stable_sort(rows, [](DateSummaryRow const &a, DateSummaryRow const &b) {
    return std::tie(a.date, a.summary.broker_id, a.summary.symbol) <
           std::tie(b.date, b.summary.broker_id, b.summary.symbol);
  });
}

UpsertResult UpsertByDate(DateSummaryList persisted,
                          std::map<Date, BrokerStockSummaryList> const &fresh,
                          Date const &cutoff) {
  UpsertResult result;

  auto [kept, removed] = ApplyRetention(std::move(persisted), cutoff);
  result.retention_removed = removed;
  if (removed > 0) {
    SPDLOG_INFO("Removed {} records older than {}", removed, FormatDate(cutoff));
  }

  std::set<Date> storedDates;
  for (auto const &row : kept) {
    storedDates.insert(row.date);
  }

  std::set<Date> recomputed;
  for (auto const &[date, _] : fresh) {
    if (date < cutoff) {
      result.expired_dates.push_back(date);
      continue;
    }
    recomputed.insert(date);
    if (storedDates.contains(date)) {
      SPDLOG_INFO("Replacing data for date {}", FormatDate(date));
      result.replaced_dates.push_back(date);
    } else {
      result.added_dates.push_back(date);
    }
  }

  std::erase_if(kept, [&](DateSummaryRow const &row) {
    return recomputed.contains(row.date);
  });

  result.rows = std::move(kept);
  for (auto const &date : recomputed) {
    for (auto const &summary : fresh.at(date)) {
      result.rows.push_back(DateSummaryRow{date, summary});
    }
  }

  SortDateSummaries(result.rows);
  return result;
}

} // namespace floorsheet::rollup
