#include <floorsheet/rollup/derived_metrics.h>
#include <floorsheet/rollup/global_fold.h>

#include <map>
#include <set>
#include <spdlog/spdlog.h>
#include <utility>

namespace floorsheet::rollup {

GlobalFoldResult FoldGlobal(std::span<DateSummaryRow const> rows) {
  GlobalFoldResult result;
  result.input_rows = rows.size();

  std::map<std::pair<std::string, std::string>, GlobalSummaryRow> aggregates;
  std::map<std::string, std::string> firstSeenName;
  std::set<std::pair<std::string, std::string>> reportedConflicts;
  std::set<Date> dates;

  for (auto const &row : rows) {
    auto const &in = row.summary;
    dates.insert(row.date);

    auto [nameIt, firstTime] = firstSeenName.try_emplace(in.broker_id, in.broker_name);
    if (!firstTime && nameIt->second != in.broker_name &&
        reportedConflicts.emplace(in.broker_id, in.broker_name).second) {
      SPDLOG_WARN("Broker {} appears as '{}' and '{}' (on {}); keeping '{}'",
                  in.broker_id, nameIt->second, in.broker_name,
                  FormatDate(row.date), nameIt->second);
      result.name_conflicts.push_back(
          {in.broker_id, nameIt->second, in.broker_name, row.date});
    }

    auto [it, inserted] = aggregates.try_emplace({in.broker_id, in.symbol});
    auto &out = it->second;
    if (inserted) {
      out.last_updated = row.date;
      out.summary.broker_id = in.broker_id;
      out.summary.broker_name = nameIt->second;
      out.summary.symbol = in.symbol;
    } else if (row.date > out.last_updated) {
      out.last_updated = row.date;
    }

    out.summary.buy_quantity += in.buy_quantity;
    out.summary.buy_amount += in.buy_amount;
    out.summary.sell_quantity += in.sell_quantity;
    out.summary.sell_amount += in.sell_amount;
  }

  result.dates_folded = dates.size();
  SPDLOG_INFO("Aggregating data from {} dates", result.dates_folded);

  result.rows.reserve(aggregates.size());
  for (auto &[_, aggregate] : aggregates) {
    ComputeDerivedMetrics(aggregate.summary);
    result.rows.emplace_back(std::move(aggregate));
  }
  SPDLOG_INFO("Created aggregated summary with {} broker-stock combinations",
              result.rows.size());
  return result;
}

} // namespace floorsheet::rollup
