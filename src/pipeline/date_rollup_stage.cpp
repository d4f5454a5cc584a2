#include <floorsheet/core/constants.h>
#include <floorsheet/pipeline/date_rollup_stage.h>
#include <floorsheet/rollup/broker_stock_folder.h>
#include <floorsheet/rollup/date_upsert.h>
#include <floorsheet/storage/table_codec.h>

#include "pipeline/stage_common.h"
#include <format>
#include <set>
#include <spdlog/spdlog.h>

namespace floorsheet::pipeline {

namespace {
// A raw row with a null required cell fails its whole trading date.
std::map<Date, std::string> PoisonedDates(std::vector<storage::DecodeIssue> const &issues) {
  std::map<Date, std::string> dates;
  for (auto const &issue : issues) {
    if (!issue.date) {
      SPDLOG_WARN("Dropping undated raw row {}: {}", issue.row, issue.reason);
      continue;
    }
    dates.try_emplace(*issue.date, std::format("row {}: {}", issue.row, issue.reason));
  }
  return dates;
}
} // namespace

StageReport DateRollupStage::Run() {
  StageReport report;
  report.stage = "date-summary";
  report.cutoff = m_options.cutoff;

  return RunLocked(m_store, m_options.output, std::move(report), [&](StageReport &r) {
    auto const &input = m_options.input;
    if (!m_store.Exists(input)) {
      r.Fail(ErrorKind::MissingInput, std::format("Input file not found: {}", input.string()));
      return;
    }

    LoadRetention rawWindow{column::DATE, m_options.cutoff};
    auto decoded = DecodeRetained(m_store.Read(input), rawWindow, storage::DecodeTransactions);
    if (!decoded.ok()) {
      r.Fail(ErrorKind::MissingInput, std::format("Error loading {}: {}", input.string(),
                                                  decoded.status().ToString()));
      return;
    }
    auto raw = decoded.MoveValueUnsafe();
    r.input_rows = raw.rows.size() + raw.issues.size() + rawWindow.removed;
    r.malformed_records = raw.issues.size();
    r.retention_removed = rawWindow.removed;
    if (rawWindow.removed > 0) {
      SPDLOG_INFO("Filtered out {} records older than {}", rawWindow.removed,
                  FormatDate(m_options.cutoff));
    }

    auto current = std::move(raw.rows);

    auto const poisoned = PoisonedDates(raw.issues);
    std::erase_if(current, [&](TransactionRecord const &record) {
      return poisoned.contains(record.trading_date);
    });
    for (auto const &[date, reason] : poisoned) {
      if (date >= m_options.cutoff) {
        SPDLOG_ERROR("Skipping date {}: {}", FormatDate(date), reason);
        r.date_failures.push_back({date, reason});
      }
    }

    if (current.empty() && r.date_failures.empty()) {
      r.Fail(ErrorKind::MissingInput, "No raw data to summarize.");
      return;
    }

    auto folded = rollup::FoldByTradingDate(current);
    for (auto &failure : folded.failures) {
      r.date_failures.push_back({failure.date, std::move(failure.reason)});
    }
    if (folded.summaries.empty()) {
      r.Fail(ErrorKind::MalformedRecord, "Failed to create date-wise summaries.");
      return;
    }

    LoadRetention summaryWindow{column::DATE, m_options.cutoff};
    auto existing =
        TryLoadTable(m_store, m_options.output, storage::DecodeDateSummaries, &summaryWindow);
    DateSummaryList persisted;
    size_t persistedDropped = 0;
    size_t persistedExpired = 0;
    if (existing) {
      SPDLOG_INFO("Found existing date-summarized data with {} records",
                  existing->rows.size() + existing->issues.size() + summaryWindow.removed);
      persisted = std::move(existing->rows);
      persistedDropped = existing->issues.size();
      persistedExpired = summaryWindow.removed;
      for (auto const &issue : existing->issues) {
        SPDLOG_WARN("Dropping stored summary row {}: {}", issue.row, issue.reason);
      }
    }

    auto baseline = persisted;
    rollup::SortDateSummaries(baseline);

    auto upsert = rollup::UpsertByDate(std::move(persisted), folded.summaries, m_options.cutoff);
    r.retention_removed += persistedExpired + upsert.retention_removed;
    r.replaced_dates = upsert.replaced_dates;
    for (auto const &date : upsert.expired_dates) {
      SPDLOG_WARN("Summary for {} is older than the cutoff and was not stored",
                  FormatDate(date));
    }

    if (upsert.rows.empty()) {
      r.Fail(ErrorKind::MissingInput, "No data to save after processing.");
      return;
    }

    if (existing && persistedDropped == 0 && persistedExpired == 0 && upsert.rows == baseline) {
      r.NoOp("Date summaries unchanged. File remains unchanged.");
      return;
    }

    std::set<Date> dates;
    for (auto const &row : upsert.rows) {
      dates.insert(row.date);
    }
    SPDLOG_INFO("Saving combined date summaries with {} records for {} dates",
                upsert.rows.size(), dates.size());
    PersistTable(m_store, m_options.output, storage::EncodeDateSummaries(upsert.rows));
    r.rows_written = upsert.rows.size();
  });
}

} // namespace floorsheet::pipeline
