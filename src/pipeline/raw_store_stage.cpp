#include <floorsheet/core/constants.h>
#include <floorsheet/pipeline/raw_store_stage.h>
#include <floorsheet/rollup/retention.h>
#include <floorsheet/rollup/transaction_merge.h>
#include <floorsheet/storage/table_codec.h>

#include "pipeline/stage_common.h"
#include <format>
#include <spdlog/spdlog.h>

namespace floorsheet::pipeline {

StageReport RawStoreStage::Run(TransactionList incoming) {
  StageReport report;
  report.stage = "fetch";
  report.cutoff = m_options.cutoff;
  report.input_rows = incoming.size();

  if (incoming.empty()) {
    return report.Fail(ErrorKind::MissingInput, "No data to save.");
  }

  return RunLocked(m_store, m_options.output, std::move(report), [&](StageReport &r) {
    auto const &output = m_options.output;
    SPDLOG_INFO("Data retention policy: Keeping data from {} onwards",
                FormatDate(m_options.cutoff));

    auto [fresh, expired] = rollup::ApplyRetention(std::move(incoming), m_options.cutoff);
    r.retention_removed = expired;
    if (expired > 0) {
      SPDLOG_INFO("Filtered out {} records older than {}", expired,
                  FormatDate(m_options.cutoff));
    }

    LoadRetention window{column::DATE, m_options.cutoff};
    auto existing = TryLoadTable(m_store, output, storage::DecodeTransactions, &window);
    if (!existing && fresh.empty()) {
      r.NoOp("No data left after applying retention policy");
      return;
    }

    TransactionList stored;
    size_t storedExpired = 0;
    size_t storedDropped = 0;
    if (existing) {
      SPDLOG_INFO("Found existing file with {} records",
                  existing->rows.size() + existing->issues.size() + window.removed);
      storedDropped = existing->issues.size();
      for (auto const &issue : existing->issues) {
        SPDLOG_WARN("Dropping stored row {}: {}", issue.row, issue.reason);
      }
      stored = std::move(existing->rows);
      storedExpired = window.removed;
      if (storedExpired > 0) {
        SPDLOG_INFO("Removed {} stored records older than {}", storedExpired,
                    FormatDate(m_options.cutoff));
      }
    }
    r.retention_removed += storedExpired;

    auto merged = rollup::MergeTransactions(std::move(stored), std::move(fresh));
    r.duplicates = merged.duplicates() + merged.batch_duplicates;
    SPDLOG_INFO("Found {} duplicate records", r.duplicates);
    if (merged.replaced > 0) {
      SPDLOG_INFO("Replaced {} stored records with re-fetched values", merged.replaced);
    }

    if (existing && !merged.changed() && storedExpired == 0 && storedDropped == 0) {
      r.NoOp("No new records to add. File remains unchanged.");
      return;
    }

    if (merged.added > 0) {
      SPDLOG_INFO("Adding {} new records", merged.added);
    }
    SPDLOG_INFO("Saving combined data with {} records", merged.rows.size());
    PersistTable(m_store, output, storage::EncodeTransactions(merged.rows));
    r.rows_written = merged.rows.size();
  });
}

StageReport RunFetchStage(source::FloorsheetFetcher &fetcher,
                          source::FloorsheetFetcherOptions const &fetchOptions,
                          RawStoreStage &store) {
  auto fetched = fetcher.Fetch(fetchOptions);
  if (!fetched) {
    StageReport report;
    report.stage = "fetch";
    report.cutoff = store.GetOptions().cutoff;
    return report.Fail(fetched.error().kind, fetched.error().message);
  }

  auto const tradingDate = fetched->trading_date;
  auto const malformed = fetched->parse_report.malformed();
  if (fetched->records.empty()) {
    StageReport report;
    report.stage = "fetch";
    report.cutoff = store.GetOptions().cutoff;
    report.trading_date = tradingDate;
    report.malformed_records = malformed;
    return report.Fail(ErrorKind::SourceUnavailable, "No data was downloaded.");
  }

  auto report = store.Run(std::move(fetched->records));
  report.trading_date = tradingDate;
  report.malformed_records = malformed;
  if (report.ok() && fetched->pages_failed > 0) {
    SPDLOG_WARN("{} of {} pages could not be fetched", fetched->pages_failed,
                fetched->total_pages);
  }
  return report;
}

} // namespace floorsheet::pipeline
