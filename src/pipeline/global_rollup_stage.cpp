#include <floorsheet/pipeline/global_rollup_stage.h>
#include <floorsheet/rollup/global_fold.h>
#include <floorsheet/storage/table_codec.h>

#include "pipeline/stage_common.h"
#include <format>
#include <spdlog/spdlog.h>

namespace floorsheet::pipeline {

StageReport GlobalRollupStage::Run() {
  StageReport report;
  report.stage = "summarize";
  report.cutoff = m_options.cutoff;

  return RunLocked(m_store, m_options.output, std::move(report), [&](StageReport &r) {
    auto const &input = m_options.input;
    if (m_options.cutoff) {
      SPDLOG_INFO("Retention cutoff {} is not re-applied to {}", FormatDate(*m_options.cutoff),
                  input.string());
    }
    if (!m_store.Exists(input)) {
      r.Fail(ErrorKind::MissingInput, std::format("Input file not found: {}", input.string()));
      return;
    }

    auto decoded = storage::DecodeDateSummaries(m_store.Read(input));
    if (!decoded.ok()) {
      r.Fail(ErrorKind::MissingInput, std::format("Error loading {}: {}", input.string(),
                                                  decoded.status().ToString()));
      return;
    }
    auto summaries = decoded.MoveValueUnsafe();
    r.input_rows = summaries.rows.size() + summaries.issues.size();
    r.malformed_records = summaries.issues.size();
    for (auto const &issue : summaries.issues) {
      SPDLOG_WARN("Skipping summary row {}: {}", issue.row, issue.reason);
    }

    if (summaries.rows.empty()) {
      r.Fail(ErrorKind::MissingInput, "No data to summarize.");
      return;
    }

    auto folded = rollup::FoldGlobal(summaries.rows);
    SPDLOG_INFO("Created summary with {} broker-stock combinations from {} dates",
                folded.rows.size(), folded.dates_folded);

    PersistTable(m_store, m_options.output, storage::EncodeGlobalSummaries(folded.rows));
    r.rows_written = folded.rows.size();
  });
}

} // namespace floorsheet::pipeline
