#include <floorsheet/rollup/retention.h>

#include "storage/arrow_compute.h"
#include <arrow/api.h>
#include <arrow/compute/api.h>
#include <spdlog/spdlog.h>

namespace floorsheet::rollup {

arrow::Result<TableRetentionResult>
ApplyRetention(std::shared_ptr<arrow::Table> const &table, Date const &cutoff,
               std::string const &dateColumn) {
  if (!table) {
    return arrow::Status::Invalid("retention filter received a null table");
  }

  auto const column = table->GetColumnByName(dateColumn);
  if (!column) {
    SPDLOG_DEBUG("Column '{}' not present, retention filter skipped", dateColumn);
    return TableRetentionResult{table, 0, false};
  }
  if (column->type()->id() != arrow::Type::DATE32) {
    return arrow::Status::TypeError("retention column '", dateColumn,
                                    "' must be date32, got ",
                                    column->type()->ToString());
  }

  ARROW_RETURN_NOT_OK(storage::InitializeCompute());

  auto const cutoffScalar =
      std::make_shared<arrow::Date32Scalar>(ToDaysSinceEpoch(cutoff));
  ARROW_ASSIGN_OR_RAISE(
      auto const current,
      arrow::compute::CallFunction("greater_equal",
                                   {arrow::Datum(column), arrow::Datum(cutoffScalar)}));
  // undated rows stay for the decoder to report
  ARROW_ASSIGN_OR_RAISE(auto const undated,
                        arrow::compute::CallFunction("is_null", {arrow::Datum(column)}));
  ARROW_ASSIGN_OR_RAISE(auto const mask,
                        arrow::compute::CallFunction("or_kleene", {current, undated}));
  ARROW_ASSIGN_OR_RAISE(auto const filtered,
                        arrow::compute::Filter(arrow::Datum(table), mask));

  auto kept = filtered.table();
  auto const removed = static_cast<size_t>(table->num_rows() - kept->num_rows());
  return TableRetentionResult{std::move(kept), removed, true};
}

} // namespace floorsheet::rollup
