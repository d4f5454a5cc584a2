//
// Sliding retention window. Rows dated strictly before the cutoff are
// dropped; the cutoff is always passed in, never read from the clock here.
//

#pragma once
#include <floorsheet/core/types.h>

#include <arrow/result.h>
#include <arrow/type_fwd.h>
#include <algorithm>
#include <memory>
#include <string>
#include <vector>

namespace floorsheet::rollup {

template <typename Row> struct RetentionResult {
  std::vector<Row> kept;
  size_t removed{0};
};

template <typename Row>
RetentionResult<Row> ApplyRetention(std::vector<Row> rows, Date const &cutoff) {
  auto const before = rows.size();
  std::erase_if(rows, [&](Row const &row) { return RowDate(row) < cutoff; });
  auto const removed = before - rows.size();
  return RetentionResult<Row>{std::move(rows), removed};
}

struct TableRetentionResult {
  std::shared_ptr<arrow::Table> kept;
  size_t removed{0};
  bool has_date_column{true};
};

// Columnar variant applied to persisted tables before they are decoded. A
// table without `dateColumn` passes through untouched, and so do rows whose
// date is null. The column must already be date32
// (see storage::NormalizeDateColumn).
arrow::Result<TableRetentionResult>
ApplyRetention(std::shared_ptr<arrow::Table> const &table, Date const &cutoff,
               std::string const &dateColumn);

} // namespace floorsheet::rollup
