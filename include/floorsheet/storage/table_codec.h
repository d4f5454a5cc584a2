//
// Columnar layout of the three tables and the conversion between Arrow
// tables and row structs.
//

#pragma once
#include <floorsheet/core/types.h>

#include <arrow/result.h>
#include <arrow/type_fwd.h>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace floorsheet::storage {

std::shared_ptr<arrow::Schema> TransactionSchema();
std::shared_ptr<arrow::Schema> DateSummarySchema();
std::shared_ptr<arrow::Schema> GlobalSummarySchema();

arrow::Result<std::shared_ptr<arrow::Table>> EncodeTransactions(TransactionList const &rows);
arrow::Result<std::shared_ptr<arrow::Table>> EncodeDateSummaries(DateSummaryList const &rows);
arrow::Result<std::shared_ptr<arrow::Table>> EncodeGlobalSummaries(GlobalSummaryList const &rows);

// A row that could not be decoded because a required cell is null.
struct DecodeIssue {
  int64_t row{0};
  std::optional<Date> date;
  std::string reason;
};

template <typename Row> struct Decoded {
  std::vector<Row> rows;
  std::vector<DecodeIssue> issues;
};

// Decoders fail with KeyError when a required column is absent. Columns are
// accepted in any integer/floating/string width; derived summary columns are
// recomputed from the accumulators rather than trusted.
arrow::Result<Decoded<TransactionRecord>>
DecodeTransactions(std::shared_ptr<arrow::Table> const &table);

arrow::Result<Decoded<DateSummaryRow>>
DecodeDateSummaries(std::shared_ptr<arrow::Table> const &table);

arrow::Result<Decoded<GlobalSummaryRow>>
DecodeGlobalSummaries(std::shared_ptr<arrow::Table> const &table);

// Rewrites `column` as date32 when it is stored as text ("YYYY-MM-DD" or
// "YYYY/MM/DD") or as a timestamp. Unparseable text becomes null. Tables
// without the column are returned unchanged.
arrow::Result<std::shared_ptr<arrow::Table>>
NormalizeDateColumn(std::shared_ptr<arrow::Table> const &table, std::string const &column);

} // namespace floorsheet::storage
