#pragma once
#include <floorsheet/core/types.h>
#include <floorsheet/source/itransaction_page_source.h>

#include <cstddef>
#include <expected>
#include <string>
#include <vector>

namespace floorsheet::source {

struct RecordError {
  std::string field;
  std::string reason;
};

// Converts one page row into a record of `tradingDate`. Numbers may carry
// thousands separators ("1,250.50").
std::expected<TransactionRecord, RecordError>
ParseTransactionRow(RawTransactionRow const &row, Date const &tradingDate);

struct ParseFailure {
  int page{0};
  std::string transaction_no;
  RecordError error;
};

struct ParseReport {
  size_t parsed{0};
  std::vector<ParseFailure> failures;

  size_t malformed() const { return failures.size(); }
};

} // namespace floorsheet::source
