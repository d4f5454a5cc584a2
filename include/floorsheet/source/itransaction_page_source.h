//
// Paginated access to one trading day's floorsheet.
//

#pragma once
#include <floorsheet/core/date.h>

#include <expected>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace floorsheet::source {

// Cells of one page row as text, before any numeric parsing.
struct RawTransactionRow {
  std::string transaction_no;
  std::string symbol;
  std::string symbol_full;
  std::string buyer_id;
  std::string buyer_name;
  std::string seller_id;
  std::string seller_name;
  std::string quantity;
  std::string rate;
  std::string amount;
};

struct FloorsheetPage {
  // Trading date shown on the page; absent when the page does not state it.
  std::optional<Date> trading_date;
  // Total number of pages of the day; 1 when unknown.
  int total_pages{1};
  std::vector<RawTransactionRow> rows;
};

struct SourceError {
  std::string message;
};

struct ITransactionPageSource {
  virtual ~ITransactionPageSource() = default;

  // `page` is 1-based. No target date selects the latest published day.
  virtual std::expected<FloorsheetPage, SourceError>
  FetchPage(std::optional<Date> const &target, int page) = 0;
};
using ITransactionPageSourcePtr = std::unique_ptr<ITransactionPageSource>;

} // namespace floorsheet::source
