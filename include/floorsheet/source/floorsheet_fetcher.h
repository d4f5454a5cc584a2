//
// Walks the pages of one trading day and parses them into records.
//

#pragma once
#include <floorsheet/core/errors.h>
#include <floorsheet/source/itransaction_page_source.h>
#include <floorsheet/source/record_parser.h>

#include <chrono>
#include <expected>
#include <optional>

namespace floorsheet::source {

struct FetchResult {
  Date trading_date;
  TransactionList records;
  int total_pages{0};
  int pages_fetched{0};
  int pages_failed{0};
  ParseReport parse_report;
};

struct FetchFailure {
  ErrorKind kind{ErrorKind::SourceUnavailable};
  std::string message;
};

struct FloorsheetFetcherOptions {
  std::optional<Date> target_date;
  // Caps the page count reported by the source.
  std::optional<int> max_pages;
  // Pause between page requests.
  std::chrono::milliseconds page_delay{0};
};

class FloorsheetFetcher {
public:
  explicit FloorsheetFetcher(ITransactionPageSource &source) : m_source(source) {}

  // Fails only when the first page cannot be fetched or no trading date can
  // be established. A later page failure is logged and counted; records of
  // the other pages are kept.
  std::expected<FetchResult, FetchFailure> Fetch(FloorsheetFetcherOptions const &options);

private:
  ITransactionPageSource &m_source;

  void ParsePage(FloorsheetPage const &page, int pageNumber, FetchResult &result) const;
};

} // namespace floorsheet::source
