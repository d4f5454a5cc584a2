#include <floorsheet/source/floorsheet_fetcher.h>

#include <algorithm>
#include <format>
#include <spdlog/spdlog.h>
#include <thread>

namespace floorsheet::source {

std::expected<FetchResult, FetchFailure>
FloorsheetFetcher::Fetch(FloorsheetFetcherOptions const &options) {
  if (options.target_date) {
    SPDLOG_INFO("Fetching floorsheet for {}", FormatDate(*options.target_date));
  } else {
    SPDLOG_INFO("Fetching latest floorsheet");
  }

  auto firstPage = m_source.FetchPage(options.target_date, 1);
  if (!firstPage) {
    return std::unexpected(FetchFailure{
        ErrorKind::SourceUnavailable,
        std::format("Failed to fetch the first page: {}", firstPage.error().message)});
  }

  auto const tradingDate =
      firstPage->trading_date ? firstPage->trading_date : options.target_date;
  if (!tradingDate) {
    return std::unexpected(FetchFailure{ErrorKind::SourceUnavailable,
                                        "first page does not state a trading date"});
  }
  if (options.target_date && firstPage->trading_date &&
      *firstPage->trading_date != *options.target_date) {
    SPDLOG_WARN("Requested {} but the source served {}", FormatDate(*options.target_date),
                FormatDate(*firstPage->trading_date));
  }

  FetchResult result;
  result.trading_date = *tradingDate;
  result.total_pages = std::max(firstPage->total_pages, 1);
  if (options.max_pages && *options.max_pages > 0) {
    result.total_pages = std::min(result.total_pages, *options.max_pages);
  }
  SPDLOG_INFO("Date: {}, Total pages: {}", FormatDate(result.trading_date),
              result.total_pages);

  ParsePage(*firstPage, 1, result);

  for (int page = 2; page <= result.total_pages; ++page) {
    if (options.page_delay.count() > 0) {
      std::this_thread::sleep_for(options.page_delay);
    }

    auto fetched = m_source.FetchPage(options.target_date, page);
    if (!fetched) {
      ++result.pages_failed;
      SPDLOG_ERROR("Failed to fetch page {}/{}: {}", page, result.total_pages,
                   fetched.error().message);
      continue;
    }
    ParsePage(*fetched, page, result);
  }

  if (result.parse_report.malformed() > 0) {
    SPDLOG_WARN("Skipped {} malformed records", result.parse_report.malformed());
  }
  SPDLOG_INFO("Fetched {} records from {}/{} pages", result.records.size(),
              result.pages_fetched, result.total_pages);
  return result;
}

void FloorsheetFetcher::ParsePage(FloorsheetPage const &page, int pageNumber,
                                  FetchResult &result) const {
  ++result.pages_fetched;
  size_t extracted = 0;
  for (auto const &row : page.rows) {
    auto record = ParseTransactionRow(row, result.trading_date);
    if (!record) {
      SPDLOG_WARN("Error processing row {} on page {}: {} {}", row.transaction_no,
                  pageNumber, record.error().field, record.error().reason);
      result.parse_report.failures.push_back(
          ParseFailure{pageNumber, row.transaction_no, std::move(record.error())});
      continue;
    }
    result.records.push_back(std::move(*record));
    ++result.parse_report.parsed;
    ++extracted;
  }
  SPDLOG_INFO("Processed page {}/{}, extracted {} transactions", pageNumber,
              result.total_pages, extracted);
}

} // namespace floorsheet::source
