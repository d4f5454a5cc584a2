#include <floorsheet/core/constants.h>
#include <floorsheet/source/csv_page_source.h>

#include <algorithm>
#include <arrow/api.h>
#include <arrow/csv/api.h>
#include <arrow/io/file.h>
#include <format>
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace floorsheet::source {

namespace fs = std::filesystem;

namespace {
arrow::Result<std::shared_ptr<arrow::Table>> ReadCsv(fs::path const &path) {
  ARROW_ASSIGN_OR_RAISE(auto input, arrow::io::ReadableFile::Open(path.string()));

  auto readOptions = arrow::csv::ReadOptions::Defaults();
  auto parseOptions = arrow::csv::ParseOptions::Defaults();
  auto convertOptions = arrow::csv::ConvertOptions::Defaults();
  for (auto const &name : RAW_PAGE_COLUMNS) {
    convertOptions.column_types[std::string(name)] = arrow::utf8();
    convertOptions.include_columns.emplace_back(name);
  }
  convertOptions.include_missing_columns = true;
  // keep empty cells as "" rather than null
  convertOptions.strings_can_be_null = false;

  ARROW_ASSIGN_OR_RAISE(auto reader,
                        arrow::csv::TableReader::Make(arrow::io::default_io_context(), input,
                                                      readOptions, parseOptions,
                                                      convertOptions));
  ARROW_ASSIGN_OR_RAISE(auto table, reader->Read());
  return table->CombineChunks();
}

std::string Cell(arrow::Table const &table, int column, int64_t row) {
  auto const &chunked = table.column(column);
  if (chunked->num_chunks() == 0) {
    return {};
  }
  // CombineChunks leaves at most one chunk
  auto const strings = std::static_pointer_cast<arrow::StringArray>(chunked->chunk(0));
  if (strings->IsNull(row)) {
    return {};
  }
  return std::string(strings->GetView(row));
}
} // namespace

CsvPageSource::CsvPageSource(CsvPageSourceOptions options) : m_options(std::move(options)) {
  if (m_options.page_size == 0) {
    throw std::invalid_argument("CsvPageSource page_size must be positive");
  }
}

std::vector<Date> CsvPageSource::ListTradingDates() const {
  std::vector<Date> dates;
  std::error_code ec;
  for (auto const &entry : fs::directory_iterator(m_options.directory, ec)) {
    if (!entry.is_regular_file() || entry.path().extension() != ".csv") {
      continue;
    }
    if (auto const date = TryParseDate(entry.path().stem().string())) {
      dates.push_back(*date);
    }
  }
  if (ec) {
    SPDLOG_WARN("Cannot list {}: {}", m_options.directory.string(), ec.message());
  }
  std::ranges::sort(dates);
  return dates;
}

std::expected<std::shared_ptr<arrow::Table>, SourceError>
CsvPageSource::Load(Date const &date) {
  if (auto const it = m_cache.find(date); it != m_cache.end()) {
    return it->second;
  }

  auto const path = m_options.directory / std::format("{}.csv", FormatDate(date));
  if (!fs::is_regular_file(path)) {
    return std::unexpected(SourceError{std::format("no floorsheet file {}", path.string())});
  }

  auto table = ReadCsv(path);
  if (!table.ok()) {
    return std::unexpected(SourceError{
        std::format("cannot read {}: {}", path.string(), table.status().ToString())});
  }
  SPDLOG_DEBUG("Loaded {} rows from {}", (*table)->num_rows(), path.string());
  m_cache.emplace(date, *table);
  return *table;
}

std::expected<FloorsheetPage, SourceError>
CsvPageSource::FetchPage(std::optional<Date> const &target, int page) {
  auto date = target;
  if (!date) {
    auto const dates = ListTradingDates();
    if (dates.empty()) {
      return std::unexpected(SourceError{
          std::format("no floorsheet files in {}", m_options.directory.string())});
    }
    date = dates.back();
  }

  auto table = Load(*date);
  if (!table) {
    return std::unexpected(table.error());
  }

  auto const rows = static_cast<size_t>((*table)->num_rows());
  auto const pageSize = m_options.page_size;
  FloorsheetPage result;
  result.trading_date = date;
  result.total_pages = std::max<int>(1, static_cast<int>((rows + pageSize - 1) / pageSize));
  if (page < 1 || page > result.total_pages) {
    return std::unexpected(
        SourceError{std::format("page {} out of range 1..{}", page, result.total_pages)});
  }

  auto const begin = static_cast<size_t>(page - 1) * pageSize;
  auto const end = std::min(rows, begin + pageSize);
  result.rows.reserve(end - begin);
  auto const &t = **table;
  for (auto i = static_cast<int64_t>(begin); i < static_cast<int64_t>(end); ++i) {
    RawTransactionRow row;
    row.transaction_no = Cell(t, 0, i);
    row.symbol = Cell(t, 1, i);
    row.symbol_full = Cell(t, 2, i);
    row.buyer_id = Cell(t, 3, i);
    row.buyer_name = Cell(t, 4, i);
    row.seller_id = Cell(t, 5, i);
    row.seller_name = Cell(t, 6, i);
    row.quantity = Cell(t, 7, i);
    row.rate = Cell(t, 8, i);
    row.amount = Cell(t, 9, i);
    result.rows.push_back(std::move(row));
  }
  return result;
}

} // namespace floorsheet::source
