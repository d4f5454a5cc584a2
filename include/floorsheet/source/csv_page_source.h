#pragma once
#include <floorsheet/source/itransaction_page_source.h>

#include <arrow/type_fwd.h>
#include <filesystem>
#include <map>

namespace floorsheet::source {

struct CsvPageSourceOptions {
  // Holds one `<YYYY-MM-DD>.csv` per trading date.
  std::filesystem::path directory;
  size_t page_size{500};
};

// Offline page source over exported floorsheet CSV files. The header row
// names the raw columns (transaction_no, symbol, ..., amount); every cell is
// read as text. Missing optional columns read as empty.
class CsvPageSource final : public ITransactionPageSource {
public:
  explicit CsvPageSource(CsvPageSourceOptions options);

  std::expected<FloorsheetPage, SourceError>
  FetchPage(std::optional<Date> const &target, int page) override;

  // Dates with a CSV file in the directory, ascending.
  std::vector<Date> ListTradingDates() const;

private:
  CsvPageSourceOptions m_options;
  std::map<Date, std::shared_ptr<arrow::Table>> m_cache;

  std::expected<std::shared_ptr<arrow::Table>, SourceError> Load(Date const &date);
};

} // namespace floorsheet::source
