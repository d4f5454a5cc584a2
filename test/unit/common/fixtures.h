//
// Builders and a scratch directory shared by the floorsheet tests.
//

#pragma once
#include <floorsheet/core/date.h>
#include <floorsheet/core/types.h>
#include <floorsheet/rollup/derived_metrics.h>

#include <filesystem>
#include <fstream>
#include <random>
#include <string>
#include <string_view>
#include <unistd.h>

namespace floorsheet::test {

inline Date D(std::string_view text) { return ParseDate(text); }

inline TransactionRecord Trade(std::string_view date, std::string transactionNo,
                               std::string symbol, std::string buyer, std::string seller,
                               int64_t quantity, double rate) {
  TransactionRecord record;
  record.trading_date = D(date);
  record.transaction_no = std::move(transactionNo);
  record.symbol_full = symbol + " Limited";
  record.buyer_name = "Broker " + buyer;
  record.buyer_id = std::move(buyer);
  record.seller_name = "Broker " + seller;
  record.seller_id = std::move(seller);
  record.symbol = std::move(symbol);
  record.quantity = quantity;
  record.rate = rate;
  record.amount = static_cast<double>(quantity) * rate;
  return record;
}

inline BrokerStockSummary Summary(std::string brokerId, std::string symbol,
                                  int64_t buyQuantity, double buyAmount,
                                  int64_t sellQuantity, double sellAmount) {
  BrokerStockSummary summary;
  summary.broker_name = "Broker " + brokerId;
  summary.broker_id = std::move(brokerId);
  summary.symbol = std::move(symbol);
  summary.buy_quantity = buyQuantity;
  summary.buy_amount = buyAmount;
  summary.sell_quantity = sellQuantity;
  summary.sell_amount = sellAmount;
  return rollup::WithDerivedMetrics(std::move(summary));
}

inline DateSummaryRow DateRow(std::string_view date, BrokerStockSummary summary) {
  return DateSummaryRow{D(date), std::move(summary)};
}

// Fresh directory under the system temp dir, removed with its contents.
class TempDir {
public:
  TempDir() {
    std::random_device rd;
    m_path = std::filesystem::temp_directory_path() /
             ("floorsheet-test-" + std::to_string(::getpid()) + "-" + std::to_string(rd()));
    std::filesystem::create_directories(m_path);
  }

  TempDir(TempDir const &) = delete;
  TempDir &operator=(TempDir const &) = delete;

  ~TempDir() {
    std::error_code ec;
    std::filesystem::remove_all(m_path, ec);
  }

  std::filesystem::path const &path() const { return m_path; }
  std::filesystem::path operator/(std::string_view name) const { return m_path / name; }

  std::filesystem::path WriteFile(std::string_view name, std::string_view content) const {
    auto const file = m_path / name;
    std::filesystem::create_directories(file.parent_path());
    std::ofstream out(file);
    out << content;
    return file;
  }

private:
  std::filesystem::path m_path;
};

} // namespace floorsheet::test
