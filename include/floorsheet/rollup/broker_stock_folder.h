//
// Folds the transactions of one trading date into broker x stock summaries.
//

#pragma once
#include <floorsheet/core/types.h>

#include <expected>
#include <map>
#include <span>
#include <string>
#include <utility>
#include <vector>

namespace floorsheet::rollup {

using BrokerStockKey = std::pair<std::string, std::string>; // (broker_id, symbol)

class BrokerStockFolder {
public:
  explicit BrokerStockFolder(Date tradingDate) : m_tradingDate(tradingDate) {}

  // Buyer accumulates into the buy side of (buyer_id, symbol), seller into
  // the sell side of (seller_id, symbol). Rejects records from another date
  // or with missing/invalid required fields.
  std::expected<void, std::string> Add(TransactionRecord const &record);

  // Summaries with derived metrics, ordered by (broker_id, symbol).
  [[nodiscard]] BrokerStockSummaryList Finish() const;

  Date const &GetTradingDate() const { return m_tradingDate; }
  size_t size() const { return m_entries.size(); }

private:
  Date m_tradingDate;
  std::map<BrokerStockKey, BrokerStockSummary> m_entries;

  BrokerStockSummary &Entry(std::string const &brokerId,
                            std::string const &brokerName,
                            std::string const &symbol);
};

// Folds all records of one date. Fails as a whole, contributing nothing,
// when any record is unusable.
std::expected<BrokerStockSummaryList, std::string>
FoldTradingDate(Date const &tradingDate, std::span<TransactionRecord const> records);

struct DateFoldFailure {
  Date date;
  std::string reason;
};

struct DateFoldResult {
  std::map<Date, BrokerStockSummaryList> summaries;
  std::vector<DateFoldFailure> failures;
};

// Partitions `records` by trading date and folds each date independently.
// A failing date is reported and skipped; other dates are unaffected.
DateFoldResult FoldByTradingDate(std::span<TransactionRecord const> records);

} // namespace floorsheet::rollup
