#include <floorsheet/rollup/broker_stock_folder.h>
#include <floorsheet/rollup/derived_metrics.h>

#include <cmath>
#include <format>
#include <optional>
#include <spdlog/spdlog.h>

namespace floorsheet::rollup {

namespace {
std::expected<void, std::string> Validate(TransactionRecord const &record) {
  if (record.symbol.empty()) {
    return std::unexpected(
        std::format("transaction {} has no symbol", record.transaction_no));
  }
  if (record.buyer_id.empty() || record.seller_id.empty()) {
    return std::unexpected(std::format("transaction {} is missing a broker id",
                                       record.transaction_no));
  }
  if (record.quantity < 0) {
    return std::unexpected(std::format("transaction {} has negative quantity {}",
                                       record.transaction_no, record.quantity));
  }
  if (!std::isfinite(record.amount) || record.amount < 0) {
    return std::unexpected(std::format("transaction {} has invalid amount {}",
                                       record.transaction_no, record.amount));
  }
  return {};
}
} // namespace

BrokerStockSummary &BrokerStockFolder::Entry(std::string const &brokerId,
                                             std::string const &brokerName,
                                             std::string const &symbol) {
  auto [it, inserted] = m_entries.try_emplace(BrokerStockKey{brokerId, symbol});
  if (inserted) {
    it->second.broker_id = brokerId;
    it->second.broker_name = brokerName;
    it->second.symbol = symbol;
  }
  return it->second;
}

std::expected<void, std::string>
BrokerStockFolder::Add(TransactionRecord const &record) {
  if (record.trading_date != m_tradingDate) {
    return std::unexpected(std::format(
        "transaction {} is dated {}, folder expects {}", record.transaction_no,
        FormatDate(record.trading_date), FormatDate(m_tradingDate)));
  }
  if (auto valid = Validate(record); !valid) {
    return valid;
  }

  auto &buyer = Entry(record.buyer_id, record.buyer_name, record.symbol);
  buyer.buy_quantity += record.quantity;
  buyer.buy_amount += record.amount;

  // looked up after the buyer: both may be the same entry
  auto &seller = Entry(record.seller_id, record.seller_name, record.symbol);
  seller.sell_quantity += record.quantity;
  seller.sell_amount += record.amount;
  return {};
}

BrokerStockSummaryList BrokerStockFolder::Finish() const {
  BrokerStockSummaryList result;
  result.reserve(m_entries.size());
  for (auto const &[_, entry] : m_entries) {
    result.emplace_back(WithDerivedMetrics(entry));
  }
  return result;
}

std::expected<BrokerStockSummaryList, std::string>
FoldTradingDate(Date const &tradingDate, std::span<TransactionRecord const> records) {
  BrokerStockFolder folder(tradingDate);
  for (auto const &record : records) {
    if (auto added = folder.Add(record); !added) {
      return std::unexpected(added.error());
    }
  }
  return folder.Finish();
}

DateFoldResult FoldByTradingDate(std::span<TransactionRecord const> records) {
  std::map<Date, std::vector<TransactionRecord const *>> byDate;
  for (auto const &record : records) {
    byDate[record.trading_date].push_back(&record);
  }
  SPDLOG_INFO("Found {} unique dates in data", byDate.size());

  DateFoldResult result;
  for (auto const &[date, dateRecords] : byDate) {
    SPDLOG_DEBUG("Processing data for date: {}", FormatDate(date));
    BrokerStockFolder folder(date);
    std::optional<std::string> failure;
    for (auto const *record : dateRecords) {
      if (auto added = folder.Add(*record); !added) {
        failure = added.error();
        break;
      }
    }

    if (failure) {
      SPDLOG_ERROR("Failed to summarize date {}: {}", FormatDate(date), *failure);
      result.failures.push_back({date, std::move(*failure)});
      continue;
    }

    auto summaries = folder.Finish();
    SPDLOG_INFO("Created summary for date {} with {} broker-stock combinations",
                FormatDate(date), summaries.size());
    result.summaries.emplace(date, std::move(summaries));
  }
  return result;
}

} // namespace floorsheet::rollup
