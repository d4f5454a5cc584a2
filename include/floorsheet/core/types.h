//
// Row types of the three persisted tables.
//

#pragma once
#include <floorsheet/core/date.h>

#include <cstdint>
#include <string>
#include <vector>

namespace floorsheet {

// One matched trade. Natural key: (trading_date, transaction_no).
struct TransactionRecord {
  Date trading_date;
  std::string transaction_no;
  std::string symbol;
  std::string symbol_full;
  std::string buyer_id;
  std::string buyer_name;
  std::string seller_id;
  std::string seller_name;
  int64_t quantity{0};
  double rate{0};
  double amount{0};

  bool operator==(TransactionRecord const &) const = default;
};

// Aggregated position of one broker in one stock. The first seven fields are
// accumulators; the last four are derived from them.
struct BrokerStockSummary {
  std::string broker_id;
  std::string broker_name;
  std::string symbol;
  int64_t buy_quantity{0};
  double buy_amount{0};
  int64_t sell_quantity{0};
  double sell_amount{0};

  double avg_buy_price{0};
  double avg_sell_price{0};
  int64_t net_quantity{0};
  double avg_holding_price{0};

  bool operator==(BrokerStockSummary const &) const = default;
};

// Row of the date rollup table, keyed by (date, broker_id, symbol).
struct DateSummaryRow {
  Date date;
  BrokerStockSummary summary;

  bool operator==(DateSummaryRow const &) const = default;
};

// Row of the global rollup table, keyed by (broker_id, symbol).
struct GlobalSummaryRow {
  Date last_updated;
  BrokerStockSummary summary;

  bool operator==(GlobalSummaryRow const &) const = default;
};

using TransactionList = std::vector<TransactionRecord>;
using BrokerStockSummaryList = std::vector<BrokerStockSummary>;
using DateSummaryList = std::vector<DateSummaryRow>;
using GlobalSummaryList = std::vector<GlobalSummaryRow>;

inline Date const &RowDate(TransactionRecord const &row) { return row.trading_date; }
inline Date const &RowDate(DateSummaryRow const &row) { return row.date; }
inline Date const &RowDate(GlobalSummaryRow const &row) { return row.last_updated; }

} // namespace floorsheet
