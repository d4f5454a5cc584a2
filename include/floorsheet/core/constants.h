//
// Column names and pipeline defaults.
//

#pragma once
#include <array>
#include <string_view>

namespace floorsheet {

namespace column {
constexpr auto DATE = "date";
constexpr auto LAST_UPDATED = "last_updated";

// raw floorsheet
constexpr auto TRANSACTION_NO = "transaction_no";
constexpr auto SYMBOL = "symbol";
constexpr auto SYMBOL_FULL = "symbol_full";
constexpr auto BUYER_ID = "buyer_id";
constexpr auto BUYER_NAME = "buyer_name";
constexpr auto SELLER_ID = "seller_id";
constexpr auto SELLER_NAME = "seller_name";
constexpr auto QUANTITY = "quantity";
constexpr auto RATE = "rate";
constexpr auto AMOUNT = "amount";

// broker x stock summaries
constexpr auto BROKER_ID = "broker_id";
constexpr auto BROKER_NAME = "broker_name";
constexpr auto BUY_QUANTITY = "buy_quantity";
constexpr auto BUY_AMOUNT = "buy_amount";
constexpr auto SELL_QUANTITY = "sell_quantity";
constexpr auto SELL_AMOUNT = "sell_amount";
constexpr auto AVG_BUY_PRICE = "avg_buy_price";
constexpr auto AVG_SELL_PRICE = "avg_sell_price";
constexpr auto NET_QUANTITY = "net_quantity";
constexpr auto AVG_HOLDING_PRICE = "avg_holding_price";
} // namespace column

// Cells of a source page, in page order.
constexpr std::array<std::string_view, 10> RAW_PAGE_COLUMNS = {
    column::TRANSACTION_NO, column::SYMBOL,    column::SYMBOL_FULL,
    column::BUYER_ID,       column::BUYER_NAME, column::SELLER_ID,
    column::SELLER_NAME,    column::QUANTITY,  column::RATE,
    column::AMOUNT};

namespace defaults {
constexpr int RETENTION_DAYS = 365;
constexpr auto RAW_TABLE = "public/raw_floorsheet.parquet";
constexpr auto DATE_SUMMARY_TABLE = "public/date_summarized_floorsheet.parquet";
constexpr auto GLOBAL_SUMMARY_TABLE = "public/summarized_floorsheet.parquet";
constexpr auto SOURCE_DIR = "public/floorsheet_csv";
constexpr std::size_t PAGE_SIZE = 500;
constexpr auto LOG_LEVEL = "info";
} // namespace defaults

} // namespace floorsheet
