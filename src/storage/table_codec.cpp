#include <floorsheet/core/constants.h>
#include <floorsheet/rollup/derived_metrics.h>
#include <floorsheet/storage/table_codec.h>

#include "storage/arrow_compute.h"
#include <arrow/api.h>
#include <arrow/array/concatenate.h>
#include <arrow/array/util.h>
#include <arrow/compute/api.h>
#include <format>
#include <initializer_list>
#include <string_view>
#include <utility>

namespace floorsheet::storage {

namespace {

using ArrayPtr = std::shared_ptr<arrow::Array>;

arrow::Result<ArrayPtr> Flatten(std::shared_ptr<arrow::ChunkedArray> const &column) {
  if (column->num_chunks() == 0) {
    return arrow::MakeEmptyArray(column->type());
  }
  if (column->num_chunks() == 1) {
    return column->chunk(0);
  }
  return arrow::Concatenate(column->chunks());
}

// nullptr when the column is absent
arrow::Result<ArrayPtr> ColumnAs(arrow::Table const &table, std::string const &name,
                                 std::shared_ptr<arrow::DataType> const &type) {
  auto const column = table.GetColumnByName(name);
  if (!column) {
    return ArrayPtr{};
  }
  ARROW_ASSIGN_OR_RAISE(auto array, Flatten(column));
  if (array->type()->Equals(*type)) {
    return array;
  }
  ARROW_RETURN_NOT_OK(InitializeCompute());
  return arrow::compute::Cast(*array, type, arrow::compute::CastOptions::Unsafe());
}

arrow::Result<ArrayPtr> RequiredColumn(arrow::Table const &table, std::string const &name,
                                       std::shared_ptr<arrow::DataType> const &type) {
  ARROW_ASSIGN_OR_RAISE(auto array, ColumnAs(table, name, type));
  if (!array) {
    return arrow::Status::KeyError("required column '", name, "' not found");
  }
  return array;
}

template <typename ArrayT> std::shared_ptr<ArrayT> As(ArrayPtr const &array) {
  return std::static_pointer_cast<ArrayT>(array);
}

std::string StringAt(std::shared_ptr<arrow::StringArray> const &array, int64_t i) {
  if (!array || array->IsNull(i)) {
    return {};
  }
  return std::string(array->GetView(i));
}

double DoubleAt(std::shared_ptr<arrow::DoubleArray> const &array, int64_t i) {
  return (array && array->IsValid(i)) ? array->Value(i) : 0.0;
}

std::optional<std::string_view>
FirstNull(int64_t i, std::initializer_list<std::pair<std::string_view, arrow::Array const *>> cells) {
  for (auto const &[name, array] : cells) {
    if (array->IsNull(i)) {
      return name;
    }
  }
  return std::nullopt;
}

std::optional<Date> DateAt(std::shared_ptr<arrow::Date32Array> const &array, int64_t i) {
  if (array->IsNull(i)) {
    return std::nullopt;
  }
  return FromDaysSinceEpoch(array->Value(i));
}

std::shared_ptr<arrow::Schema> SummarySchema(std::string const &dateColumn) {
  return arrow::schema({
      arrow::field(dateColumn, arrow::date32()),
      arrow::field(column::BROKER_ID, arrow::utf8()),
      arrow::field(column::BROKER_NAME, arrow::utf8()),
      arrow::field(column::SYMBOL, arrow::utf8()),
      arrow::field(column::BUY_QUANTITY, arrow::int64()),
      arrow::field(column::BUY_AMOUNT, arrow::float64()),
      arrow::field(column::SELL_QUANTITY, arrow::int64()),
      arrow::field(column::SELL_AMOUNT, arrow::float64()),
      arrow::field(column::AVG_BUY_PRICE, arrow::float64()),
      arrow::field(column::AVG_SELL_PRICE, arrow::float64()),
      arrow::field(column::NET_QUANTITY, arrow::int64()),
      arrow::field(column::AVG_HOLDING_PRICE, arrow::float64()),
  });
}

struct SummaryBuilders {
  arrow::Date32Builder date;
  arrow::StringBuilder brokerId;
  arrow::StringBuilder brokerName;
  arrow::StringBuilder symbol;
  arrow::Int64Builder buyQuantity;
  arrow::DoubleBuilder buyAmount;
  arrow::Int64Builder sellQuantity;
  arrow::DoubleBuilder sellAmount;
  arrow::DoubleBuilder avgBuyPrice;
  arrow::DoubleBuilder avgSellPrice;
  arrow::Int64Builder netQuantity;
  arrow::DoubleBuilder avgHoldingPrice;

  arrow::Status Append(Date const &d, BrokerStockSummary const &s) {
    ARROW_RETURN_NOT_OK(date.Append(ToDaysSinceEpoch(d)));
    ARROW_RETURN_NOT_OK(brokerId.Append(s.broker_id));
    ARROW_RETURN_NOT_OK(brokerName.Append(s.broker_name));
    ARROW_RETURN_NOT_OK(symbol.Append(s.symbol));
    ARROW_RETURN_NOT_OK(buyQuantity.Append(s.buy_quantity));
    ARROW_RETURN_NOT_OK(buyAmount.Append(s.buy_amount));
    ARROW_RETURN_NOT_OK(sellQuantity.Append(s.sell_quantity));
    ARROW_RETURN_NOT_OK(sellAmount.Append(s.sell_amount));
    ARROW_RETURN_NOT_OK(avgBuyPrice.Append(s.avg_buy_price));
    ARROW_RETURN_NOT_OK(avgSellPrice.Append(s.avg_sell_price));
    ARROW_RETURN_NOT_OK(netQuantity.Append(s.net_quantity));
    return avgHoldingPrice.Append(s.avg_holding_price);
  }

  arrow::Result<std::shared_ptr<arrow::Table>>
  Finish(std::shared_ptr<arrow::Schema> const &schema) {
    std::vector<ArrayPtr> arrays(12);
    ARROW_ASSIGN_OR_RAISE(arrays[0], date.Finish());
    ARROW_ASSIGN_OR_RAISE(arrays[1], brokerId.Finish());
    ARROW_ASSIGN_OR_RAISE(arrays[2], brokerName.Finish());
    ARROW_ASSIGN_OR_RAISE(arrays[3], symbol.Finish());
    ARROW_ASSIGN_OR_RAISE(arrays[4], buyQuantity.Finish());
    ARROW_ASSIGN_OR_RAISE(arrays[5], buyAmount.Finish());
    ARROW_ASSIGN_OR_RAISE(arrays[6], sellQuantity.Finish());
    ARROW_ASSIGN_OR_RAISE(arrays[7], sellAmount.Finish());
    ARROW_ASSIGN_OR_RAISE(arrays[8], avgBuyPrice.Finish());
    ARROW_ASSIGN_OR_RAISE(arrays[9], avgSellPrice.Finish());
    ARROW_ASSIGN_OR_RAISE(arrays[10], netQuantity.Finish());
    ARROW_ASSIGN_OR_RAISE(arrays[11], avgHoldingPrice.Finish());
    return arrow::Table::Make(schema, arrays);
  }
};

arrow::Result<Decoded<std::pair<Date, BrokerStockSummary>>>
DecodeSummaries(std::shared_ptr<arrow::Table> const &input, std::string const &dateColumn) {
  if (!input) {
    return arrow::Status::Invalid("cannot decode a null table");
  }
  ARROW_ASSIGN_OR_RAISE(auto const table, NormalizeDateColumn(input, dateColumn));

  ARROW_ASSIGN_OR_RAISE(auto dateArray, RequiredColumn(*table, dateColumn, arrow::date32()));
  ARROW_ASSIGN_OR_RAISE(auto brokerIdArray, RequiredColumn(*table, column::BROKER_ID, arrow::utf8()));
  ARROW_ASSIGN_OR_RAISE(auto symbolArray, RequiredColumn(*table, column::SYMBOL, arrow::utf8()));
  ARROW_ASSIGN_OR_RAISE(auto buyQtyArray, RequiredColumn(*table, column::BUY_QUANTITY, arrow::int64()));
  ARROW_ASSIGN_OR_RAISE(auto buyAmtArray, RequiredColumn(*table, column::BUY_AMOUNT, arrow::float64()));
  ARROW_ASSIGN_OR_RAISE(auto sellQtyArray, RequiredColumn(*table, column::SELL_QUANTITY, arrow::int64()));
  ARROW_ASSIGN_OR_RAISE(auto sellAmtArray, RequiredColumn(*table, column::SELL_AMOUNT, arrow::float64()));
  ARROW_ASSIGN_OR_RAISE(auto brokerNameArray, ColumnAs(*table, column::BROKER_NAME, arrow::utf8()));

  auto const dates = As<arrow::Date32Array>(dateArray);
  auto const brokerIds = As<arrow::StringArray>(brokerIdArray);
  auto const brokerNames = As<arrow::StringArray>(brokerNameArray);
  auto const symbols = As<arrow::StringArray>(symbolArray);
  auto const buyQty = As<arrow::Int64Array>(buyQtyArray);
  auto const buyAmt = As<arrow::DoubleArray>(buyAmtArray);
  auto const sellQty = As<arrow::Int64Array>(sellQtyArray);
  auto const sellAmt = As<arrow::DoubleArray>(sellAmtArray);

  Decoded<std::pair<Date, BrokerStockSummary>> out;
  out.rows.reserve(static_cast<size_t>(table->num_rows()));
  for (int64_t i = 0; i < table->num_rows(); ++i) {
    auto const missing = FirstNull(i, {{dateColumn, dates.get()},
                                       {column::BROKER_ID, brokerIds.get()},
                                       {column::SYMBOL, symbols.get()},
                                       {column::BUY_QUANTITY, buyQty.get()},
                                       {column::BUY_AMOUNT, buyAmt.get()},
                                       {column::SELL_QUANTITY, sellQty.get()},
                                       {column::SELL_AMOUNT, sellAmt.get()}});
    if (missing) {
      out.issues.push_back({i, DateAt(dates, i), std::format("null {}", *missing)});
      continue;
    }

    BrokerStockSummary summary;
    summary.broker_id = StringAt(brokerIds, i);
    summary.broker_name = StringAt(brokerNames, i);
    summary.symbol = StringAt(symbols, i);
    summary.buy_quantity = buyQty->Value(i);
    summary.buy_amount = buyAmt->Value(i);
    summary.sell_quantity = sellQty->Value(i);
    summary.sell_amount = sellAmt->Value(i);
    rollup::ComputeDerivedMetrics(summary);
    out.rows.emplace_back(FromDaysSinceEpoch(dates->Value(i)), std::move(summary));
  }
  return out;
}

} // namespace

std::shared_ptr<arrow::Schema> TransactionSchema() {
  return arrow::schema({
      arrow::field(column::DATE, arrow::date32()),
      arrow::field(column::TRANSACTION_NO, arrow::utf8()),
      arrow::field(column::SYMBOL, arrow::utf8()),
      arrow::field(column::SYMBOL_FULL, arrow::utf8()),
      arrow::field(column::BUYER_ID, arrow::utf8()),
      arrow::field(column::BUYER_NAME, arrow::utf8()),
      arrow::field(column::SELLER_ID, arrow::utf8()),
      arrow::field(column::SELLER_NAME, arrow::utf8()),
      arrow::field(column::QUANTITY, arrow::int64()),
      arrow::field(column::RATE, arrow::float64()),
      arrow::field(column::AMOUNT, arrow::float64()),
  });
}

std::shared_ptr<arrow::Schema> DateSummarySchema() { return SummarySchema(column::DATE); }

std::shared_ptr<arrow::Schema> GlobalSummarySchema() {
  return SummarySchema(column::LAST_UPDATED);
}

arrow::Result<std::shared_ptr<arrow::Table>> EncodeTransactions(TransactionList const &rows) {
  arrow::Date32Builder date;
  arrow::StringBuilder transactionNo, symbol, symbolFull, buyerId, buyerName, sellerId,
      sellerName;
  arrow::Int64Builder quantity;
  arrow::DoubleBuilder rate, amount;

  for (auto const &row : rows) {
    ARROW_RETURN_NOT_OK(date.Append(ToDaysSinceEpoch(row.trading_date)));
    ARROW_RETURN_NOT_OK(transactionNo.Append(row.transaction_no));
    ARROW_RETURN_NOT_OK(symbol.Append(row.symbol));
    ARROW_RETURN_NOT_OK(symbolFull.Append(row.symbol_full));
    ARROW_RETURN_NOT_OK(buyerId.Append(row.buyer_id));
    ARROW_RETURN_NOT_OK(buyerName.Append(row.buyer_name));
    ARROW_RETURN_NOT_OK(sellerId.Append(row.seller_id));
    ARROW_RETURN_NOT_OK(sellerName.Append(row.seller_name));
    ARROW_RETURN_NOT_OK(quantity.Append(row.quantity));
    ARROW_RETURN_NOT_OK(rate.Append(row.rate));
    ARROW_RETURN_NOT_OK(amount.Append(row.amount));
  }

  std::vector<ArrayPtr> arrays(11);
  ARROW_ASSIGN_OR_RAISE(arrays[0], date.Finish());
  ARROW_ASSIGN_OR_RAISE(arrays[1], transactionNo.Finish());
  ARROW_ASSIGN_OR_RAISE(arrays[2], symbol.Finish());
  ARROW_ASSIGN_OR_RAISE(arrays[3], symbolFull.Finish());
  ARROW_ASSIGN_OR_RAISE(arrays[4], buyerId.Finish());
  ARROW_ASSIGN_OR_RAISE(arrays[5], buyerName.Finish());
  ARROW_ASSIGN_OR_RAISE(arrays[6], sellerId.Finish());
  ARROW_ASSIGN_OR_RAISE(arrays[7], sellerName.Finish());
  ARROW_ASSIGN_OR_RAISE(arrays[8], quantity.Finish());
  ARROW_ASSIGN_OR_RAISE(arrays[9], rate.Finish());
  ARROW_ASSIGN_OR_RAISE(arrays[10], amount.Finish());
  return arrow::Table::Make(TransactionSchema(), arrays);
}

arrow::Result<std::shared_ptr<arrow::Table>> EncodeDateSummaries(DateSummaryList const &rows) {
  SummaryBuilders builders;
  for (auto const &row : rows) {
    ARROW_RETURN_NOT_OK(builders.Append(row.date, row.summary));
  }
  return builders.Finish(DateSummarySchema());
}

arrow::Result<std::shared_ptr<arrow::Table>>
EncodeGlobalSummaries(GlobalSummaryList const &rows) {
  SummaryBuilders builders;
  for (auto const &row : rows) {
    ARROW_RETURN_NOT_OK(builders.Append(row.last_updated, row.summary));
  }
  return builders.Finish(GlobalSummarySchema());
}

arrow::Result<Decoded<TransactionRecord>>
DecodeTransactions(std::shared_ptr<arrow::Table> const &input) {
  if (!input) {
    return arrow::Status::Invalid("cannot decode a null table");
  }
  ARROW_ASSIGN_OR_RAISE(auto const table, NormalizeDateColumn(input, column::DATE));

  ARROW_ASSIGN_OR_RAISE(auto dateArray, RequiredColumn(*table, column::DATE, arrow::date32()));
  ARROW_ASSIGN_OR_RAISE(auto txArray, RequiredColumn(*table, column::TRANSACTION_NO, arrow::utf8()));
  ARROW_ASSIGN_OR_RAISE(auto symbolArray, RequiredColumn(*table, column::SYMBOL, arrow::utf8()));
  ARROW_ASSIGN_OR_RAISE(auto buyerArray, RequiredColumn(*table, column::BUYER_ID, arrow::utf8()));
  ARROW_ASSIGN_OR_RAISE(auto sellerArray, RequiredColumn(*table, column::SELLER_ID, arrow::utf8()));
  ARROW_ASSIGN_OR_RAISE(auto qtyArray, RequiredColumn(*table, column::QUANTITY, arrow::int64()));
  ARROW_ASSIGN_OR_RAISE(auto amountArray, RequiredColumn(*table, column::AMOUNT, arrow::float64()));
  ARROW_ASSIGN_OR_RAISE(auto symbolFullArray, ColumnAs(*table, column::SYMBOL_FULL, arrow::utf8()));
  ARROW_ASSIGN_OR_RAISE(auto buyerNameArray, ColumnAs(*table, column::BUYER_NAME, arrow::utf8()));
  ARROW_ASSIGN_OR_RAISE(auto sellerNameArray, ColumnAs(*table, column::SELLER_NAME, arrow::utf8()));
  ARROW_ASSIGN_OR_RAISE(auto rateArray, ColumnAs(*table, column::RATE, arrow::float64()));

  auto const dates = As<arrow::Date32Array>(dateArray);
  auto const txNos = As<arrow::StringArray>(txArray);
  auto const symbols = As<arrow::StringArray>(symbolArray);
  auto const buyers = As<arrow::StringArray>(buyerArray);
  auto const sellers = As<arrow::StringArray>(sellerArray);
  auto const quantities = As<arrow::Int64Array>(qtyArray);
  auto const amounts = As<arrow::DoubleArray>(amountArray);
  auto const symbolFulls = As<arrow::StringArray>(symbolFullArray);
  auto const buyerNames = As<arrow::StringArray>(buyerNameArray);
  auto const sellerNames = As<arrow::StringArray>(sellerNameArray);
  auto const rates = As<arrow::DoubleArray>(rateArray);

  Decoded<TransactionRecord> out;
  out.rows.reserve(static_cast<size_t>(table->num_rows()));
  for (int64_t i = 0; i < table->num_rows(); ++i) {
    auto const missing = FirstNull(i, {{column::DATE, dates.get()},
                                       {column::TRANSACTION_NO, txNos.get()},
                                       {column::SYMBOL, symbols.get()},
                                       {column::BUYER_ID, buyers.get()},
                                       {column::SELLER_ID, sellers.get()},
                                       {column::QUANTITY, quantities.get()},
                                       {column::AMOUNT, amounts.get()}});
    if (missing) {
      out.issues.push_back({i, DateAt(dates, i), std::format("null {}", *missing)});
      continue;
    }

    TransactionRecord record;
    record.trading_date = FromDaysSinceEpoch(dates->Value(i));
    record.transaction_no = StringAt(txNos, i);
    record.symbol = StringAt(symbols, i);
    record.symbol_full = StringAt(symbolFulls, i);
    record.buyer_id = StringAt(buyers, i);
    record.buyer_name = StringAt(buyerNames, i);
    record.seller_id = StringAt(sellers, i);
    record.seller_name = StringAt(sellerNames, i);
    record.quantity = quantities->Value(i);
    record.rate = DoubleAt(rates, i);
    record.amount = amounts->Value(i);
    out.rows.emplace_back(std::move(record));
  }
  return out;
}

arrow::Result<Decoded<DateSummaryRow>>
DecodeDateSummaries(std::shared_ptr<arrow::Table> const &table) {
  ARROW_ASSIGN_OR_RAISE(auto decoded, DecodeSummaries(table, column::DATE));
  Decoded<DateSummaryRow> out;
  out.issues = std::move(decoded.issues);
  out.rows.reserve(decoded.rows.size());
  for (auto &[date, summary] : decoded.rows) {
    out.rows.push_back(DateSummaryRow{date, std::move(summary)});
  }
  return out;
}

arrow::Result<Decoded<GlobalSummaryRow>>
DecodeGlobalSummaries(std::shared_ptr<arrow::Table> const &table) {
  ARROW_ASSIGN_OR_RAISE(auto decoded, DecodeSummaries(table, column::LAST_UPDATED));
  Decoded<GlobalSummaryRow> out;
  out.issues = std::move(decoded.issues);
  out.rows.reserve(decoded.rows.size());
  for (auto &[date, summary] : decoded.rows) {
    out.rows.push_back(GlobalSummaryRow{date, std::move(summary)});
  }
  return out;
}

arrow::Result<std::shared_ptr<arrow::Table>>
NormalizeDateColumn(std::shared_ptr<arrow::Table> const &table, std::string const &column) {
  if (!table) {
    return arrow::Status::Invalid("cannot normalize a null table");
  }
  auto const index = table->schema()->GetFieldIndex(column);
  if (index < 0) {
    return table;
  }

  auto const typeId = table->column(index)->type()->id();
  if (typeId == arrow::Type::DATE32) {
    return table;
  }

  ArrayPtr dates;
  if (typeId == arrow::Type::STRING || typeId == arrow::Type::LARGE_STRING) {
    ARROW_ASSIGN_OR_RAISE(auto const text, ColumnAs(*table, column, arrow::utf8()));
    auto const strings = As<arrow::StringArray>(text);

    arrow::Date32Builder builder;
    ARROW_RETURN_NOT_OK(builder.Reserve(strings->length()));
    for (int64_t i = 0; i < strings->length(); ++i) {
      std::optional<Date> parsed;
      if (strings->IsValid(i)) {
        parsed = TryParseDate(strings->GetView(i));
      }
      if (parsed) {
        builder.UnsafeAppend(ToDaysSinceEpoch(*parsed));
      } else {
        builder.UnsafeAppendNull();
      }
    }
    ARROW_ASSIGN_OR_RAISE(dates, builder.Finish());
  } else {
    // timestamp and date64 columns
    ARROW_ASSIGN_OR_RAISE(dates, ColumnAs(*table, column, arrow::date32()));
  }

  return table->SetColumn(index, arrow::field(column, arrow::date32()),
                          std::make_shared<arrow::ChunkedArray>(dates));
}

} // namespace floorsheet::storage
