#include <floorsheet/source/record_parser.h>

#include <algorithm>
#include <charconv>
#include <cmath>
#include <format>
#include <optional>
#include <string_view>

namespace floorsheet::source {

namespace {
std::string_view Trim(std::string_view text) {
  constexpr std::string_view whitespace = " \t\r\n";
  auto const first = text.find_first_not_of(whitespace);
  if (first == std::string_view::npos) {
    return {};
  }
  auto const last = text.find_last_not_of(whitespace);
  return text.substr(first, last - first + 1);
}

std::string StripSeparators(std::string_view text) {
  std::string digits(Trim(text));
  std::erase(digits, ',');
  return digits;
}

template <typename T> std::optional<T> ParseNumber(std::string_view text) {
  auto const digits = StripSeparators(text);
  if (digits.empty()) {
    return std::nullopt;
  }
  T value{};
  auto const *end = digits.data() + digits.size();
  auto const [ptr, ec] = std::from_chars(digits.data(), end, value);
  if (ec != std::errc{} || ptr != end) {
    return std::nullopt;
  }
  return value;
}

std::unexpected<RecordError> Invalid(std::string field, std::string_view value) {
  return std::unexpected(
      RecordError{std::move(field), std::format("cannot parse '{}'", value)});
}
} // namespace

std::expected<TransactionRecord, RecordError>
ParseTransactionRow(RawTransactionRow const &row, Date const &tradingDate) {
  TransactionRecord record;
  record.trading_date = tradingDate;
  record.transaction_no = std::string(Trim(row.transaction_no));
  if (record.transaction_no.empty()) {
    return std::unexpected(RecordError{"transaction_no", "empty"});
  }

  record.symbol = std::string(Trim(row.symbol));
  record.symbol_full = std::string(Trim(row.symbol_full));
  record.buyer_id = std::string(Trim(row.buyer_id));
  record.buyer_name = std::string(Trim(row.buyer_name));
  record.seller_id = std::string(Trim(row.seller_id));
  record.seller_name = std::string(Trim(row.seller_name));

  // the fold keys on these, so a blank one cannot be summarized later
  if (record.symbol.empty()) {
    return std::unexpected(RecordError{"symbol", "empty"});
  }
  if (record.buyer_id.empty()) {
    return std::unexpected(RecordError{"buyer_id", "empty"});
  }
  if (record.seller_id.empty()) {
    return std::unexpected(RecordError{"seller_id", "empty"});
  }

  auto const quantity = ParseNumber<int64_t>(row.quantity);
  if (!quantity) {
    return Invalid("quantity", row.quantity);
  }
  if (*quantity < 0) {
    return std::unexpected(RecordError{"quantity", "negative"});
  }
  record.quantity = *quantity;

  auto const rate = ParseNumber<double>(row.rate);
  if (!rate || !std::isfinite(*rate)) {
    return Invalid("rate", row.rate);
  }
  if (*rate < 0) {
    return std::unexpected(RecordError{"rate", "negative"});
  }
  record.rate = *rate;

  auto const amount = ParseNumber<double>(row.amount);
  if (!amount || !std::isfinite(*amount)) {
    return Invalid("amount", row.amount);
  }
  if (*amount < 0) {
    return std::unexpected(RecordError{"amount", "negative"});
  }
  record.amount = *amount;

  return record;
}

} // namespace floorsheet::source
