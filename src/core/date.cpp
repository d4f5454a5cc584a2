//
// Date parsing and retention arithmetic.
//

#include <floorsheet/core/date.h>

#include <charconv>
#include <format>
#include <stdexcept>

namespace floorsheet {

namespace {
bool ParseNumber(std::string_view text, int &out) {
  if (text.empty()) {
    return false;
  }
  auto const *end = text.data() + text.size();
  auto [ptr, ec] = std::from_chars(text.data(), end, out);
  return ec == std::errc{} && ptr == end;
}

std::string_view Trim(std::string_view text) {
  auto const begin = text.find_first_not_of(" \t\r\n");
  if (begin == std::string_view::npos) {
    return {};
  }
  auto const end = text.find_last_not_of(" \t\r\n");
  return text.substr(begin, end - begin + 1);
}
} // namespace

std::optional<Date> TryParseDate(std::string_view text) noexcept {
  text = Trim(text);
  if (text.size() != 10) {
    return std::nullopt;
  }
  char const sep = text[4];
  if ((sep != '-' && sep != '/') || text[7] != sep) {
    return std::nullopt;
  }

  int y = 0, m = 0, d = 0;
  if (!ParseNumber(text.substr(0, 4), y) || !ParseNumber(text.substr(5, 2), m) ||
      !ParseNumber(text.substr(8, 2), d)) {
    return std::nullopt;
  }
  if (m <= 0 || d <= 0) {
    return std::nullopt;
  }

  Date const date{std::chrono::year{y}, std::chrono::month{static_cast<unsigned>(m)},
                  std::chrono::day{static_cast<unsigned>(d)}};
  if (!date.ok()) {
    return std::nullopt;
  }
  return date;
}

Date ParseDate(std::string_view text) {
  if (auto date = TryParseDate(text)) {
    return *date;
  }
  throw std::invalid_argument(std::format("invalid date '{}', expected YYYY-MM-DD", text));
}

std::string FormatDate(Date const &date) {
  return std::format("{:04d}-{:02d}-{:02d}", static_cast<int>(date.year()),
                     static_cast<unsigned>(date.month()),
                     static_cast<unsigned>(date.day()));
}

int32_t ToDaysSinceEpoch(Date const &date) {
  return static_cast<int32_t>(
      std::chrono::sys_days{date}.time_since_epoch().count());
}

Date FromDaysSinceEpoch(int32_t days) {
  return Date{std::chrono::sys_days{std::chrono::days{days}}};
}

Date Today() {
  return Date{std::chrono::floor<std::chrono::days>(std::chrono::system_clock::now())};
}

Date RetentionCutoff(Date const &today, int retentionDays) {
  return Date{std::chrono::sys_days{today} - std::chrono::days{retentionDays}};
}

} // namespace floorsheet
