#pragma once
//
// Calendar date helpers shared by every table in the pipeline.
//

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace floorsheet {

using Date = std::chrono::year_month_day;

// Accepts "YYYY-MM-DD" and the exchange's "YYYY/MM/DD" page format.
std::optional<Date> TryParseDate(std::string_view text) noexcept;

// Throws std::invalid_argument on malformed input.
Date ParseDate(std::string_view text);

std::string FormatDate(Date const &date);

int32_t ToDaysSinceEpoch(Date const &date);
Date FromDaysSinceEpoch(int32_t days);

// UTC calendar date of the wall clock. Only the CLI layer reads it.
Date Today();

// Earliest date still kept: today - retentionDays.
Date RetentionCutoff(Date const &today, int retentionDays);

} // namespace floorsheet
