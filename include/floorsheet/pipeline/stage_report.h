#pragma once
#include <floorsheet/core/date.h>
#include <floorsheet/core/errors.h>

#include <filesystem>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace floorsheet::pipeline {

enum class StageStatus {
  Success,
  NoOp, // nothing new to write; the output file was left untouched
  Failed
};

constexpr std::string_view ToString(StageStatus status) {
  switch (status) {
  case StageStatus::Success:
    return "Success";
  case StageStatus::NoOp:
    return "NoOp";
  case StageStatus::Failed:
    return "Failed";
  }
  return "Unknown";
}

struct DateFailure {
  Date date;
  std::string reason;
};

struct StageReport {
  std::string stage;
  StageStatus status{StageStatus::Success};
  ErrorKind error{ErrorKind::None};
  std::string message;

  std::optional<Date> cutoff;
  std::optional<Date> trading_date;
  size_t input_rows{0};
  size_t retention_removed{0};
  size_t duplicates{0};
  size_t malformed_records{0};
  size_t rows_written{0};
  std::vector<Date> replaced_dates;
  std::vector<DateFailure> date_failures;

  bool ok() const { return status != StageStatus::Failed; }

  StageReport &Fail(ErrorKind kind, std::string reason);
  StageReport &NoOp(std::string reason);
};

std::string ToJson(std::span<StageReport const> reports);

// Throws std::runtime_error when the file cannot be written.
void WriteRunReport(std::filesystem::path const &path, std::span<StageReport const> reports);

} // namespace floorsheet::pipeline
