#include <floorsheet/pipeline/stage_report.h>

#include <fstream>
#include <glaze/glaze.hpp>
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace floorsheet::pipeline {

namespace {
struct DateFailureJson {
  std::string date;
  std::string reason;
};

struct StageReportJson {
  std::string stage;
  std::string status;
  std::string error;
  std::string message;
  std::optional<std::string> cutoff;
  std::optional<std::string> trading_date;
  size_t input_rows{};
  size_t retention_removed{};
  size_t duplicates{};
  size_t malformed_records{};
  size_t rows_written{};
  std::vector<std::string> replaced_dates;
  std::vector<DateFailureJson> date_failures;
};

struct RunReportJson {
  bool ok{true};
  std::vector<StageReportJson> stages;
};

std::optional<std::string> FormatOptional(std::optional<Date> const &date) {
  if (!date) {
    return std::nullopt;
  }
  return FormatDate(*date);
}

StageReportJson ToDto(StageReport const &report) {
  StageReportJson dto;
  dto.stage = report.stage;
  dto.status = std::string(ToString(report.status));
  dto.error = std::string(ToString(report.error));
  dto.message = report.message;
  dto.cutoff = FormatOptional(report.cutoff);
  dto.trading_date = FormatOptional(report.trading_date);
  dto.input_rows = report.input_rows;
  dto.retention_removed = report.retention_removed;
  dto.duplicates = report.duplicates;
  dto.malformed_records = report.malformed_records;
  dto.rows_written = report.rows_written;
  for (auto const &date : report.replaced_dates) {
    dto.replaced_dates.push_back(FormatDate(date));
  }
  for (auto const &failure : report.date_failures) {
    dto.date_failures.push_back({FormatDate(failure.date), failure.reason});
  }
  return dto;
}
} // namespace

StageReport &StageReport::Fail(ErrorKind kind, std::string reason) {
  status = StageStatus::Failed;
  error = kind;
  message = std::move(reason);
  SPDLOG_ERROR("{} failed ({}): {}", stage, ToString(kind), message);
  return *this;
}

StageReport &StageReport::NoOp(std::string reason) {
  status = StageStatus::NoOp;
  message = std::move(reason);
  SPDLOG_INFO("{}: {}", stage, message);
  return *this;
}

std::string ToJson(std::span<StageReport const> reports) {
  RunReportJson run;
  for (auto const &report : reports) {
    run.ok = run.ok && report.ok();
    run.stages.push_back(ToDto(report));
  }

  std::string json;
  auto ec = glz::write<glz::opts{.prettify = true}>(run, json);
  if (ec) {
    throw std::runtime_error("Failed to serialize run report to JSON");
  }
  return json;
}

void WriteRunReport(std::filesystem::path const &path, std::span<StageReport const> reports) {
  auto const json = ToJson(reports);
  if (auto const parent = path.parent_path(); !parent.empty()) {
    std::filesystem::create_directories(parent);
  }
  std::ofstream file(path);
  if (!file.is_open()) {
    throw std::runtime_error("Failed to open file for writing: " + path.string());
  }
  file << json;
  if (!file) {
    throw std::runtime_error("Failed to write run report: " + path.string());
  }
  SPDLOG_INFO("Run report written to {}", path.string());
}

} // namespace floorsheet::pipeline
