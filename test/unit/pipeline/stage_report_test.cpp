#include <catch2/catch_all.hpp>
#include <floorsheet/pipeline/stage_report.h>

#include "unit/common/fixtures.h"
#include <fstream>
#include <sstream>

using namespace floorsheet;
using namespace floorsheet::test;
using Catch::Matchers::ContainsSubstring;

namespace {
std::vector<pipeline::StageReport> SampleRun() {
  pipeline::StageReport fetch;
  fetch.stage = "fetch";
  fetch.cutoff = D("2023-01-02");
  fetch.trading_date = D("2024-01-02");
  fetch.input_rows = 120;
  fetch.duplicates = 4;
  fetch.rows_written = 116;

  pipeline::StageReport daily;
  daily.stage = "date-summary";
  daily.replaced_dates = {D("2024-01-02")};
  daily.date_failures = {{D("2024-01-03"), "row 7: null buyer_id"}};
  daily.Fail(ErrorKind::MalformedRecord, "Failed to create date-wise summaries.");

  return {fetch, daily};
}
} // namespace

TEST_CASE("Fail and NoOp set the outcome", "[stage_report]") {
  pipeline::StageReport report;
  report.stage = "summarize";
  REQUIRE(report.ok());

  report.NoOp("nothing to do");
  REQUIRE(report.ok());
  REQUIRE(report.status == pipeline::StageStatus::NoOp);

  report.Fail(ErrorKind::PersistFailure, "disk full");
  REQUIRE_FALSE(report.ok());
  REQUIRE(report.error == ErrorKind::PersistFailure);
  REQUIRE(report.message == "disk full");
}

TEST_CASE("Run reports serialize every stage", "[stage_report]") {
  auto const reports = SampleRun();
  auto const json = pipeline::ToJson(reports);

  REQUIRE_THAT(json, ContainsSubstring(R"("ok": false)"));
  REQUIRE_THAT(json, ContainsSubstring(R"("stage": "fetch")"));
  REQUIRE_THAT(json, ContainsSubstring(R"("trading_date": "2024-01-02")"));
  REQUIRE_THAT(json, ContainsSubstring(R"("duplicates": 4)"));
  REQUIRE_THAT(json, ContainsSubstring(R"("status": "Failed")"));
  REQUIRE_THAT(json, ContainsSubstring(R"("error": "MalformedRecord")"));
  REQUIRE_THAT(json, ContainsSubstring("null buyer_id"));
}

TEST_CASE("WriteRunReport creates the report file", "[stage_report]") {
  TempDir dir;
  auto const path = dir / "reports/run.json";
  auto const reports = SampleRun();

  pipeline::WriteRunReport(path, reports);

  std::ifstream file(path);
  std::stringstream content;
  content << file.rdbuf();
  REQUIRE(content.str() == pipeline::ToJson(reports));
}
