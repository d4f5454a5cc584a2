#include <catch2/catch_all.hpp>
#include <floorsheet/app/cli.h>

#include "unit/common/fixtures.h"

using namespace floorsheet;
using namespace floorsheet::test;
using Catch::Matchers::ContainsSubstring;

namespace {
auto Parse(std::vector<char const *> const &args) { return app::ParseCommandLine(args); }

EnvLoader const &NoEnvironment() {
  static EnvLoader const env(std::vector<std::filesystem::path>{});
  return env;
}
} // namespace

TEST_CASE("Commands and their options parse", "[cli]") {
  auto const cl = Parse({"fetch", "--date", "2024-01-02", "--max-pages", "3", "--output",
                         "out/raw.parquet", "--log-level", "debug"});

  REQUIRE(cl.has_value());
  REQUIRE(cl->command == app::Command::Fetch);
  REQUIRE(cl->date == D("2024-01-02"));
  REQUIRE(cl->max_pages == 3);
  REQUIRE(cl->output == std::filesystem::path("out/raw.parquet"));
  REQUIRE(cl->log_level == "debug");
}

TEST_CASE("Usage errors name the problem", "[cli]") {
  using Args = std::vector<char const *>;
  auto const [args, message] = GENERATE(table<Args, std::string>({
      {Args{}, "missing command"},
      {Args{"publish"}, "unknown command"},
      {Args{"summarize", "--date", "2024-01-02"}, "unknown option"},
      {Args{"run-all", "--output", "x"}, "unknown option"},
      {Args{"fetch", "--date"}, "requires a value"},
      {Args{"fetch", "--date", "02-01-2024"}, "YYYY-MM-DD"},
      {Args{"fetch", "--max-pages", "0"}, "at least 1"},
      {Args{"fetch", "--max-pages", "many"}, "expects an integer"},
      {Args{"date-summary", "--retention-days", "-1"}, "at least 0"},
  }));

  auto const cl = Parse(args);
  REQUIRE_FALSE(cl.has_value());
  REQUIRE_THAT(cl.error().message, ContainsSubstring(message));
}

TEST_CASE("--help wins anywhere on the line", "[cli]") {
  REQUIRE(Parse({"--help"})->command == app::Command::Help);
  REQUIRE(Parse({"fetch", "--date", "2024-01-02", "--help"})->command == app::Command::Help);
  REQUIRE_THAT(app::Usage(), ContainsSubstring("run-all"));
}

TEST_CASE("--input and --output follow the command", "[cli]") {
  SECTION("date-summary") {
    auto const cl =
        Parse({"date-summary", "--input", "in.parquet", "--output", "daily.parquet"});
    auto const config = app::ResolveConfig(*cl, NoEnvironment());
    REQUIRE(config.raw_table == "in.parquet");
    REQUIRE(config.date_summary_table == "daily.parquet");
  }

  SECTION("summarize") {
    auto const cl = Parse({"summarize", "--input", "daily.parquet", "--output", "all.parquet"});
    auto const config = app::ResolveConfig(*cl, NoEnvironment());
    REQUIRE(config.date_summary_table == "daily.parquet");
    REQUIRE(config.global_summary_table == "all.parquet");
  }

  SECTION("fetch") {
    auto const cl = Parse({"fetch", "--output", "raw.parquet", "--page-size", "100"});
    auto const config = app::ResolveConfig(*cl, NoEnvironment());
    REQUIRE(config.raw_table == "raw.parquet");
    REQUIRE(config.page_size == 100);
  }
}

TEST_CASE("Flags override the config file", "[cli]") {
  TempDir dir;
  auto const file = dir.WriteFile("pipeline.yaml", "retention_days: 30\nlog_level: warn\n");

  auto const cl = Parse({"run-all", "--config", file.c_str(), "--retention-days", "7",
                         "--data-dir", "/srv/data"});
  auto const config = app::ResolveConfig(*cl, NoEnvironment());

  REQUIRE(config.retention_days == 7);
  REQUIRE(config.log_level == "warn");
  REQUIRE(config.raw_table == "/srv/data/raw_floorsheet.parquet");
  REQUIRE(config.source_dir == "/srv/data/floorsheet_csv");
}

TEST_CASE("Main maps outcomes to exit codes", "[cli]") {
  TempDir dir;
  auto const data = dir.path().string();

  SECTION("usage error") {
    std::vector<char const *> args{"fetch", "--bogus", "1"};
    REQUIRE(app::Main(args) == app::EXIT_USAGE);
  }

  SECTION("help") {
    std::vector<char const *> args{"--help"};
    REQUIRE(app::Main(args) == app::EXIT_OK);
  }

  SECTION("bad log level") {
    std::vector<char const *> args{"summarize", "--log-level", "loud", "--data-dir",
                                   data.c_str()};
    REQUIRE(app::Main(args) == app::EXIT_USAGE);
  }

  SECTION("failed stage") {
    auto const report = (dir / "run.json").string();
    std::vector<char const *> args{"summarize", "--data-dir", data.c_str(), "--report",
                                   report.c_str()};
    REQUIRE(app::Main(args) == app::EXIT_STAGE_FAILED);
    REQUIRE(std::filesystem::exists(report));
  }
}
