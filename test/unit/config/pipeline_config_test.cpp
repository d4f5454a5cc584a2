#include <catch2/catch_all.hpp>
#include <floorsheet/config/pipeline_config.h>

#include "unit/common/fixtures.h"

using namespace floorsheet;
using namespace floorsheet::test;

TEST_CASE("Defaults match the published table layout", "[pipeline_config]") {
  config::PipelineConfig const config;

  REQUIRE(config.retention_days == 365);
  REQUIRE(config.raw_table == "public/raw_floorsheet.parquet");
  REQUIRE(config.date_summary_table == "public/date_summarized_floorsheet.parquet");
  REQUIRE(config.global_summary_table == "public/summarized_floorsheet.parquet");
  REQUIRE_FALSE(config.max_pages.has_value());
  REQUIRE_NOTHROW(config.Validate());
}

TEST_CASE("YAML settings overlay the defaults", "[pipeline_config]") {
  TempDir dir;
  auto const file = dir.WriteFile("pipeline.yaml", R"(
retention_days: 30
log_level: debug
date: 2024-01-02
source:
  dir: /data/csv
  page_size: 250
  max_pages: 4
  page_delay_ms: 1500
tables:
  raw: /data/raw.parquet
)");

  auto const config = config::LoadPipelineConfig(file);

  REQUIRE(config.retention_days == 30);
  REQUIRE(config.log_level == "debug");
  REQUIRE(config.target_date == D("2024-01-02"));
  REQUIRE(config.source_dir == "/data/csv");
  REQUIRE(config.page_size == 250);
  REQUIRE(config.max_pages == 4);
  REQUIRE(config.page_delay == std::chrono::milliseconds(1500));
  REQUIRE(config.raw_table == "/data/raw.parquet");
  // untouched keys keep their defaults
  REQUIRE(config.global_summary_table == "public/summarized_floorsheet.parquet");
}

TEST_CASE("Unusable config files are rejected", "[pipeline_config]") {
  TempDir dir;

  SECTION("missing file") {
    REQUIRE_THROWS_AS(config::LoadPipelineConfig(dir / "absent.yaml"), std::runtime_error);
  }

  SECTION("not a map") {
    auto const file = dir.WriteFile("list.yaml", "- 1\n- 2\n");
    REQUIRE_THROWS_AS(config::LoadPipelineConfig(file), std::runtime_error);
  }

  SECTION("wrong value type") {
    auto const file = dir.WriteFile("bad.yaml", "retention_days: a year\n");
    REQUIRE_THROWS_AS(config::LoadPipelineConfig(file), std::runtime_error);
  }

  SECTION("bad date") {
    auto const file = dir.WriteFile("date.yaml", "date: 02/01/2024\n");
    REQUIRE_THROWS_WITH(config::LoadPipelineConfig(file),
                        Catch::Matchers::ContainsSubstring("YYYY-MM-DD"));
  }

  SECTION("empty file keeps the base") {
    auto const file = dir.WriteFile("empty.yaml", "");
    config::PipelineConfig base;
    base.retention_days = 7;
    REQUIRE(config::LoadPipelineConfig(file, base).retention_days == 7);
  }
}

TEST_CASE("Environment files override the YAML layer", "[pipeline_config][env]") {
  TempDir dir;
  auto const envFile = dir.WriteFile(".env.local", R"(
# local overrides
export FLOORSHEET_RETENTION_DAYS=90
FLOORSHEET_DATA_DIR="/srv/floorsheet"
FLOORSHEET_LOG_LEVEL=${FLOORSHEET_TEST_UNSET_LEVEL}
)");
  EnvLoader const env({envFile});
  REQUIRE(env.size() == 3);

  config::PipelineConfig config;
  config::ApplyEnvironment(config, env);

  REQUIRE(config.retention_days == 90);
  REQUIRE(config.raw_table == "/srv/floorsheet/raw_floorsheet.parquet");
  REQUIRE(config.global_summary_table == "/srv/floorsheet/summarized_floorsheet.parquet");
  REQUIRE(config.source_dir == "/srv/floorsheet/floorsheet_csv");
  // expands to an empty value, which falls back to the default
  REQUIRE(config.log_level == "info");
}

TEST_CASE("A non-numeric retention falls back to the current value", "[pipeline_config][env]") {
  TempDir dir;
  EnvLoader const env({dir.WriteFile(".env", "FLOORSHEET_RETENTION_DAYS=forever\n")});

  config::PipelineConfig config;
  config.retention_days = 10;
  config::ApplyEnvironment(config, env);
  REQUIRE(config.retention_days == 10);
}

TEST_CASE("Validate rejects out-of-range settings", "[pipeline_config]") {
  config::PipelineConfig config;

  SECTION("negative retention") { config.retention_days = -1; }
  SECTION("zero page size") { config.page_size = 0; }
  SECTION("zero max pages") { config.max_pages = 0; }
  SECTION("negative delay") { config.page_delay = std::chrono::milliseconds(-5); }

  REQUIRE_THROWS_AS(config.Validate(), std::invalid_argument);
}

TEST_CASE("The cutoff is the retention window before today", "[pipeline_config][retention]") {
  config::PipelineConfig config;
  config.retention_days = 365;
  REQUIRE(config::ComputeCutoff(config, D("2024-01-02")) == D("2023-01-02"));

  config.retention_days = 0;
  REQUIRE(config::ComputeCutoff(config, D("2024-01-02")) == D("2024-01-02"));
}
