//
// Settings shared by every subcommand. Layers, later wins: built-in
// defaults, YAML file, environment (.env.local), command line.
//

#pragma once
#include <floorsheet/common/env_loader.h>
#include <floorsheet/core/constants.h>
#include <floorsheet/core/date.h>

#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <yaml-cpp/yaml.h>

namespace floorsheet::config {

namespace env {
constexpr auto RETENTION_DAYS = "FLOORSHEET_RETENTION_DAYS";
constexpr auto LOG_LEVEL = "FLOORSHEET_LOG_LEVEL";
constexpr auto DATA_DIR = "FLOORSHEET_DATA_DIR";
} // namespace env

struct PipelineConfig {
  std::filesystem::path raw_table{defaults::RAW_TABLE};
  std::filesystem::path date_summary_table{defaults::DATE_SUMMARY_TABLE};
  std::filesystem::path global_summary_table{defaults::GLOBAL_SUMMARY_TABLE};
  std::filesystem::path source_dir{defaults::SOURCE_DIR};

  int retention_days{defaults::RETENTION_DAYS};
  size_t page_size{defaults::PAGE_SIZE};
  std::optional<int> max_pages;
  std::chrono::milliseconds page_delay{0};
  std::optional<Date> target_date;

  std::string log_level{defaults::LOG_LEVEL};
  std::optional<std::filesystem::path> report;

  // Throws std::invalid_argument on out-of-range values.
  void Validate() const;
};

// Overlays the settings present in `file` on `base`. Throws
// std::runtime_error when the file cannot be parsed.
PipelineConfig LoadPipelineConfig(std::filesystem::path const &file,
                                  PipelineConfig base = {});

// FLOORSHEET_DATA_DIR moves every table and the source directory under the
// given directory, keeping their file names.
void ApplyEnvironment(PipelineConfig &config, EnvLoader const &env);

// today - retention_days, computed once per invocation.
Date ComputeCutoff(PipelineConfig const &config, Date const &today);

} // namespace floorsheet::config

namespace YAML {
template <> struct convert<floorsheet::config::PipelineConfig> {
  static bool decode(Node const &node, floorsheet::config::PipelineConfig &config);
};
} // namespace YAML
