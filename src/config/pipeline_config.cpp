#include <floorsheet/config/pipeline_config.h>

#include <format>
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace floorsheet::config {

void PipelineConfig::Validate() const {
  if (retention_days < 0) {
    throw std::invalid_argument(
        std::format("retention_days must be non-negative, got {}", retention_days));
  }
  if (page_size == 0) {
    throw std::invalid_argument("page_size must be positive");
  }
  if (max_pages && *max_pages <= 0) {
    throw std::invalid_argument(std::format("max_pages must be positive, got {}", *max_pages));
  }
  if (page_delay.count() < 0) {
    throw std::invalid_argument("page_delay_ms must be non-negative");
  }
}

PipelineConfig LoadPipelineConfig(std::filesystem::path const &file, PipelineConfig base) {
  if (!std::filesystem::exists(file)) {
    throw std::runtime_error("Config file not found: " + file.string());
  }

  try {
    auto const node = YAML::LoadFile(file.string());
    if (node.IsNull()) {
      SPDLOG_WARN("Config file {} is empty", file.string());
      return base;
    }
    if (!node.IsMap()) {
      throw std::runtime_error("top level must be a map");
    }
    YAML::convert<PipelineConfig>::decode(node, base);
  } catch (YAML::Exception const &exp) {
    throw std::runtime_error(std::format("Invalid config {}: {}", file.string(), exp.what()));
  } catch (std::runtime_error const &exp) {
    throw std::runtime_error(std::format("Invalid config {}: {}", file.string(), exp.what()));
  }

  SPDLOG_DEBUG("Loaded pipeline config from {}", file.string());
  return base;
}

void ApplyEnvironment(PipelineConfig &config, EnvLoader const &env) {
  config.retention_days = env.getInt(env::RETENTION_DAYS, config.retention_days);
  config.log_level = env.get(env::LOG_LEVEL, config.log_level);

  if (auto const dataDir = env.get(env::DATA_DIR); !dataDir.empty()) {
    std::filesystem::path const dir{dataDir};
    config.raw_table = dir / config.raw_table.filename();
    config.date_summary_table = dir / config.date_summary_table.filename();
    config.global_summary_table = dir / config.global_summary_table.filename();
    config.source_dir = dir / config.source_dir.filename();
  }
}

Date ComputeCutoff(PipelineConfig const &config, Date const &today) {
  return RetentionCutoff(today, config.retention_days);
}

} // namespace floorsheet::config

namespace YAML {

namespace {
// Absent keys leave `target` alone; present keys must convert.
template <typename T> void Overlay(Node const &node, char const *key, T &target) {
  if (auto value = node[key]) {
    target = value.as<T>();
  }
}

void OverlayPath(Node const &node, char const *key, std::filesystem::path &target) {
  if (auto value = node[key]) {
    target = value.as<std::string>();
  }
}
} // namespace

bool convert<floorsheet::config::PipelineConfig>::decode(
    Node const &node, floorsheet::config::PipelineConfig &config) {
  Overlay(node, "retention_days", config.retention_days);
  Overlay(node, "log_level", config.log_level);
  if (auto report = node["report"]) {
    config.report = report.as<std::string>();
  }
  if (auto date = node["date"]) {
    auto const text = date.as<std::string>();
    config.target_date = floorsheet::TryParseDate(text);
    if (!config.target_date) {
      throw std::runtime_error("date must be YYYY-MM-DD, not " + text);
    }
  }

  if (auto source = node["source"]) {
    OverlayPath(source, "dir", config.source_dir);
    Overlay(source, "page_size", config.page_size);
    if (auto maxPages = source["max_pages"]) {
      config.max_pages = maxPages.as<int>();
    }
    if (auto delay = source["page_delay_ms"]) {
      config.page_delay = std::chrono::milliseconds(delay.as<int64_t>());
    }
  }

  if (auto tables = node["tables"]) {
    OverlayPath(tables, "raw", config.raw_table);
    OverlayPath(tables, "date_summary", config.date_summary_table);
    OverlayPath(tables, "global_summary", config.global_summary_table);
  }
  return true;
}

} // namespace YAML
