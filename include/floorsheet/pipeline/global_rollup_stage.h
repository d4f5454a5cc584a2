#pragma once
#include <floorsheet/pipeline/stage_report.h>
#include <floorsheet/storage/itable_store.h>

#include <filesystem>
#include <optional>

namespace floorsheet::pipeline {

struct GlobalRollupStageOptions {
  std::filesystem::path input;  // date summary table
  std::filesystem::path output; // global summary table
  // Reported only; the date summary table is already retention-filtered.
  std::optional<Date> cutoff;
};

// Folds the whole date summary table into one row per (broker_id, symbol)
// and overwrites the global table with it.
class GlobalRollupStage {
public:
  GlobalRollupStage(storage::ITableStore &store, GlobalRollupStageOptions options)
      : m_store(store), m_options(std::move(options)) {}

  StageReport Run();

private:
  storage::ITableStore &m_store;
  GlobalRollupStageOptions m_options;
};

} // namespace floorsheet::pipeline
