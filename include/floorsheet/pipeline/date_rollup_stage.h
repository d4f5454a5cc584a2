#pragma once
#include <floorsheet/pipeline/stage_report.h>
#include <floorsheet/storage/itable_store.h>

#include <filesystem>

namespace floorsheet::pipeline {

struct DateRollupStageOptions {
  std::filesystem::path input;  // raw transaction table
  std::filesystem::path output; // date summary table
  Date cutoff;
};

// Recomputes the broker x stock summary of every trading date present in the
// raw table and upserts them by date into the persisted summary table.
class DateRollupStage {
public:
  DateRollupStage(storage::ITableStore &store, DateRollupStageOptions options)
      : m_store(store), m_options(std::move(options)) {}

  StageReport Run();

private:
  storage::ITableStore &m_store;
  DateRollupStageOptions m_options;
};

} // namespace floorsheet::pipeline
