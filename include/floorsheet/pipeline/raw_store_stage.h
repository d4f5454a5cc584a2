//
// Raw Store: retention + dedup merge of a fetched batch into the persisted
// transaction table.
//

#pragma once
#include <floorsheet/core/types.h>
#include <floorsheet/pipeline/stage_report.h>
#include <floorsheet/source/floorsheet_fetcher.h>
#include <floorsheet/storage/itable_store.h>

#include <filesystem>

namespace floorsheet::pipeline {

struct RawStoreStageOptions {
  std::filesystem::path output;
  Date cutoff;
};

class RawStoreStage {
public:
  RawStoreStage(storage::ITableStore &store, RawStoreStageOptions options)
      : m_store(store), m_options(std::move(options)) {}

  StageReport Run(TransactionList incoming);

  RawStoreStageOptions const &GetOptions() const { return m_options; }

private:
  storage::ITableStore &m_store;
  RawStoreStageOptions m_options;
};

// Fetches one trading day through `fetcher` and stores it. Fails with
// SourceUnavailable when nothing could be fetched.
StageReport RunFetchStage(source::FloorsheetFetcher &fetcher,
                          source::FloorsheetFetcherOptions const &fetchOptions,
                          RawStoreStage &store);

} // namespace floorsheet::pipeline
