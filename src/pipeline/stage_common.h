#pragma once
#include <floorsheet/core/errors.h>
#include <floorsheet/pipeline/stage_report.h>
#include <floorsheet/rollup/retention.h>
#include <floorsheet/storage/itable_store.h>
#include <floorsheet/storage/table_codec.h>

#include <arrow/table.h>
#include <optional>
#include <spdlog/spdlog.h>
#include <string>
#include <utility>

namespace floorsheet::pipeline {

// Runs `body` while holding the writer lock of `output`. Storage errors
// raised by the lock, a read or a write end the stage as Failed.
template <typename Body>
StageReport RunLocked(storage::ITableStore &store, std::filesystem::path const &output,
                      StageReport report, Body &&body) {
  try {
    auto const lock = store.AcquireWriterLock(output);
    std::forward<Body>(body)(report);
  } catch (StorageError const &exp) {
    report.Fail(exp.kind(), exp.what());
  }
  return report;
}

// Retention applied to a persisted table on load. `removed` is filled in
// by the load.
struct LoadRetention {
  std::string date_column;
  Date cutoff;
  size_t removed{0};
};

// Drops rows dated before the cutoff from `table`, after bringing legacy
// date columns to date32. A table without the date column is returned whole
// and left for the decoder to reject.
inline arrow::Result<std::shared_ptr<arrow::Table>>
RetainTable(std::shared_ptr<arrow::Table> const &table, LoadRetention &retention) {
  ARROW_ASSIGN_OR_RAISE(auto const normalized,
                        storage::NormalizeDateColumn(table, retention.date_column));
  ARROW_ASSIGN_OR_RAISE(auto retained, rollup::ApplyRetention(normalized, retention.cutoff,
                                                              retention.date_column));
  if (!retained.has_date_column) {
    SPDLOG_WARN("Table has no '{}' column, retention not applied", retention.date_column);
  }
  retention.removed = retained.removed;
  return std::move(retained.kept);
}

template <typename Decoder>
auto DecodeRetained(std::shared_ptr<arrow::Table> const &table, LoadRetention &retention,
                    Decoder &&decode) -> decltype(decode(table)) {
  auto retained = RetainTable(table, retention);
  if (!retained.ok()) {
    return retained.status();
  }
  return decode(retained.MoveValueUnsafe());
}

// Loads and decodes a persisted table that the stage may do without: a
// missing, unreadable or undecodable table is logged and yields nullopt.
// With `retention` set, expired rows are filtered out before decoding.
template <typename Decoder>
auto TryLoadTable(storage::ITableStore const &store, std::filesystem::path const &path,
                  Decoder &&decode, LoadRetention *retention = nullptr)
    -> std::optional<typename decltype(decode(std::shared_ptr<arrow::Table>{}))::ValueType> {
  if (!store.Exists(path)) {
    SPDLOG_INFO("No existing table at {}", path.string());
    return std::nullopt;
  }

  std::shared_ptr<arrow::Table> table;
  try {
    table = store.Read(path);
  } catch (StorageError const &exp) {
    SPDLOG_WARN("Treating {} as empty: {}", path.string(), exp.what());
    return std::nullopt;
  }

  auto decoded = retention ? DecodeRetained(table, *retention, decode) : decode(table);
  if (!decoded.ok()) {
    SPDLOG_WARN("Treating {} as empty: {}", path.string(), decoded.status().ToString());
    return std::nullopt;
  }
  return decoded.MoveValueUnsafe();
}

template <typename Encoded>
void PersistTable(storage::ITableStore &store, std::filesystem::path const &path,
                  Encoded encoded) {
  if (!encoded.ok()) {
    throw StorageError(ErrorKind::PersistFailure,
                       "Error encoding " + path.string() + ": " +
                           encoded.status().ToString());
  }
  store.Write(path, encoded.ValueUnsafe());
}

} // namespace floorsheet::pipeline
