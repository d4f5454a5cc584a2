#pragma once
#include <floorsheet/storage/itable_store.h>

#include <arrow/result.h>
#include <arrow/status.h>
#include <arrow/util/compression.h>

namespace floorsheet::storage {

struct ParquetTableStoreOptions {
  arrow::Compression::type compression = arrow::Compression::UNCOMPRESSED;
  int64_t rowGroupSize = 64 * 1024;
  bool fsync = true;
};

class ParquetTableStore final : public ITableStore {
public:
  explicit ParquetTableStore(ParquetTableStoreOptions options = {})
      : m_options(options) {}

  bool Exists(std::filesystem::path const &path) const override;

  std::shared_ptr<arrow::Table> Read(std::filesystem::path const &path) const override;

  // Writes `<path>.tmp-<pid>` next to the target, flushes it, then renames it
  // over `path`.
  void Write(std::filesystem::path const &path,
             std::shared_ptr<arrow::Table> const &table) override;

  // Exclusive flock(2) on `<path>.lock`; fails instead of waiting.
  WriterLockPtr AcquireWriterLock(std::filesystem::path const &path) override;

  static arrow::Result<std::shared_ptr<arrow::Table>>
  ReadParquet(std::filesystem::path const &path);

  static arrow::Status WriteParquet(std::filesystem::path const &path,
                                    arrow::Table const &table,
                                    ParquetTableStoreOptions const &options);

private:
  ParquetTableStoreOptions m_options;
};

} // namespace floorsheet::storage
