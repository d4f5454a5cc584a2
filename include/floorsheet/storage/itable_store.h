#pragma once
#include <arrow/type_fwd.h>
#include <filesystem>
#include <memory>

namespace floorsheet::storage {

// Held for the whole load-transform-persist cycle of a stage. Releasing it
// (destruction) lets the next writer in.
class WriterLock {
public:
  virtual ~WriterLock() = default;
};
using WriterLockPtr = std::unique_ptr<WriterLock>;

// Whole-table persistence. Implementations throw floorsheet::StorageError
// (MissingInput on read, PersistFailure on write or lock).
struct ITableStore {
  virtual ~ITableStore() = default;

  virtual bool Exists(std::filesystem::path const &path) const = 0;

  virtual std::shared_ptr<arrow::Table>
  Read(std::filesystem::path const &path) const = 0;

  // Replaces the table at `path` atomically; the previous table survives a
  // failed write untouched. Parent directories are created as needed.
  virtual void Write(std::filesystem::path const &path,
                     std::shared_ptr<arrow::Table> const &table) = 0;

  virtual WriterLockPtr AcquireWriterLock(std::filesystem::path const &path) = 0;
};
using ITableStorePtr = std::shared_ptr<ITableStore>;

} // namespace floorsheet::storage
