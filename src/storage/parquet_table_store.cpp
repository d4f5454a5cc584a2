#include <floorsheet/core/errors.h>
#include <floorsheet/storage/parquet_table_store.h>

#include "storage/file_lock.h"
#include <arrow/io/file.h>
#include <arrow/table.h>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <format>
#include <parquet/arrow/reader.h>
#include <parquet/arrow/writer.h>
#include <parquet/exception.h>
#include <parquet/properties.h>
#include <spdlog/spdlog.h>
#include <unistd.h>

namespace floorsheet::storage {

namespace fs = std::filesystem;

namespace {
arrow::Status SyncPath(fs::path const &path, bool directory) {
  int const flags = directory ? (O_RDONLY | O_DIRECTORY) : O_RDONLY;
  int const fd = ::open(path.c_str(), flags | O_CLOEXEC);
  if (fd < 0) {
    return arrow::Status::IOError("cannot open ", path.string(), " for fsync: ",
                                  std::strerror(errno));
  }
  int const rc = ::fsync(fd);
  int const err = errno;
  ::close(fd);
  if (rc != 0) {
    return arrow::Status::IOError("fsync ", path.string(), " failed: ",
                                  std::strerror(err));
  }
  return arrow::Status::OK();
}

fs::path TemporarySibling(fs::path const &path) {
  auto tmp = path;
  tmp += std::format(".tmp-{}", ::getpid());
  return tmp;
}
} // namespace

arrow::Result<std::shared_ptr<arrow::Table>>
ParquetTableStore::ReadParquet(fs::path const &path) {
  ARROW_ASSIGN_OR_RAISE(auto input, arrow::io::ReadableFile::Open(path.string()));
  ARROW_ASSIGN_OR_RAISE(auto reader,
                        parquet::arrow::OpenFile(input, arrow::default_memory_pool()));
  std::shared_ptr<arrow::Table> table;
  ARROW_RETURN_NOT_OK(reader->ReadTable(&table));
  return table;
}

arrow::Status ParquetTableStore::WriteParquet(fs::path const &path,
                                              arrow::Table const &table,
                                              ParquetTableStoreOptions const &options) {
  ARROW_ASSIGN_OR_RAISE(auto output, arrow::io::FileOutputStream::Open(path.string()));

  auto properties =
      parquet::WriterProperties::Builder().compression(options.compression)->build();
  auto arrowProperties = parquet::ArrowWriterProperties::Builder().store_schema()->build();

  ARROW_RETURN_NOT_OK(parquet::arrow::WriteTable(table, arrow::default_memory_pool(),
                                                 output, options.rowGroupSize,
                                                 properties, arrowProperties));
  return output->Close();
}

bool ParquetTableStore::Exists(fs::path const &path) const {
  std::error_code ec;
  return fs::is_regular_file(path, ec);
}

std::shared_ptr<arrow::Table> ParquetTableStore::Read(fs::path const &path) const {
  if (!Exists(path)) {
    throw StorageError(ErrorKind::MissingInput,
                       std::format("Input file not found: {}", path.string()));
  }

  auto result = [&]() -> arrow::Result<std::shared_ptr<arrow::Table>> {
    try {
      return ReadParquet(path);
    } catch (parquet::ParquetException const &exp) {
      return arrow::Status::IOError(exp.what());
    }
  }();
  if (!result.ok()) {
    throw StorageError(ErrorKind::MissingInput,
                       std::format("Error loading {}: {}", path.string(),
                                   result.status().ToString()));
  }

  auto table = result.MoveValueUnsafe();
  SPDLOG_INFO("Loaded {} total records from {}", table->num_rows(), path.string());
  return table;
}

void ParquetTableStore::Write(fs::path const &path,
                              std::shared_ptr<arrow::Table> const &table) {
  if (!table) {
    throw StorageError(ErrorKind::PersistFailure,
                       std::format("refusing to write a null table to {}", path.string()));
  }

  std::error_code ec;
  auto const parent = path.parent_path();
  if (!parent.empty() && !fs::exists(parent, ec)) {
    fs::create_directories(parent, ec);
    if (ec) {
      throw StorageError(ErrorKind::PersistFailure,
                         std::format("cannot create output directory {}: {}",
                                     parent.string(), ec.message()));
    }
    SPDLOG_INFO("Created output directory: {}", parent.string());
  }

  auto const tmp = TemporarySibling(path);
  arrow::Status status;
  try {
    status = WriteParquet(tmp, *table, m_options);
  } catch (parquet::ParquetException const &exp) {
    status = arrow::Status::IOError(exp.what());
  }
  if (status.ok() && m_options.fsync) {
    status = SyncPath(tmp, false);
  }
  if (!status.ok()) {
    fs::remove(tmp, ec);
    throw StorageError(ErrorKind::PersistFailure,
                       std::format("Error saving {}: {}", path.string(), status.ToString()));
  }

  fs::rename(tmp, path, ec);
  if (ec) {
    auto const message = ec.message();
    fs::remove(tmp, ec);
    throw StorageError(ErrorKind::PersistFailure,
                       std::format("Error replacing {}: {}", path.string(), message));
  }

  if (m_options.fsync) {
    auto const dir = parent.empty() ? fs::path{"."} : parent;
    if (auto const dirStatus = SyncPath(dir, true); !dirStatus.ok()) {
      SPDLOG_WARN("Saved {} but could not sync its directory: {}", path.string(),
                  dirStatus.ToString());
    }
  }

  SPDLOG_INFO("Successfully saved {} records to {}", table->num_rows(), path.string());
}

WriterLockPtr ParquetTableStore::AcquireWriterLock(fs::path const &path) {
  auto lockPath = path;
  lockPath += ".lock";
  return FileWriterLock::Acquire(std::move(lockPath));
}

} // namespace floorsheet::storage
