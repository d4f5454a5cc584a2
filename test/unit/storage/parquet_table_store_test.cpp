#include <catch2/catch_all.hpp>
#include <floorsheet/core/errors.h>
#include <floorsheet/storage/parquet_table_store.h>
#include <floorsheet/storage/table_codec.h>

#include "storage/file_lock.h"
#include "unit/common/fixtures.h"
#include <arrow/table.h>
#include <string>
#include <unistd.h>

using namespace floorsheet;
using namespace floorsheet::test;

namespace fs = std::filesystem;

namespace {
std::shared_ptr<arrow::Table> SampleTable(std::string const &txNo) {
  return storage::EncodeTransactions({Trade("2024-01-02", txNo, "NABIL", "B1", "B2", 10, 100)})
      .ValueOrDie();
}

size_t CountEntries(fs::path const &dir) {
  return static_cast<size_t>(std::distance(fs::directory_iterator(dir), fs::directory_iterator{}));
}
} // namespace

TEST_CASE("ParquetTableStore writes and reads back a table", "[parquet_table_store]") {
  TempDir dir;
  storage::ParquetTableStore store;
  auto const path = dir / "nested/raw.parquet";

  REQUIRE_FALSE(store.Exists(path));
  store.Write(path, SampleTable("T1"));
  REQUIRE(store.Exists(path));

  auto const table = store.Read(path);
  REQUIRE(table->num_rows() == 1);
  auto const decoded = storage::DecodeTransactions(table).ValueOrDie();
  REQUIRE(decoded.rows.front().transaction_no == "T1");

  // only the table itself; the temporary sibling was renamed away
  REQUIRE(CountEntries(path.parent_path()) == 1);
}

TEST_CASE("ParquetTableStore replaces the whole table", "[parquet_table_store]") {
  TempDir dir;
  storage::ParquetTableStore store;
  auto const path = dir / "raw.parquet";

  store.Write(path, SampleTable("T1"));
  store.Write(path, SampleTable("T2"));

  auto const decoded = storage::DecodeTransactions(store.Read(path)).ValueOrDie();
  REQUIRE(decoded.rows.size() == 1);
  REQUIRE(decoded.rows.front().transaction_no == "T2");
}

TEST_CASE("Reading a missing table raises MissingInput", "[parquet_table_store]") {
  TempDir dir;
  storage::ParquetTableStore store;

  try {
    (void)store.Read(dir / "absent.parquet");
    FAIL("expected StorageError");
  } catch (StorageError const &error) {
    REQUIRE(error.kind() == ErrorKind::MissingInput);
  }
}

TEST_CASE("Reading a corrupt file raises MissingInput", "[parquet_table_store]") {
  TempDir dir;
  storage::ParquetTableStore store;
  auto const path = dir.WriteFile("broken.parquet", "definitely not parquet");

  REQUIRE_THROWS_AS(store.Read(path), StorageError);
}

TEST_CASE("Only one writer may hold a table lock", "[parquet_table_store][lock]") {
  TempDir dir;
  storage::ParquetTableStore store;
  auto const path = dir / "summary.parquet";

  {
    auto const held = store.AcquireWriterLock(path);
    REQUIRE(held);

    try {
      (void)store.AcquireWriterLock(path);
      FAIL("expected StorageError");
    } catch (StorageError const &error) {
      REQUIRE(error.kind() == ErrorKind::PersistFailure);
    }
  }

  // released on destruction
  REQUIRE_NOTHROW(store.AcquireWriterLock(path));
}

TEST_CASE("FileWriterLock creates its sidecar file and keeps it", "[parquet_table_store][lock]") {
  TempDir dir;
  auto const lockPath = dir / "locks/raw.parquet.lock";

  {
    auto const lock = storage::FileWriterLock::Acquire(lockPath);
    REQUIRE(lock->GetPath() == lockPath);
    REQUIRE(fs::exists(lockPath));
    REQUIRE_THROWS_AS(storage::FileWriterLock::Acquire(lockPath), StorageError);
  }

  REQUIRE(fs::exists(lockPath));
  REQUIRE_NOTHROW(storage::FileWriterLock::Acquire(lockPath));
}

TEST_CASE("Writing under a file path fails with PersistFailure", "[parquet_table_store]") {
  TempDir dir;
  storage::ParquetTableStore store;
  auto const blocker = dir.WriteFile("blocker", "x");

  try {
    store.Write(blocker / "raw.parquet", SampleTable("T1"));
    FAIL("expected StorageError");
  } catch (StorageError const &error) {
    REQUIRE(error.kind() == ErrorKind::PersistFailure);
  }
}

TEST_CASE("A failed write leaves the previous table intact", "[parquet_table_store]") {
  TempDir dir;
  storage::ParquetTableStore store;
  auto const path = dir / "raw.parquet";
  store.Write(path, SampleTable("T1"));

  // a directory squatting on the temporary name makes the next write fail
  auto tmp = path;
  tmp += ".tmp-" + std::to_string(::getpid());
  fs::create_directory(tmp);

  try {
    store.Write(path, SampleTable("T2"));
    FAIL("expected StorageError");
  } catch (StorageError const &error) {
    REQUIRE(error.kind() == ErrorKind::PersistFailure);
  }

  auto const decoded = storage::DecodeTransactions(store.Read(path)).ValueOrDie();
  REQUIRE(decoded.rows.size() == 1);
  REQUIRE(decoded.rows.front().transaction_no == "T1");
  REQUIRE_FALSE(fs::exists(tmp));
  REQUIRE(CountEntries(dir.path()) == 1);
}
