#pragma once
#include <floorsheet/storage/itable_store.h>

#include <filesystem>
#include <memory>

namespace floorsheet::storage {

// Advisory single-writer lock backed by flock(2) on a sidecar file. The lock
// file is left in place on release.
class FileWriterLock final : public WriterLock {
  struct AcquireKey {
    explicit AcquireKey() = default;
  };

public:
  // Throws StorageError(PersistFailure) when another writer holds the lock.
  static std::unique_ptr<FileWriterLock> Acquire(std::filesystem::path lockPath);

  // Only reachable through Acquire.
  FileWriterLock(AcquireKey, int fd, std::filesystem::path path)
      : m_fd(fd), m_path(std::move(path)) {}

  FileWriterLock(FileWriterLock const &) = delete;
  FileWriterLock &operator=(FileWriterLock const &) = delete;

  ~FileWriterLock() override;

  std::filesystem::path const &GetPath() const { return m_path; }

private:
  int m_fd;
  std::filesystem::path m_path;
};

} // namespace floorsheet::storage
