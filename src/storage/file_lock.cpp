#include "storage/file_lock.h"
#include <floorsheet/core/errors.h>

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <format>
#include <memory>
#include <spdlog/spdlog.h>
#include <sys/file.h>
#include <unistd.h>

namespace floorsheet::storage {

std::unique_ptr<FileWriterLock>
FileWriterLock::Acquire(std::filesystem::path lockPath) {
  if (auto const parent = lockPath.parent_path(); !parent.empty()) {
    std::error_code ec;
    std::filesystem::create_directories(parent, ec);
    if (ec) {
      throw StorageError(ErrorKind::PersistFailure,
                         std::format("cannot create directory {} for lock: {}",
                                     parent.string(), ec.message()));
    }
  }

  int const fd = ::open(lockPath.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
  if (fd < 0) {
    throw StorageError(ErrorKind::PersistFailure,
                       std::format("cannot open lock file {}: {}", lockPath.string(),
                                   std::strerror(errno)));
  }

  if (::flock(fd, LOCK_EX | LOCK_NB) != 0) {
    int const err = errno;
    ::close(fd);
    if (err == EWOULDBLOCK) {
      throw StorageError(ErrorKind::PersistFailure,
                         std::format("another writer holds {}", lockPath.string()));
    }
    throw StorageError(ErrorKind::PersistFailure,
                       std::format("cannot lock {}: {}", lockPath.string(),
                                   std::strerror(err)));
  }

  SPDLOG_DEBUG("Acquired writer lock {}", lockPath.string());
  return std::make_unique<FileWriterLock>(AcquireKey{}, fd, std::move(lockPath));
}

FileWriterLock::~FileWriterLock() {
  if (::flock(m_fd, LOCK_UN) != 0) {
    SPDLOG_WARN("Failed to release writer lock {}: {}", m_path.string(),
                std::strerror(errno));
  }
  ::close(m_fd);
}

} // namespace floorsheet::storage
