#pragma once

#include <stdexcept>
#include <string>
#include <string_view>

namespace floorsheet {

enum class ErrorKind {
  None,
  SourceUnavailable, // source unreachable or returned no page content
  MalformedRecord,   // one record failed to parse, skipped
  MissingInput,      // persisted input absent, unreadable or without a date column
  PersistFailure     // table write could not complete
};

constexpr std::string_view ToString(ErrorKind kind) {
  switch (kind) {
  case ErrorKind::None:
    return "None";
  case ErrorKind::SourceUnavailable:
    return "SourceUnavailable";
  case ErrorKind::MalformedRecord:
    return "MalformedRecord";
  case ErrorKind::MissingInput:
    return "MissingInput";
  case ErrorKind::PersistFailure:
    return "PersistFailure";
  }
  return "Unknown";
}

// Raised by the table store when a read or write cannot complete.
class StorageError : public std::runtime_error {
public:
  StorageError(ErrorKind kind, std::string const &message)
      : std::runtime_error(message), m_kind(kind) {}

  ErrorKind kind() const noexcept { return m_kind; }

private:
  ErrorKind m_kind;
};

} // namespace floorsheet
