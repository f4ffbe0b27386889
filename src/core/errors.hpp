// core/errors.hpp - Engine error kinds
#pragma once

#include <filesystem>
#include <stdexcept>
#include <string>

namespace fs = std::filesystem;

namespace rip {

enum class ErrorKind {
  None = 0,
  NotFound,
  IoFailure,
  ConflictResolutionExhausted,
  CorruptRecord,
  SpecialFileDeclined,
  PromptDeclined,
};

inline const char *error_kind_name(ErrorKind kind) {
  switch (kind) {
  case ErrorKind::None:
    return "none";
  case ErrorKind::NotFound:
    return "not found";
  case ErrorKind::IoFailure:
    return "i/o failure";
  case ErrorKind::ConflictResolutionExhausted:
    return "conflict resolution exhausted";
  case ErrorKind::CorruptRecord:
    return "corrupt record";
  case ErrorKind::SpecialFileDeclined:
    return "special file declined";
  case ErrorKind::PromptDeclined:
    return "declined";
  }
  return "unknown";
}

// Carries the path and the phase ("rename", "copy", "append record", ...)
// that failed. what() reads "<phase> <path>: <detail>".
class RipError : public std::runtime_error {
public:
  RipError(ErrorKind kind, const fs::path &path, const std::string &phase,
           const std::string &detail)
      : std::runtime_error(phase + " " + path.string() + ": " + detail),
        kind_(kind), path_(path), phase_(phase) {}

  ErrorKind kind() const { return kind_; }
  const fs::path &path() const { return path_; }
  const std::string &phase() const { return phase_; }

  // Fatal errors abort the whole operation instead of a single target
  bool is_fatal() const { return kind_ == ErrorKind::CorruptRecord; }

private:
  ErrorKind kind_;
  fs::path path_;
  std::string phase_;
};

// Failure to open or write the record log; always aborts the operation
class RecordLogError : public RipError {
public:
  using RipError::RipError;
};

} // namespace rip
