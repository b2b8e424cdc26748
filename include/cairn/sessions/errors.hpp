#pragma once

#include "cairn/common/result.hpp"

#include <cstdint>
#include <string>
#include <string_view>
#include <system_error>

namespace cairn::sessions {

enum class ErrorKind {
  // validation
  InvalidName,
  PathNotAbsolute,
  PathTraversal,
  PathNotFound,
  PathNotDirectory,
  InvalidConfig,
  InvalidSessionId,
  InvalidArgument,
  InvalidMessage,
  // snapshot format
  DecodeError,
  MissingFields,
  InvalidField,
  UnsupportedVersion,
  InvalidVersion,
  UnknownRole,
  InvalidTimestamp,
  UnknownStatus,
  // integrity
  SignatureVerificationFailed,
  SigningFailed,
  // project path
  ProjectPathNotFound,
  ProjectPathNotDirectory,
  ProjectPathChanged,
  // capacity
  RateLimited,
  SessionLimitReached,
  SessionExists,
  ProjectAlreadyOpen,
  SaveInProgress,
  FileTooLarge,
  // live sessions
  SessionNotFound,
  WorkerStopped,
  // I/O
  NotFound,
  PermissionDenied,
  NoSpace,
  ReadOnly,
  IoError,
};

/// Failure value for every sessions operation. Only RateLimited carries
/// retry_after_seconds. The default value is what a successful Result reports.
struct Error {
  Error() = default;
  Error(ErrorKind k) : kind(k) {} // NOLINT(google-explicit-constructor)
  Error(ErrorKind k, std::uint64_t retry_after) : kind(k), retry_after_seconds(retry_after) {}

  ErrorKind kind = ErrorKind::IoError;
  std::uint64_t retry_after_seconds = 0;

  bool operator==(const Error &other) const { return kind == other.kind; }
  bool operator==(ErrorKind other) const { return kind == other; }
};

template <typename T> using Result = common::Result<T, Error>;
using Status = common::Result<void, Error>;

/// snake_case identifier, e.g. "project_path_changed".
[[nodiscard]] std::string_view to_string(ErrorKind kind);

/// Maps an errno-style code from the filesystem layer onto the I/O kinds.
[[nodiscard]] ErrorKind from_error_code(const std::error_code &ec);

/// Fixed user-facing text. Never contains paths, ids or field values.
[[nodiscard]] std::string sanitize_error(const Error &error);

/// Logs `context` with the internal kind at WARN, then returns sanitize_error(error).
[[nodiscard]] std::string log_and_sanitize(const Error &error, const std::string &context);

} // namespace cairn::sessions
