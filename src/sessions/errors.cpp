#include "cairn/sessions/errors.hpp"

#include "cairn/observability/global.hpp"

#include <cerrno>

namespace cairn::sessions {

namespace {

constexpr const char *GENERIC_FAILURE = "Operation failed. Please try again or contact support.";

} // namespace

std::string_view to_string(const ErrorKind kind) {
  switch (kind) {
  case ErrorKind::InvalidName:
    return "invalid_name";
  case ErrorKind::PathNotAbsolute:
    return "path_not_absolute";
  case ErrorKind::PathTraversal:
    return "path_traversal";
  case ErrorKind::PathNotFound:
    return "path_not_found";
  case ErrorKind::PathNotDirectory:
    return "path_not_directory";
  case ErrorKind::InvalidConfig:
    return "invalid_config";
  case ErrorKind::InvalidSessionId:
    return "invalid_session_id";
  case ErrorKind::InvalidArgument:
    return "invalid_argument";
  case ErrorKind::InvalidMessage:
    return "invalid_message";
  case ErrorKind::DecodeError:
    return "decode_error";
  case ErrorKind::MissingFields:
    return "missing_fields";
  case ErrorKind::InvalidField:
    return "invalid_field";
  case ErrorKind::UnsupportedVersion:
    return "unsupported_version";
  case ErrorKind::InvalidVersion:
    return "invalid_version";
  case ErrorKind::UnknownRole:
    return "unknown_role";
  case ErrorKind::InvalidTimestamp:
    return "invalid_timestamp";
  case ErrorKind::UnknownStatus:
    return "unknown_status";
  case ErrorKind::SignatureVerificationFailed:
    return "signature_verification_failed";
  case ErrorKind::SigningFailed:
    return "signing_failed";
  case ErrorKind::ProjectPathNotFound:
    return "project_path_not_found";
  case ErrorKind::ProjectPathNotDirectory:
    return "project_path_not_directory";
  case ErrorKind::ProjectPathChanged:
    return "project_path_changed";
  case ErrorKind::RateLimited:
    return "rate_limited";
  case ErrorKind::SessionLimitReached:
    return "session_limit_reached";
  case ErrorKind::SessionExists:
    return "session_exists";
  case ErrorKind::ProjectAlreadyOpen:
    return "project_already_open";
  case ErrorKind::SaveInProgress:
    return "save_in_progress";
  case ErrorKind::FileTooLarge:
    return "file_too_large";
  case ErrorKind::SessionNotFound:
    return "session_not_found";
  case ErrorKind::WorkerStopped:
    return "worker_stopped";
  case ErrorKind::NotFound:
    return "not_found";
  case ErrorKind::PermissionDenied:
    return "permission_denied";
  case ErrorKind::NoSpace:
    return "no_space";
  case ErrorKind::ReadOnly:
    return "read_only";
  case ErrorKind::IoError:
    return "io_error";
  }
  return "io_error";
}

ErrorKind from_error_code(const std::error_code &ec) {
  if (ec == std::errc::no_such_file_or_directory) {
    return ErrorKind::NotFound;
  }
  if (ec == std::errc::permission_denied || ec == std::errc::operation_not_permitted) {
    return ErrorKind::PermissionDenied;
  }
  if (ec == std::errc::no_space_on_device) {
    return ErrorKind::NoSpace;
  }
  if (ec == std::errc::read_only_file_system) {
    return ErrorKind::ReadOnly;
  }
  if (ec == std::errc::file_too_large) {
    return ErrorKind::FileTooLarge;
  }
  return ErrorKind::IoError;
}

std::string sanitize_error(const Error &error) {
  switch (error.kind) {
  case ErrorKind::NotFound:
  case ErrorKind::SessionNotFound:
    return "Session not found.";
  case ErrorKind::ProjectPathNotFound:
    return "Project path no longer exists.";
  case ErrorKind::ProjectPathNotDirectory:
    return "Project path is not a directory.";
  case ErrorKind::ProjectPathChanged:
    return "Project path properties changed unexpectedly.";
  case ErrorKind::ProjectAlreadyOpen:
    return "Project already open in another session.";
  case ErrorKind::SessionLimitReached:
    return "Maximum sessions reached.";
  case ErrorKind::SessionExists:
    return "Session is already active.";
  case ErrorKind::SaveInProgress:
    return "Save operation already in progress.";
  case ErrorKind::SignatureVerificationFailed:
    return "Data integrity check failed.";
  case ErrorKind::DecodeError:
  case ErrorKind::MissingFields:
  case ErrorKind::InvalidField:
  case ErrorKind::UnknownRole:
  case ErrorKind::InvalidTimestamp:
  case ErrorKind::UnknownStatus:
  case ErrorKind::InvalidMessage:
    return "Data format error.";
  case ErrorKind::UnsupportedVersion:
  case ErrorKind::InvalidVersion:
    return "Unsupported format version.";
  case ErrorKind::FileTooLarge:
    return "Saved session file is too large.";
  case ErrorKind::InvalidSessionId:
    return "Invalid session identifier.";
  case ErrorKind::RateLimited:
    return "Rate limit exceeded. Try again in " + std::to_string(error.retry_after_seconds) +
           " seconds.";
  case ErrorKind::PathNotAbsolute:
    return "Path must be absolute.";
  case ErrorKind::PathTraversal:
    return "Invalid path.";
  case ErrorKind::PathNotFound:
    return "Path does not exist.";
  case ErrorKind::PathNotDirectory:
    return "Path is not a directory.";
  case ErrorKind::PermissionDenied:
    return "Permission denied.";
  case ErrorKind::NoSpace:
    return "Insufficient disk space.";
  case ErrorKind::ReadOnly:
    return "Read-only file system.";
  case ErrorKind::InvalidName:
  case ErrorKind::InvalidConfig:
  case ErrorKind::InvalidArgument:
  case ErrorKind::SigningFailed:
  case ErrorKind::WorkerStopped:
  case ErrorKind::IoError:
    return GENERIC_FAILURE;
  }
  return GENERIC_FAILURE;
}

std::string log_and_sanitize(const Error &error, const std::string &context) {
  observability::log_warn("sessions", "failed to " + context + ": " +
                                          std::string(to_string(error.kind)));
  return sanitize_error(error);
}

} // namespace cairn::sessions
