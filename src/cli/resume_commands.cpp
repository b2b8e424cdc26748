#include "cairn/cli/resume_commands.hpp"

#include "cairn/common/fs.hpp"

#include <charconv>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace cairn::cli {

namespace {

std::vector<std::string> split_words(const std::string &line) {
  std::istringstream stream(line);
  std::vector<std::string> words;
  std::string word;
  while (stream >> word) {
    words.push_back(word);
  }
  return words;
}

std::optional<long long> parse_integer(const std::string &text) {
  long long value = 0;
  const char *first = text.data();
  const char *last = first + text.size();
  auto [ptr, ec] = std::from_chars(first, last, value);
  if (text.empty() || ec != std::errc() || ptr != last) {
    return std::nullopt;
  }
  return value;
}

CommandResult failure(std::string message) {
  return CommandResult{.ok = false, .message = std::move(message), .session = nullptr};
}

CommandResult success(std::string message) {
  return CommandResult{.ok = true, .message = std::move(message), .session = nullptr};
}

std::string list_failure(const sessions::Error &error, const std::string &prefix) {
  if (error.kind == sessions::ErrorKind::PermissionDenied) {
    return "Permission denied: Unable to access sessions directory.";
  }
  return prefix + sessions::log_and_sanitize(error, "list sessions");
}

} // namespace

common::Result<std::string>
resolve_target(const std::string &target, const std::vector<sessions::SnapshotSummary> &sessions) {
  const std::string trimmed = common::trim(target);
  if (const auto index = parse_integer(trimmed); index.has_value()) {
    if (*index > 0 && static_cast<std::size_t>(*index) <= sessions.size()) {
      return common::Result<std::string>::success(
          sessions[static_cast<std::size_t>(*index - 1)].id);
    }
    return common::Result<std::string>::failure("Invalid index: " + std::to_string(*index) +
                                                ". Valid range is 1-" +
                                                std::to_string(sessions.size()) + ".");
  }
  for (const auto &session : sessions) {
    if (session.id == trimmed) {
      return common::Result<std::string>::success(session.id);
    }
  }
  return common::Result<std::string>::failure("Session not found: " + trimmed);
}

std::string format_relative_time(const common::Timestamp then, const common::Timestamp now) {
  const auto diff = std::chrono::duration_cast<std::chrono::seconds>(now - then).count();
  if (diff < 60) {
    return "just now";
  }
  if (diff < 3600) {
    return std::to_string(diff / 60) + " min ago";
  }
  if (diff < 86'400) {
    const auto hours = diff / 3600;
    return std::to_string(hours) + (hours == 1 ? " hour ago" : " hours ago");
  }
  if (diff < 172'800) {
    return "yesterday";
  }
  if (diff < 604'800) {
    return std::to_string(diff / 86'400) + " days ago";
  }

  const auto t = std::chrono::system_clock::to_time_t(then);
  std::tm tm{};
  gmtime_r(&t, &tm);
  std::ostringstream out;
  out << std::put_time(&tm, "%Y-%m-%d");
  return out.str();
}

std::string format_resumable_list(const std::vector<sessions::SnapshotSummary> &sessions,
                                  const common::Timestamp now) {
  if (sessions.empty()) {
    return "No resumable sessions available.";
  }
  std::ostringstream out;
  out << "Resumable sessions:\n\n";
  for (std::size_t i = 0; i < sessions.size(); ++i) {
    if (i > 0) {
      out << "\n";
    }
    const auto &session = sessions[i];
    out << "  " << (i + 1) << ". " << session.name << " (" << session.project_path
        << ") - closed " << format_relative_time(session.closed_at, now);
  }
  out << "\n\nUse /resume <number> to restore a session.";
  return out.str();
}

ResumeCommands::ResumeCommands(sessions::PersistenceEngine &engine,
                               sessions::MaintenanceSweeper &sweeper,
                               const int default_cleanup_days, common::Clock clock)
    : engine_(engine), sweeper_(sweeper), default_cleanup_days_(default_cleanup_days),
      clock_(std::move(clock)) {}

CommandResult ResumeCommands::execute(const std::string &line) {
  const auto words = split_words(line);
  if (words.empty()) {
    return failure("Unknown command.");
  }

  if (words[0] == "/cleanup") {
    if (words.size() == 1) {
      return cleanup(std::nullopt);
    }
    const auto days = parse_integer(words[1]);
    if (!days.has_value() || words.size() > 2 || *days <= 0 || *days > 36'500) {
      return failure("Usage: /cleanup [days] (days must be a positive number)");
    }
    return cleanup(static_cast<int>(*days));
  }

  if (words[0] != "/resume") {
    return failure("Unknown command: " + words[0]);
  }
  if (words.size() == 1) {
    return list();
  }
  if (words[1] == "clear" && words.size() == 2) {
    return clear();
  }
  if (words[1] == "delete") {
    if (words.size() != 3) {
      return failure("Usage: /resume delete <number|id>");
    }
    return remove(words[2]);
  }
  if (words.size() == 2) {
    return restore(words[1]);
  }
  return failure("Usage: /resume [<number|id> | delete <number|id> | clear]");
}

CommandResult ResumeCommands::list() {
  const auto sessions = engine_.list_resumable();
  if (!sessions.ok()) {
    return failure(list_failure(sessions.error(), "Failed to list sessions: "));
  }
  return success(format_resumable_list(sessions.value(), clock_()));
}

CommandResult ResumeCommands::restore(const std::string &target) {
  const auto sessions = engine_.list_resumable();
  if (!sessions.ok()) {
    return failure(list_failure(sessions.error(), "Failed to list sessions: "));
  }
  if (sessions.value().empty()) {
    return failure("No resumable sessions available.");
  }
  const auto resolved = resolve_target(target, sessions.value());
  if (!resolved.ok()) {
    return failure(resolved.error());
  }

  auto resumed = engine_.resume(resolved.value());
  if (resumed.ok()) {
    auto result = success("Resumed session.");
    result.session = resumed.value();
    return result;
  }

  const auto &error = resumed.error();
  switch (error.kind) {
  case sessions::ErrorKind::ProjectPathNotFound:
  case sessions::ErrorKind::ProjectPathNotDirectory:
  case sessions::ErrorKind::ProjectPathChanged:
  case sessions::ErrorKind::ProjectAlreadyOpen:
  case sessions::ErrorKind::SessionLimitReached:
  case sessions::ErrorKind::RateLimited:
    return failure(sessions::sanitize_error(error));
  case sessions::ErrorKind::NotFound:
    return failure("Session file not found.");
  default:
    return failure("Failed to resume session: " +
                   sessions::log_and_sanitize(error, "resume session"));
  }
}

CommandResult ResumeCommands::remove(const std::string &target) {
  const auto sessions = engine_.list_resumable();
  if (!sessions.ok()) {
    return failure(list_failure(sessions.error(), "Failed to list sessions: "));
  }
  if (sessions.value().empty()) {
    return failure("No resumable sessions available.");
  }
  const auto resolved = resolve_target(target, sessions.value());
  if (!resolved.ok()) {
    return failure(resolved.error());
  }
  if (const auto deleted = engine_.delete_snapshot(resolved.value()); !deleted.ok()) {
    return failure("Failed to delete session: " +
                   sessions::log_and_sanitize(deleted.error(), "delete session"));
  }
  return success("Deleted saved session.");
}

CommandResult ResumeCommands::clear() {
  const auto sessions = engine_.list_persisted();
  if (!sessions.ok()) {
    return failure(list_failure(sessions.error(), "Failed to clear sessions: "));
  }
  if (sessions.value().empty()) {
    return success("No saved sessions to clear.");
  }

  std::size_t cleared = 0;
  for (const auto &session : sessions.value()) {
    if (const auto deleted = engine_.delete_snapshot(session.id); deleted.ok()) {
      ++cleared;
    } else {
      static_cast<void>(sessions::log_and_sanitize(deleted.error(), "clear session"));
    }
  }
  return success("Cleared " + std::to_string(cleared) + " saved session(s).");
}

CommandResult ResumeCommands::cleanup(const std::optional<int> max_age_days) {
  const int days = max_age_days.value_or(default_cleanup_days_);
  const auto report = sweeper_.cleanup(days);
  if (!report.ok()) {
    return failure("Cleanup failed: " + sessions::log_and_sanitize(report.error(), "clean up"));
  }

  const auto &r = report.value();
  std::ostringstream out;
  out << "Cleanup complete: " << r.deleted << " deleted, " << r.skipped << " skipped, "
      << r.failed << " failed.";
  return CommandResult{.ok = r.failed == 0, .message = out.str(), .session = nullptr};
}

} // namespace cairn::cli
