#pragma once

#include "cairn/common/result.hpp"
#include "cairn/common/time.hpp"
#include "cairn/sessions/persistence.hpp"
#include "cairn/sessions/sweeper.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace cairn::cli {

struct CommandResult {
  bool ok = true;
  std::string message;
  // Set when a snapshot was restored into a live session.
  std::shared_ptr<sessions::SessionWorker> session;
};

/// Slash-command front end over the persistence engine. Messages are safe to show to
/// the user; details go to the log.
class ResumeCommands {
public:
  ResumeCommands(sessions::PersistenceEngine &engine, sessions::MaintenanceSweeper &sweeper,
                 int default_cleanup_days = 30, common::Clock clock = common::system_now);

  /// Dispatches "/resume", "/resume <n|id>", "/resume delete <n|id>",
  /// "/resume clear" and "/cleanup [days]".
  [[nodiscard]] CommandResult execute(const std::string &line);

  [[nodiscard]] CommandResult list();
  [[nodiscard]] CommandResult restore(const std::string &target);
  [[nodiscard]] CommandResult remove(const std::string &target);
  [[nodiscard]] CommandResult clear();
  [[nodiscard]] CommandResult cleanup(std::optional<int> max_age_days);

private:
  sessions::PersistenceEngine &engine_;
  sessions::MaintenanceSweeper &sweeper_;
  int default_cleanup_days_;
  common::Clock clock_;
};

/// 1-based index into `sessions` or an exact id. The error is a user-facing message.
[[nodiscard]] common::Result<std::string>
resolve_target(const std::string &target, const std::vector<sessions::SnapshotSummary> &sessions);

/// "just now", "5 min ago", "2 hours ago", "yesterday", "3 days ago", or the date.
[[nodiscard]] std::string format_relative_time(common::Timestamp then, common::Timestamp now);

[[nodiscard]] std::string format_resumable_list(const std::vector<sessions::SnapshotSummary> &sessions,
                                                common::Timestamp now);

} // namespace cairn::cli
