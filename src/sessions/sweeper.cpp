#include "cairn/sessions/sweeper.hpp"

#include "cairn/observability/global.hpp"

#include <chrono>

namespace cairn::sessions {

MaintenanceSweeper::MaintenanceSweeper(PersistenceEngine &engine, common::Clock clock)
    : engine_(engine), clock_(std::move(clock)) {}

Result<CleanupReport> MaintenanceSweeper::cleanup(const int max_age_days) {
  if (max_age_days <= 0) {
    return Result<CleanupReport>::failure(ErrorKind::InvalidArgument);
  }

  const auto files = engine_.list_snapshot_files();
  if (!files.ok()) {
    return Result<CleanupReport>::failure(files.error());
  }

  const auto now = clock_();
  const auto cutoff = now - std::chrono::hours(24) * max_age_days;

  CleanupReport report;
  for (const auto &file : files.value()) {
    if (!file.closed_at.has_value() || *file.closed_at > now || *file.closed_at > cutoff) {
      ++report.skipped;
      continue;
    }
    if (const auto deleted = engine_.delete_snapshot(file.id, "expired"); !deleted.ok()) {
      ++report.failed;
      report.errors.push_back(
          CleanupFailure{.id = file.id, .reason = std::string(to_string(deleted.error().kind))});
      continue;
    }
    ++report.deleted;
  }

  observability::record_cleanup(report.deleted, report.skipped, report.failed);
  return Result<CleanupReport>::success(std::move(report));
}

} // namespace cairn::sessions
