#pragma once

#include "cairn/common/time.hpp"
#include "cairn/sessions/errors.hpp"
#include "cairn/sessions/persistence.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace cairn::sessions {

struct CleanupFailure {
  std::string id;
  std::string reason;
};

struct CleanupReport {
  std::size_t deleted = 0;
  std::size_t skipped = 0;
  std::size_t failed = 0;
  std::vector<CleanupFailure> errors;
};

/// Deletes snapshots closed at least max_age_days ago. Snapshots that are newer, that
/// cannot be decoded, or whose closed_at lies in the future are skipped; a failed
/// delete is recorded and the sweep continues.
class MaintenanceSweeper {
public:
  explicit MaintenanceSweeper(PersistenceEngine &engine, common::Clock clock = common::system_now);

  [[nodiscard]] Result<CleanupReport> cleanup(int max_age_days);

private:
  PersistenceEngine &engine_;
  common::Clock clock_;
};

} // namespace cairn::sessions
