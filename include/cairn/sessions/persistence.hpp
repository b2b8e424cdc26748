#pragma once

#include "cairn/common/time.hpp"
#include "cairn/security/integrity.hpp"
#include "cairn/security/rate_limiter.hpp"
#include "cairn/sessions/errors.hpp"
#include "cairn/sessions/registry.hpp"
#include "cairn/sessions/snapshot_codec.hpp"
#include "cairn/sessions/supervisor.hpp"

#include <sys/types.h>

#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace cairn::sessions {

struct PersistenceOptions {
  std::filesystem::path sessions_dir;
  std::uint64_t max_file_bytes = 10ULL * 1024ULL * 1024ULL;
  std::uint64_t max_sessions = 100;
  // Evict the least-recently-resumed snapshot instead of refusing a save at the cap.
  bool auto_cleanup = false;
  common::Clock clock = common::system_now;
};

struct SnapshotSummary {
  std::string id;
  std::string name;
  std::string project_path;
  common::Timestamp closed_at{};
};

/// A snapshot file found on disk. closed_at is empty when the file could not be
/// decoded or exceeds the size cap.
struct SnapshotFile {
  std::string id;
  std::filesystem::path path;
  std::optional<common::Timestamp> closed_at;
};

enum class ResumeStage {
  Loading,
  PathValidating,
  Rebuilding,
  ProcessStarting,
  StateRestoring,
  Cleanup,
  Active,
  Failed,
};

[[nodiscard]] std::string_view to_string(ResumeStage stage);

/// Identity and permission bits of the project directory, compared across the resume
/// window.
struct CachedPathStat {
  ino_t inode = 0;
  dev_t device = 0;
  uid_t owner = 0;
  gid_t group = 0;
  mode_t mode = 0;

  bool operator==(const CachedPathStat &) const = default;
};

/// stat(2) of a project directory. Fails with ProjectPathNotFound or
/// ProjectPathNotDirectory.
[[nodiscard]] Result<CachedPathStat> stat_project_path(const std::string &path);

class PersistenceEngine {
public:
  using StageHook = std::function<void(ResumeStage stage, const std::string &session_id)>;

  PersistenceEngine(PersistenceOptions options, std::shared_ptr<security::Integrity> integrity,
                    std::shared_ptr<security::RateLimiter> rate_limiter,
                    std::shared_ptr<IProcessSupervisor> supervisor,
                    std::shared_ptr<ISessionRegistry> registry);

  [[nodiscard]] Status ensure_storage_dir();
  [[nodiscard]] Result<std::filesystem::path> snapshot_path(const std::string &id) const;
  [[nodiscard]] const PersistenceOptions &options() const { return options_; }

  /// Writes a signed snapshot atomically with mode 0600.
  [[nodiscard]] Status save(const Session &session, const std::vector<Message> &messages,
                            const std::vector<Todo> &todos);
  /// Snapshots a running session.
  [[nodiscard]] Status save_session(const std::string &id);
  /// save_session, then stop the worker. The worker keeps running when the save fails.
  [[nodiscard]] Status close_session(const std::string &id);
  [[nodiscard]] bool save_in_progress(const std::string &id) const;

  /// Reads, verifies and decodes a snapshot without rate limiting or side effects.
  [[nodiscard]] Result<PersistedRecord> load(const std::string &id);

  /// Restores a snapshot into a freshly started worker and deletes the file. No
  /// worker is left running on failure.
  [[nodiscard]] Result<std::shared_ptr<SessionWorker>> resume(const std::string &id);

  /// Sorted by closed_at, newest first. Undecodable and oversized files are skipped.
  [[nodiscard]] Result<std::vector<SnapshotSummary>> list_persisted();
  /// list_persisted minus sessions whose id or project path is live.
  [[nodiscard]] Result<std::vector<SnapshotSummary>> list_resumable();
  [[nodiscard]] Result<std::vector<SnapshotFile>> list_snapshot_files();
  [[nodiscard]] Result<std::size_t> snapshot_count();

  /// Idempotent: a missing file is success.
  [[nodiscard]] Status delete_snapshot(const std::string &id,
                                       const std::string &reason = "deleted");

  /// Called on every resume stage transition, before the stage runs.
  void set_stage_hook(StageHook hook);

private:
  struct LoadedRecord {
    std::filesystem::path path;
    PersistedRecord record;
  };

  [[nodiscard]] Status enforce_population_cap();
  [[nodiscard]] Status evict_least_recently_resumed();
  [[nodiscard]] Status write_atomic(const std::filesystem::path &destination,
                                    const std::string &bytes);
  [[nodiscard]] Result<PersistedRecord> read_record(const std::filesystem::path &path,
                                                    bool verify_signature);
  [[nodiscard]] Result<std::vector<LoadedRecord>> load_all_records();
  [[nodiscard]] Status check_rate_limits(const std::string &id);
  void enter_stage(ResumeStage stage, const std::string &id);
  void teardown(const std::string &id);

  PersistenceOptions options_;
  std::shared_ptr<security::Integrity> integrity_;
  std::shared_ptr<security::RateLimiter> rate_limiter_;
  std::shared_ptr<IProcessSupervisor> supervisor_;
  std::shared_ptr<ISessionRegistry> registry_;

  mutable std::mutex save_mutex_;
  std::set<std::string> saving_;
  std::mutex hook_mutex_;
  StageHook stage_hook_;
};

} // namespace cairn::sessions
