#include "cairn/sessions/persistence.hpp"

#include "cairn/common/fs.hpp"
#include "cairn/observability/global.hpp"
#include "cairn/sessions/session.hpp"

#include <openssl/rand.h>

#include <algorithm>
#include <array>
#include <cerrno>
#include <chrono>
#include <system_error>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace cairn::sessions {

namespace {

constexpr const char *SNAPSHOT_EXTENSION = ".json";
constexpr const char *COMPONENT = "persistence";

std::error_code last_errno() {
  return std::error_code(errno != 0 ? errno : EIO, std::generic_category());
}

Result<std::string> random_suffix() {
  static constexpr char kHex[] = "0123456789abcdef";
  std::array<unsigned char, 12> bytes{};
  if (RAND_bytes(bytes.data(), static_cast<int>(bytes.size())) != 1) {
    return Result<std::string>::failure(ErrorKind::IoError);
  }
  std::string out;
  out.reserve(bytes.size() * 2);
  for (const unsigned char byte : bytes) {
    out.push_back(kHex[byte >> 4]);
    out.push_back(kHex[byte & 0x0F]);
  }
  return Result<std::string>::success(std::move(out));
}

/// Snapshot files directly under `dir`, as (id, path). A missing directory is empty.
Result<std::vector<std::pair<std::string, std::filesystem::path>>>
scan_snapshot_dir(const std::filesystem::path &dir) {
  using Entries = std::vector<std::pair<std::string, std::filesystem::path>>;
  Entries entries;

  std::error_code ec;
  if (!std::filesystem::exists(dir, ec)) {
    return Result<Entries>::success(std::move(entries));
  }
  std::filesystem::directory_iterator it(dir, ec);
  if (ec) {
    return Result<Entries>::failure(from_error_code(ec));
  }
  for (const auto &entry : it) {
    const auto &path = entry.path();
    if (path.extension() != SNAPSHOT_EXTENSION) {
      continue;
    }
    const std::string id = path.stem().string();
    if (!is_valid_snapshot_id(id)) {
      continue;
    }
    std::error_code type_ec;
    if (!entry.is_regular_file(type_ec) || entry.is_symlink(type_ec)) {
      continue;
    }
    entries.emplace_back(id, path);
  }
  return Result<Entries>::success(std::move(entries));
}

std::chrono::milliseconds elapsed_since(const std::chrono::steady_clock::time_point start) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() -
                                                               start);
}

} // namespace

std::string_view to_string(const ResumeStage stage) {
  switch (stage) {
  case ResumeStage::Loading:
    return "loading";
  case ResumeStage::PathValidating:
    return "path_validating";
  case ResumeStage::Rebuilding:
    return "rebuilding";
  case ResumeStage::ProcessStarting:
    return "process_starting";
  case ResumeStage::StateRestoring:
    return "state_restoring";
  case ResumeStage::Cleanup:
    return "cleanup";
  case ResumeStage::Active:
    return "active";
  case ResumeStage::Failed:
    return "failed";
  }
  return "failed";
}

Result<CachedPathStat> stat_project_path(const std::string &path) {
  struct stat st {};
  if (::stat(path.c_str(), &st) != 0) {
    const int err = errno;
    if (err == ENOENT || err == ENOTDIR) {
      return Result<CachedPathStat>::failure(ErrorKind::ProjectPathNotFound);
    }
    return Result<CachedPathStat>::failure(
        from_error_code(std::error_code(err, std::generic_category())));
  }
  if (!S_ISDIR(st.st_mode)) {
    return Result<CachedPathStat>::failure(ErrorKind::ProjectPathNotDirectory);
  }
  return Result<CachedPathStat>::success(CachedPathStat{.inode = st.st_ino,
                                                        .device = st.st_dev,
                                                        .owner = st.st_uid,
                                                        .group = st.st_gid,
                                                        .mode = st.st_mode});
}

PersistenceEngine::PersistenceEngine(PersistenceOptions options,
                                     std::shared_ptr<security::Integrity> integrity,
                                     std::shared_ptr<security::RateLimiter> rate_limiter,
                                     std::shared_ptr<IProcessSupervisor> supervisor,
                                     std::shared_ptr<ISessionRegistry> registry)
    : options_(std::move(options)), integrity_(std::move(integrity)),
      rate_limiter_(std::move(rate_limiter)), supervisor_(std::move(supervisor)),
      registry_(std::move(registry)) {
  if (!options_.clock) {
    options_.clock = common::system_now;
  }
}

Status PersistenceEngine::ensure_storage_dir() {
  std::error_code ec;
  std::filesystem::create_directories(options_.sessions_dir, ec);
  if (ec) {
    observability::log_error(COMPONENT, "cannot create sessions directory: " + ec.message());
    return Status::failure(from_error_code(ec));
  }
  std::filesystem::permissions(options_.sessions_dir, std::filesystem::perms::owner_all,
                               std::filesystem::perm_options::replace, ec);
  if (ec) {
    observability::log_warn(COMPONENT, "cannot restrict sessions directory: " + ec.message());
  }
  return Status::success();
}

Result<std::filesystem::path> PersistenceEngine::snapshot_path(const std::string &id) const {
  if (!is_valid_snapshot_id(id)) {
    return Result<std::filesystem::path>::failure(ErrorKind::InvalidSessionId);
  }
  return Result<std::filesystem::path>::success(options_.sessions_dir /
                                                (id + SNAPSHOT_EXTENSION));
}

bool PersistenceEngine::save_in_progress(const std::string &id) const {
  std::lock_guard<std::mutex> lock(save_mutex_);
  return saving_.count(id) != 0;
}

void PersistenceEngine::set_stage_hook(StageHook hook) {
  std::lock_guard<std::mutex> lock(hook_mutex_);
  stage_hook_ = std::move(hook);
}

Status PersistenceEngine::save(const Session &session, const std::vector<Message> &messages,
                               const std::vector<Todo> &todos) {
  const auto started = std::chrono::steady_clock::now();
  const auto path = snapshot_path(session.id);
  if (!path.ok()) {
    return Status::failure(path.error());
  }
  if (const auto dir = ensure_storage_dir(); !dir.ok()) {
    return dir;
  }

  std::error_code exists_ec;
  if (!std::filesystem::exists(path.value(), exists_ec)) {
    if (const auto cap = enforce_population_cap(); !cap.ok()) {
      return cap;
    }
  }

  {
    std::lock_guard<std::mutex> lock(save_mutex_);
    if (!saving_.insert(session.id).second) {
      observability::log_warn(COMPONENT, "save already running for session " + session.id);
      return Status::failure(ErrorKind::SaveInProgress);
    }
  }
  struct SaveGuard {
    PersistenceEngine &engine;
    const std::string &id;
    ~SaveGuard() {
      std::lock_guard<std::mutex> lock(engine.save_mutex_);
      engine.saving_.erase(id);
    }
  } guard{*this, session.id};

  const auto payload = encode(session, messages, todos, options_.clock());
  if (!payload.ok()) {
    return Status::failure(payload.error());
  }
  const auto signature = integrity_->sign(payload.value());
  if (!signature.ok()) {
    observability::log_error(COMPONENT, "signing failed: " + signature.error());
    return Status::failure(ErrorKind::SigningFailed);
  }
  const std::string bytes = seal(payload.value(), signature.value());

  if (const auto written = write_atomic(path.value(), bytes); !written.ok()) {
    return written;
  }

  observability::record_snapshot_saved(session.id, bytes.size(), elapsed_since(started));
  return Status::success();
}

Status PersistenceEngine::write_atomic(const std::filesystem::path &destination,
                                       const std::string &bytes) {
  const auto suffix = random_suffix();
  if (!suffix.ok()) {
    return Status::failure(suffix.error());
  }
  const std::filesystem::path tmp_path =
      destination.parent_path() /
      ("." + destination.filename().string() + "." + suffix.value() + ".tmp");

  const auto fail = [&tmp_path](const ErrorKind kind, const std::string &what) {
    std::error_code ec;
    std::filesystem::remove(tmp_path, ec);
    observability::log_error(COMPONENT, what + ": " + std::string(to_string(kind)));
    return Status::failure(kind);
  };

  const int fd = ::open(tmp_path.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_NOFOLLOW | O_CLOEXEC,
                        0600);
  if (fd < 0) {
    const auto kind = from_error_code(last_errno());
    observability::log_error(COMPONENT,
                             "cannot create temp file: " + std::string(to_string(kind)));
    return Status::failure(kind);
  }

  std::size_t offset = 0;
  while (offset < bytes.size()) {
    const ssize_t n = ::write(fd, bytes.data() + offset, bytes.size() - offset);
    if (n < 0) {
      if (errno == EINTR) {
        continue;
      }
      const auto kind = from_error_code(last_errno());
      ::close(fd);
      return fail(kind, "write failed");
    }
    offset += static_cast<std::size_t>(n);
  }
  if (::fchmod(fd, 0600) != 0) {
    const auto kind = from_error_code(last_errno());
    ::close(fd);
    return fail(kind, "chmod failed");
  }
  if (::fsync(fd) != 0) {
    const auto kind = from_error_code(last_errno());
    ::close(fd);
    return fail(kind, "fsync failed");
  }
  if (::close(fd) != 0) {
    return fail(from_error_code(last_errno()), "close failed");
  }

  struct stat st {};
  if (::lstat(tmp_path.c_str(), &st) != 0) {
    return fail(from_error_code(last_errno()), "lstat failed");
  }
  if (S_ISLNK(st.st_mode) || !S_ISREG(st.st_mode)) {
    return fail(ErrorKind::PermissionDenied, "temp file replaced before rename");
  }

  std::error_code ec;
  std::filesystem::rename(tmp_path, destination, ec);
  if (ec) {
    return fail(from_error_code(ec), "rename failed");
  }
  return Status::success();
}

Status PersistenceEngine::enforce_population_cap() {
  auto count = snapshot_count();
  if (!count.ok()) {
    return Status::failure(count.error());
  }
  observability::record_snapshot_count(count.value(), options_.max_sessions);

  if (count.value() >= options_.max_sessions) {
    if (!options_.auto_cleanup) {
      observability::log_warn(COMPONENT, "snapshot limit reached (" +
                                             std::to_string(count.value()) + "/" +
                                             std::to_string(options_.max_sessions) + ")");
      return Status::failure(ErrorKind::SessionLimitReached);
    }
    std::size_t remaining = count.value();
    while (remaining >= options_.max_sessions) {
      if (const auto evicted = evict_least_recently_resumed(); !evicted.ok()) {
        return evicted;
      }
      --remaining;
    }
    return Status::success();
  }

  if (count.value() * 5 >= options_.max_sessions * 4) {
    observability::log_warn(COMPONENT, "snapshot storage at " +
                                           std::to_string(count.value() * 100 /
                                                          options_.max_sessions) +
                                           "% of capacity");
  }
  return Status::success();
}

Status PersistenceEngine::evict_least_recently_resumed() {
  const auto records = load_all_records();
  if (!records.ok()) {
    return Status::failure(records.error());
  }
  if (records.value().empty()) {
    return Status::failure(ErrorKind::SessionLimitReached);
  }

  const auto sort_key = [](const LoadedRecord &loaded) {
    return std::make_pair(loaded.record.last_resumed_at.value_or(common::Timestamp::min()),
                          loaded.record.closed_at);
  };
  const auto victim = std::min_element(
      records.value().begin(), records.value().end(),
      [&sort_key](const auto &a, const auto &b) { return sort_key(a) < sort_key(b); });

  observability::log_info(COMPONENT, "evicting snapshot " + victim->record.id);
  return delete_snapshot(victim->record.id, "evicted");
}

Result<PersistedRecord> PersistenceEngine::read_record(const std::filesystem::path &path,
                                                       const bool verify_signature) {
  using R = Result<PersistedRecord>;

  const auto raw = common::read_file_capped(path, options_.max_file_bytes);
  if (!raw.ok()) {
    const auto kind = from_error_code(raw.error());
    if (kind == ErrorKind::FileTooLarge) {
      observability::log_warn(COMPONENT, "snapshot exceeds size limit: " + path.filename().string());
    }
    return R::failure(kind);
  }

  const auto envelope = open_envelope(raw.value());
  if (!envelope.ok()) {
    return R::failure(envelope.error());
  }
  if (verify_signature && envelope.value().signature.has_value() &&
      !integrity_->verify(envelope.value().payload, *envelope.value().signature)) {
    return R::failure(ErrorKind::SignatureVerificationFailed);
  }

  auto record = decode(envelope.value().payload);
  if (!record.ok()) {
    return record;
  }
  if (envelope.value().signature.has_value()) {
    record.value().signature = envelope.value().signature;
    return record;
  }
  if (!verify_signature) {
    return record;
  }

  // Not in sealed form: either re-formatted by hand or written before signing existed.
  if (record.value().signature.has_value()) {
    if (!integrity_->verify(canonical_payload(record.value()), *record.value().signature)) {
      return R::failure(ErrorKind::SignatureVerificationFailed);
    }
  } else {
    observability::log_warn(COMPONENT, "loading unsigned legacy snapshot " +
                                           record.value().id +
                                           "; it will be signed on next save");
  }
  return record;
}

Result<PersistedRecord> PersistenceEngine::load(const std::string &id) {
  const auto path = snapshot_path(id);
  if (!path.ok()) {
    return Result<PersistedRecord>::failure(path.error());
  }
  auto record = read_record(path.value(), true);
  if (!record.ok()) {
    if (record.error().kind == ErrorKind::SignatureVerificationFailed) {
      observability::record_integrity_failure(id);
    }
    return record;
  }
  if (record.value().id != id) {
    observability::log_warn(COMPONENT, "snapshot id does not match file name: " + id);
    return Result<PersistedRecord>::failure(ErrorKind::InvalidField);
  }
  return record;
}

Status PersistenceEngine::check_rate_limits(const std::string &id) {
  for (const std::string &scope : {id, std::string(security::RateLimiter::GLOBAL_SCOPE)}) {
    const auto decision = rate_limiter_->check(security::RESUME_OPERATION, scope);
    if (!decision.allowed) {
      observability::record_rate_limited(security::RESUME_OPERATION, scope,
                                         decision.retry_after_seconds);
      return Status::failure(Error(ErrorKind::RateLimited, decision.retry_after_seconds));
    }
  }
  return Status::success();
}

void PersistenceEngine::enter_stage(const ResumeStage stage, const std::string &id) {
  observability::log_debug(COMPONENT,
                           "resume " + id + " -> " + std::string(to_string(stage)));
  StageHook hook;
  {
    std::lock_guard<std::mutex> lock(hook_mutex_);
    hook = stage_hook_;
  }
  if (hook) {
    hook(stage, id);
  }
}

void PersistenceEngine::teardown(const std::string &id) {
  if (const auto stopped = supervisor_->stop(id); !stopped.ok()) {
    observability::log_warn(COMPONENT, "teardown found no worker for " + id);
  }
}

Result<std::shared_ptr<SessionWorker>> PersistenceEngine::resume(const std::string &id) {
  using R = Result<std::shared_ptr<SessionWorker>>;
  const auto started = std::chrono::steady_clock::now();

  const auto failed = [this, &id](const Error &error) {
    enter_stage(ResumeStage::Failed, id);
    observability::log_info(COMPONENT, "resume of " + id + " failed: " +
                                           std::string(to_string(error.kind)));
    return R::failure(error);
  };

  enter_stage(ResumeStage::Loading, id);
  if (!is_valid_snapshot_id(id)) {
    return failed(ErrorKind::InvalidSessionId);
  }
  if (const auto limited = check_rate_limits(id); !limited.ok()) {
    return failed(limited.error());
  }
  const auto record = load(id);
  if (!record.ok()) {
    return failed(record.error());
  }

  enter_stage(ResumeStage::PathValidating, id);
  // Legacy files are unsigned, so the stored path gets the same checks as a new session.
  const auto project_path = validate_project_path(record.value().project_path);
  if (!project_path.ok()) {
    switch (project_path.error().kind) {
    case ErrorKind::PathNotFound:
      return failed(ErrorKind::ProjectPathNotFound);
    case ErrorKind::PathNotDirectory:
      return failed(ErrorKind::ProjectPathNotDirectory);
    default:
      return failed(project_path.error());
    }
  }
  const auto cached_stat = stat_project_path(project_path.value());
  if (!cached_stat.ok()) {
    return failed(cached_stat.error());
  }

  enter_stage(ResumeStage::Rebuilding, id);
  Session session = to_session(record.value());
  session.project_path = project_path.value();
  if (const auto name = validate_session_name(session.name); !name.ok()) {
    return failed(name.error());
  }
  if (const auto config = validate_session_config(session.config); !config.ok()) {
    return failed(config.error());
  }
  const auto now = options_.clock();
  session.updated_at = std::max(now, session.created_at);
  session.last_resumed_at = now;

  enter_stage(ResumeStage::ProcessStarting, id);
  auto worker = supervisor_->start(session);
  if (!worker.ok()) {
    return failed(worker.error());
  }

  enter_stage(ResumeStage::StateRestoring, id);
  const auto current_stat = stat_project_path(session.project_path);
  if (!current_stat.ok() || !(current_stat.value() == cached_stat.value())) {
    observability::log_warn(COMPONENT, "project path changed during resume of " + id);
    teardown(id);
    return failed(ErrorKind::ProjectPathChanged);
  }
  if (const auto appended = worker.value()->append_messages(record.value().conversation);
      !appended.ok()) {
    teardown(id);
    return failed(appended.error());
  }
  if (const auto replaced = worker.value()->replace_todos(record.value().todos);
      !replaced.ok()) {
    teardown(id);
    return failed(replaced.error());
  }

  enter_stage(ResumeStage::Cleanup, id);
  if (const auto deleted = delete_snapshot(id, "resumed"); !deleted.ok()) {
    // The session stays live; the leftover file is listed until someone deletes it.
    observability::record_snapshot_delete_failed(id, "resumed",
                                                 std::string(to_string(deleted.error().kind)));
  }
  rate_limiter_->record(security::RESUME_OPERATION, id);
  rate_limiter_->record(security::RESUME_OPERATION, security::RateLimiter::GLOBAL_SCOPE);

  enter_stage(ResumeStage::Active, id);
  observability::record_snapshot_resumed(id, record.value().conversation.size(),
                                         record.value().todos.size(), elapsed_since(started));
  return worker;
}

Status PersistenceEngine::save_session(const std::string &id) {
  const auto worker = supervisor_->find(id);
  if (worker == nullptr) {
    return Status::failure(ErrorKind::SessionNotFound);
  }
  const auto session = worker->session();
  if (!session.ok()) {
    return Status::failure(session.error());
  }
  const auto messages = worker->get_all_messages();
  if (!messages.ok()) {
    return Status::failure(messages.error());
  }
  const auto todos = worker->get_todos();
  if (!todos.ok()) {
    return Status::failure(todos.error());
  }
  return save(session.value(), messages.value(), todos.value());
}

Status PersistenceEngine::close_session(const std::string &id) {
  if (const auto saved = save_session(id); !saved.ok()) {
    return saved;
  }
  return supervisor_->stop(id);
}

Result<std::vector<PersistenceEngine::LoadedRecord>> PersistenceEngine::load_all_records() {
  using R = Result<std::vector<LoadedRecord>>;
  const auto entries = scan_snapshot_dir(options_.sessions_dir);
  if (!entries.ok()) {
    return R::failure(entries.error());
  }
  std::vector<LoadedRecord> records;
  for (const auto &[id, path] : entries.value()) {
    auto record = read_record(path, false);
    if (!record.ok()) {
      observability::log_debug(COMPONENT, "skipping snapshot " + id + ": " +
                                              std::string(to_string(record.error().kind)));
      continue;
    }
    records.push_back(LoadedRecord{.path = path, .record = std::move(record.value())});
  }
  return R::success(std::move(records));
}

Result<std::vector<SnapshotSummary>> PersistenceEngine::list_persisted() {
  using R = Result<std::vector<SnapshotSummary>>;
  const auto records = load_all_records();
  if (!records.ok()) {
    return R::failure(records.error());
  }
  std::vector<SnapshotSummary> summaries;
  summaries.reserve(records.value().size());
  for (const auto &loaded : records.value()) {
    summaries.push_back(SnapshotSummary{.id = loaded.record.id,
                                        .name = loaded.record.name,
                                        .project_path = loaded.record.project_path,
                                        .closed_at = loaded.record.closed_at});
  }
  std::sort(summaries.begin(), summaries.end(), [](const auto &a, const auto &b) {
    if (a.closed_at != b.closed_at) {
      return a.closed_at > b.closed_at;
    }
    return a.id < b.id;
  });
  return R::success(std::move(summaries));
}

Result<std::vector<SnapshotSummary>> PersistenceEngine::list_resumable() {
  auto persisted = list_persisted();
  if (!persisted.ok()) {
    return persisted;
  }
  const auto live = registry_->list();
  auto &summaries = persisted.value();
  summaries.erase(std::remove_if(summaries.begin(), summaries.end(),
                                 [&live](const SnapshotSummary &summary) {
                                   return std::any_of(
                                       live.begin(), live.end(), [&summary](const auto &l) {
                                         return l.id == summary.id ||
                                                l.project_path == summary.project_path;
                                       });
                                 }),
                  summaries.end());
  return persisted;
}

Result<std::vector<SnapshotFile>> PersistenceEngine::list_snapshot_files() {
  using R = Result<std::vector<SnapshotFile>>;
  const auto entries = scan_snapshot_dir(options_.sessions_dir);
  if (!entries.ok()) {
    return R::failure(entries.error());
  }
  std::vector<SnapshotFile> files;
  files.reserve(entries.value().size());
  for (const auto &[id, path] : entries.value()) {
    SnapshotFile file{.id = id, .path = path, .closed_at = std::nullopt};
    if (const auto record = read_record(path, false); record.ok()) {
      file.closed_at = record.value().closed_at;
    }
    files.push_back(std::move(file));
  }
  return R::success(std::move(files));
}

Result<std::size_t> PersistenceEngine::snapshot_count() {
  const auto entries = scan_snapshot_dir(options_.sessions_dir);
  if (!entries.ok()) {
    return Result<std::size_t>::failure(entries.error());
  }
  return Result<std::size_t>::success(entries.value().size());
}

Status PersistenceEngine::delete_snapshot(const std::string &id, const std::string &reason) {
  const auto path = snapshot_path(id);
  if (!path.ok()) {
    return Status::failure(path.error());
  }
  std::error_code ec;
  const bool removed = std::filesystem::remove(path.value(), ec);
  if (ec) {
    observability::log_error(COMPONENT, "cannot delete snapshot " + id + ": " + ec.message());
    return Status::failure(from_error_code(ec));
  }
  if (removed) {
    observability::record_snapshot_deleted(id, reason);
  }
  return Status::success();
}

} // namespace cairn::sessions
