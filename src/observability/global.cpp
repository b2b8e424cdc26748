#include "cairn/observability/global.hpp"

#include <mutex>

namespace cairn::observability {

namespace {

std::mutex g_observer_mutex;
std::shared_ptr<IObserver> g_observer;

} // namespace

void set_global_observer(std::shared_ptr<IObserver> observer) {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  g_observer = std::move(observer);
}

std::shared_ptr<IObserver> get_global_observer() {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  return g_observer;
}

void record_event(const ObserverEvent &event) {
  if (auto observer = get_global_observer(); observer != nullptr) {
    observer->record_event(event);
  }
}

void record_metric(const ObserverMetric &metric) {
  if (auto observer = get_global_observer(); observer != nullptr) {
    observer->record_metric(metric);
  }
}

void log_debug(const std::string &component, const std::string &message) {
  record_event(LogEvent{.level = LogLevel::Debug, .component = component, .message = message});
}

void log_info(const std::string &component, const std::string &message) {
  record_event(LogEvent{.level = LogLevel::Info, .component = component, .message = message});
}

void log_warn(const std::string &component, const std::string &message) {
  record_event(LogEvent{.level = LogLevel::Warn, .component = component, .message = message});
}

void log_error(const std::string &component, const std::string &message) {
  record_event(LogEvent{.level = LogLevel::Error, .component = component, .message = message});
}

void record_snapshot_saved(const std::string &session_id, const std::uint64_t bytes,
                           const std::chrono::milliseconds duration) {
  record_event(SnapshotSavedEvent{.session_id = session_id, .bytes = bytes, .duration = duration});
}

void record_snapshot_resumed(const std::string &session_id, const std::uint64_t messages,
                             const std::uint64_t todos, const std::chrono::milliseconds duration) {
  record_event(SnapshotResumedEvent{
      .session_id = session_id, .messages = messages, .todos = todos, .duration = duration});
}

void record_snapshot_deleted(const std::string &session_id, const std::string &reason) {
  record_event(SnapshotDeletedEvent{.session_id = session_id, .reason = reason});
}

void record_snapshot_delete_failed(const std::string &session_id, const std::string &reason,
                                   const std::string &error) {
  record_event(
      SnapshotDeleteFailedEvent{.session_id = session_id, .reason = reason, .error = error});
}

void record_cleanup(const std::uint64_t deleted, const std::uint64_t skipped,
                    const std::uint64_t failed) {
  record_event(CleanupEvent{.deleted = deleted, .skipped = skipped, .failed = failed});
}

void record_rate_limited(const std::string &operation, const std::string &scope,
                         const std::uint64_t retry_after_seconds) {
  record_event(RateLimitedEvent{
      .operation = operation, .scope = scope, .retry_after_seconds = retry_after_seconds});
}

void record_integrity_failure(const std::string &session_id) {
  record_event(IntegrityFailureEvent{.session_id = session_id});
}

void record_snapshot_count(const std::uint64_t count, const std::uint64_t max) {
  record_metric(SnapshotCountMetric{.count = count, .max = max});
}

void record_active_sessions(const std::uint64_t count) {
  record_metric(ActiveSessionsMetric{.count = count});
}

} // namespace cairn::observability
