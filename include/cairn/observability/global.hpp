#pragma once

#include "cairn/observability/observer.hpp"

#include <memory>

namespace cairn::observability {

void set_global_observer(std::shared_ptr<IObserver> observer);
[[nodiscard]] std::shared_ptr<IObserver> get_global_observer();

void record_event(const ObserverEvent &event);
void record_metric(const ObserverMetric &metric);

void log_debug(const std::string &component, const std::string &message);
void log_info(const std::string &component, const std::string &message);
void log_warn(const std::string &component, const std::string &message);
void log_error(const std::string &component, const std::string &message);

void record_snapshot_saved(const std::string &session_id, std::uint64_t bytes,
                           std::chrono::milliseconds duration);
void record_snapshot_resumed(const std::string &session_id, std::uint64_t messages,
                             std::uint64_t todos, std::chrono::milliseconds duration);
void record_snapshot_deleted(const std::string &session_id, const std::string &reason);
void record_snapshot_delete_failed(const std::string &session_id, const std::string &reason,
                                   const std::string &error);
void record_cleanup(std::uint64_t deleted, std::uint64_t skipped, std::uint64_t failed);
void record_rate_limited(const std::string &operation, const std::string &scope,
                         std::uint64_t retry_after_seconds);
void record_integrity_failure(const std::string &session_id);
void record_snapshot_count(std::uint64_t count, std::uint64_t max);
void record_active_sessions(std::uint64_t count);

} // namespace cairn::observability
