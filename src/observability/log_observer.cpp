#include "cairn/observability/log_observer.hpp"

#include "cairn/common/fs.hpp"

#include <iostream>
#include <type_traits>

namespace cairn::observability {

std::string_view to_string(const LogLevel level) {
  switch (level) {
  case LogLevel::Debug:
    return "DEBUG";
  case LogLevel::Info:
    return "INFO";
  case LogLevel::Warn:
    return "WARN";
  case LogLevel::Error:
    return "ERROR";
  case LogLevel::Off:
    return "OFF";
  }
  return "INFO";
}

std::optional<LogLevel> parse_log_level(const std::string &text) {
  const std::string v = common::to_lower(common::trim(text));
  if (v == "debug" || v == "trace") {
    return LogLevel::Debug;
  }
  if (v == "info") {
    return LogLevel::Info;
  }
  if (v == "warn" || v == "warning") {
    return LogLevel::Warn;
  }
  if (v == "error") {
    return LogLevel::Error;
  }
  if (v == "off" || v == "none") {
    return LogLevel::Off;
  }
  return std::nullopt;
}

LogObserver::LogObserver(const LogLevel min_level) : LogObserver(min_level, std::cerr) {}

LogObserver::LogObserver(const LogLevel min_level, std::ostream &out)
    : min_level_(min_level), out_(out) {}

void LogObserver::log_line(const LogLevel level, const std::string &message) {
  if (level < min_level_ || min_level_ == LogLevel::Off) {
    return;
  }
  std::lock_guard<std::mutex> lock(mutex_);
  out_ << "[" << to_string(level) << "] " << message << "\n";
}

void LogObserver::record_event(const ObserverEvent &event) {
  std::visit(
      [this](auto &&evt) {
        using T = std::decay_t<decltype(evt)>;
        if constexpr (std::is_same_v<T, LogEvent>) {
          log_line(evt.level, evt.component + ": " + evt.message);
        } else if constexpr (std::is_same_v<T, SnapshotSavedEvent>) {
          log_line(LogLevel::Info, "snapshot.saved id=" + evt.session_id +
                                       " bytes=" + std::to_string(evt.bytes) +
                                       " duration_ms=" + std::to_string(evt.duration.count()));
        } else if constexpr (std::is_same_v<T, SnapshotResumedEvent>) {
          log_line(LogLevel::Info, "snapshot.resumed id=" + evt.session_id +
                                       " messages=" + std::to_string(evt.messages) +
                                       " todos=" + std::to_string(evt.todos) +
                                       " duration_ms=" + std::to_string(evt.duration.count()));
        } else if constexpr (std::is_same_v<T, SnapshotDeletedEvent>) {
          log_line(LogLevel::Info,
                   "snapshot.deleted id=" + evt.session_id + " reason=" + evt.reason);
        } else if constexpr (std::is_same_v<T, SnapshotDeleteFailedEvent>) {
          log_line(LogLevel::Warn, "snapshot.delete_failed id=" + evt.session_id +
                                       " reason=" + evt.reason + " error=" + evt.error);
        } else if constexpr (std::is_same_v<T, CleanupEvent>) {
          log_line(LogLevel::Info, "snapshot.cleanup deleted=" + std::to_string(evt.deleted) +
                                       " skipped=" + std::to_string(evt.skipped) +
                                       " failed=" + std::to_string(evt.failed));
        } else if constexpr (std::is_same_v<T, RateLimitedEvent>) {
          log_line(LogLevel::Warn, "rate_limited operation=" + evt.operation +
                                       " scope=" + evt.scope + " retry_after=" +
                                       std::to_string(evt.retry_after_seconds));
        } else if constexpr (std::is_same_v<T, IntegrityFailureEvent>) {
          log_line(LogLevel::Error, "snapshot.integrity_failure id=" + evt.session_id);
        }
      },
      event);
}

void LogObserver::record_metric(const ObserverMetric &metric) {
  std::visit(
      [this](auto &&m) {
        using T = std::decay_t<decltype(m)>;
        if constexpr (std::is_same_v<T, SnapshotCountMetric>) {
          log_line(LogLevel::Debug, "metric.snapshot_count=" + std::to_string(m.count) + "/" +
                                        std::to_string(m.max));
        } else if constexpr (std::is_same_v<T, ActiveSessionsMetric>) {
          log_line(LogLevel::Debug, "metric.active_sessions=" + std::to_string(m.count));
        }
      },
      metric);
}

void LogObserver::flush() {
  std::lock_guard<std::mutex> lock(mutex_);
  out_.flush();
}

} // namespace cairn::observability
