#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace cairn::observability {

enum class LogLevel { Debug = 0, Info = 1, Warn = 2, Error = 3, Off = 4 };

[[nodiscard]] std::string_view to_string(LogLevel level);
[[nodiscard]] std::optional<LogLevel> parse_log_level(const std::string &text);

struct LogEvent {
  LogLevel level = LogLevel::Info;
  std::string component;
  std::string message;
};

struct SnapshotSavedEvent {
  std::string session_id;
  std::uint64_t bytes = 0;
  std::chrono::milliseconds duration{0};
};

struct SnapshotResumedEvent {
  std::string session_id;
  std::uint64_t messages = 0;
  std::uint64_t todos = 0;
  std::chrono::milliseconds duration{0};
};

struct SnapshotDeletedEvent {
  std::string session_id;
  std::string reason;
};

/// A snapshot that should have been removed is still on disk.
struct SnapshotDeleteFailedEvent {
  std::string session_id;
  std::string reason;
  std::string error;
};

struct CleanupEvent {
  std::uint64_t deleted = 0;
  std::uint64_t skipped = 0;
  std::uint64_t failed = 0;
};

struct RateLimitedEvent {
  std::string operation;
  std::string scope;
  std::uint64_t retry_after_seconds = 0;
};

struct IntegrityFailureEvent {
  std::string session_id;
};

using ObserverEvent =
    std::variant<LogEvent, SnapshotSavedEvent, SnapshotResumedEvent, SnapshotDeletedEvent,
                 SnapshotDeleteFailedEvent, CleanupEvent, RateLimitedEvent,
                 IntegrityFailureEvent>;

struct SnapshotCountMetric {
  std::uint64_t count = 0;
  std::uint64_t max = 0;
};

struct ActiveSessionsMetric {
  std::uint64_t count = 0;
};

using ObserverMetric = std::variant<SnapshotCountMetric, ActiveSessionsMetric>;

class IObserver {
public:
  virtual ~IObserver() = default;

  virtual void record_event(const ObserverEvent &event) = 0;
  virtual void record_metric(const ObserverMetric &metric) = 0;
  virtual void flush() {}
  [[nodiscard]] virtual std::string_view name() const = 0;
};

} // namespace cairn::observability
