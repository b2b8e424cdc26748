#pragma once

#include "cairn/observability/observer.hpp"

#include <mutex>
#include <ostream>

namespace cairn::observability {

/// Writes "[LEVEL] message" lines. Structured events log at INFO (WARN for rate limiting,
/// ERROR for integrity failures); metrics log at DEBUG.
class LogObserver final : public IObserver {
public:
  explicit LogObserver(LogLevel min_level = LogLevel::Info);
  LogObserver(LogLevel min_level, std::ostream &out);

  void record_event(const ObserverEvent &event) override;
  void record_metric(const ObserverMetric &metric) override;
  void flush() override;
  [[nodiscard]] std::string_view name() const override { return "log"; }

private:
  void log_line(LogLevel level, const std::string &message);

  LogLevel min_level_;
  std::ostream &out_;
  std::mutex mutex_;
};

} // namespace cairn::observability
