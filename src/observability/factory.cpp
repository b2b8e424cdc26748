#include "cairn/observability/factory.hpp"

#include "cairn/observability/log_observer.hpp"
#include "cairn/observability/noop_observer.hpp"

namespace cairn::observability {

std::shared_ptr<IObserver> create_observer(const config::Config &config) {
  const auto level = parse_log_level(config.log.level).value_or(LogLevel::Info);
  if (level == LogLevel::Off) {
    return std::make_shared<NoopObserver>();
  }
  return std::make_shared<LogObserver>(level);
}

} // namespace cairn::observability
