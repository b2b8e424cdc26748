#pragma once

#include "cairn/config/schema.hpp"
#include "cairn/observability/observer.hpp"

#include <memory>

namespace cairn::observability {

[[nodiscard]] std::shared_ptr<IObserver> create_observer(const config::Config &config);

} // namespace cairn::observability
