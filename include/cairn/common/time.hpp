#pragma once

#include <chrono>
#include <functional>
#include <optional>
#include <string>

namespace cairn::common {

using Timestamp = std::chrono::system_clock::time_point;

/// Injectable time source; components default to system_now().
using Clock = std::function<Timestamp()>;

[[nodiscard]] Timestamp system_now();

/// "YYYY-MM-DDTHH:MM:SS.mmmZ", always UTC with millisecond precision.
[[nodiscard]] std::string format_iso8601(Timestamp at);
[[nodiscard]] std::string now_iso8601();

/// Accepts "YYYY-MM-DDTHH:MM:SS" with an optional fractional part and a "Z" or
/// "+HH:MM"/"-HH:MM" suffix. Anything else yields nullopt.
[[nodiscard]] std::optional<Timestamp> parse_iso8601(const std::string &text);

} // namespace cairn::common
