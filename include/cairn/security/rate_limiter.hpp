#pragma once

#include "cairn/common/time.hpp"

#include <chrono>
#include <cstdint>
#include <deque>
#include <map>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace cairn::security {

inline constexpr const char *RESUME_OPERATION = "resume";

struct RateLimit {
  std::uint32_t limit = 10;
  std::chrono::seconds window{60};
};

struct RateLimitDecision {
  bool allowed = true;
  std::uint64_t retry_after_seconds = 0;
};

/// Sliding-window limiter keyed by (operation, scope). check() never mutates the
/// window; callers record() only after the guarded operation succeeded.
class RateLimiter {
public:
  static constexpr const char *GLOBAL_SCOPE = "__global__";
  static constexpr std::uint32_t DEFAULT_LIMIT = 10;
  static constexpr std::chrono::seconds DEFAULT_WINDOW{60};

  explicit RateLimiter(common::Clock clock = common::system_now);

  void set_limit(const std::string &operation, RateLimit limit);
  void set_global_limit(const std::string &operation, RateLimit limit);
  [[nodiscard]] RateLimit limit_for(const std::string &operation, const std::string &scope) const;

  [[nodiscard]] RateLimitDecision check(const std::string &operation, const std::string &scope);
  void record(const std::string &operation, const std::string &scope);
  void reset(const std::string &operation, const std::string &scope);

  /// Drops keys whose newest attempt has left the window. Returns the number removed.
  /// record() does the same before adding an attempt, so idle keys never accumulate.
  std::size_t cleanup_expired();
  [[nodiscard]] std::vector<std::pair<std::string, std::string>> tracked_keys() const;

private:
  using Key = std::pair<std::string, std::string>;

  [[nodiscard]] RateLimit limit_for_locked(const std::string &operation,
                                           const std::string &scope) const;
  std::size_t drop_expired_locked(common::Timestamp now);

  common::Clock clock_;
  mutable std::mutex mutex_;
  std::map<std::string, RateLimit> limits_;
  std::map<std::string, RateLimit> global_limits_;
  std::map<Key, std::deque<common::Timestamp>> attempts_;
};

} // namespace cairn::security
