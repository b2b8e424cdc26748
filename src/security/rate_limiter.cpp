#include "cairn/security/rate_limiter.hpp"

#include <algorithm>
#include <iterator>

namespace cairn::security {

RateLimiter::RateLimiter(common::Clock clock) : clock_(std::move(clock)) {
  limits_[RESUME_OPERATION] = RateLimit{.limit = 5, .window = std::chrono::seconds(60)};
  global_limits_[RESUME_OPERATION] = RateLimit{.limit = 20, .window = std::chrono::seconds(60)};
}

void RateLimiter::set_limit(const std::string &operation, const RateLimit limit) {
  std::lock_guard<std::mutex> lock(mutex_);
  limits_[operation] = limit;
}

void RateLimiter::set_global_limit(const std::string &operation, const RateLimit limit) {
  std::lock_guard<std::mutex> lock(mutex_);
  global_limits_[operation] = limit;
}

RateLimit RateLimiter::limit_for(const std::string &operation, const std::string &scope) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return limit_for_locked(operation, scope);
}

RateLimit RateLimiter::limit_for_locked(const std::string &operation,
                                        const std::string &scope) const {
  if (scope == GLOBAL_SCOPE) {
    if (const auto it = global_limits_.find(operation); it != global_limits_.end()) {
      return it->second;
    }
  }
  if (const auto it = limits_.find(operation); it != limits_.end()) {
    return it->second;
  }
  return RateLimit{.limit = DEFAULT_LIMIT, .window = DEFAULT_WINDOW};
}

RateLimitDecision RateLimiter::check(const std::string &operation, const std::string &scope) {
  const auto now = clock_();
  std::lock_guard<std::mutex> lock(mutex_);
  const RateLimit limit = limit_for_locked(operation, scope);

  const auto it = attempts_.find(Key{operation, scope});
  if (it == attempts_.end()) {
    return RateLimitDecision{};
  }

  const auto cutoff = now - limit.window;
  const auto &window = it->second;
  const auto first_in_window = std::find_if(window.begin(), window.end(),
                                            [cutoff](const auto &t) { return t > cutoff; });
  const auto in_window = static_cast<std::size_t>(std::distance(first_in_window, window.end()));
  if (in_window < limit.limit) {
    return RateLimitDecision{};
  }

  const auto remaining = std::chrono::ceil<std::chrono::seconds>(*first_in_window + limit.window - now);
  const auto retry_after = std::max<std::int64_t>(remaining.count(), 1);
  return RateLimitDecision{.allowed = false,
                           .retry_after_seconds = static_cast<std::uint64_t>(retry_after)};
}

void RateLimiter::record(const std::string &operation, const std::string &scope) {
  const auto now = clock_();
  std::lock_guard<std::mutex> lock(mutex_);
  const RateLimit limit = limit_for_locked(operation, scope);
  drop_expired_locked(now);

  auto &window = attempts_[Key{operation, scope}];
  const auto cutoff = now - limit.window;
  while (!window.empty() && window.front() <= cutoff) {
    window.pop_front();
  }
  window.push_back(now);

  const std::size_t cap = static_cast<std::size_t>(limit.limit) * 2;
  while (window.size() > cap) {
    window.pop_front();
  }
}

void RateLimiter::reset(const std::string &operation, const std::string &scope) {
  std::lock_guard<std::mutex> lock(mutex_);
  attempts_.erase(Key{operation, scope});
}

std::size_t RateLimiter::cleanup_expired() {
  const auto now = clock_();
  std::lock_guard<std::mutex> lock(mutex_);
  return drop_expired_locked(now);
}

std::size_t RateLimiter::drop_expired_locked(const common::Timestamp now) {
  std::size_t removed = 0;
  for (auto it = attempts_.begin(); it != attempts_.end();) {
    const RateLimit limit = limit_for_locked(it->first.first, it->first.second);
    if (it->second.empty() || it->second.back() <= now - limit.window) {
      it = attempts_.erase(it);
      ++removed;
    } else {
      ++it;
    }
  }
  return removed;
}

std::vector<std::pair<std::string, std::string>> RateLimiter::tracked_keys() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<std::pair<std::string, std::string>> keys;
  keys.reserve(attempts_.size());
  for (const auto &[key, window] : attempts_) {
    keys.push_back(key);
  }
  return keys;
}

} // namespace cairn::security
