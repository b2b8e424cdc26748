#pragma once

#include <cstdint>
#include <string>

namespace cairn::config {

struct PersistenceConfig {
  // Empty means "<config_dir>/sessions".
  std::string sessions_dir;
  std::uint64_t max_file_bytes = 10ULL * 1024ULL * 1024ULL;
  std::uint64_t max_sessions = 100;
  bool auto_cleanup = false;
  std::uint32_t cleanup_max_age_days = 30;
};

struct RateLimitRule {
  std::uint32_t limit = 10;
  std::uint32_t window_seconds = 60;
};

struct RateLimitsConfig {
  RateLimitRule resume{.limit = 5, .window_seconds = 60};
  RateLimitRule resume_global{.limit = 20, .window_seconds = 60};
};

struct SessionsConfig {
  std::uint32_t max_live_sessions = 10;
  std::uint32_t max_messages = 1000;
};

struct SigningConfig {
  std::string salt = "cairn_session_v1";
  std::uint32_t kdf_iterations = 100'000;
};

struct DefaultsConfig {
  std::string provider = "anthropic";
  std::string model = "claude-3-5-sonnet-20241022";
  double temperature = 0.7;
  std::uint32_t max_tokens = 4096;
};

struct LogConfig {
  std::string level = "info";
};

struct Config {
  PersistenceConfig persistence;
  RateLimitsConfig rate_limits;
  SessionsConfig sessions;
  SigningConfig signing;
  DefaultsConfig defaults;
  LogConfig log;
};

} // namespace cairn::config
