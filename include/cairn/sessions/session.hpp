#pragma once

#include "cairn/common/time.hpp"
#include "cairn/sessions/errors.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace cairn::sessions {

inline constexpr std::size_t MAX_SESSION_NAME_CHARS = 50;

struct SessionConfig {
  std::string provider = "anthropic";
  std::string model = "claude-3-5-sonnet-20241022";
  double temperature = 0.7;
  std::uint32_t max_tokens = 4096;

  bool operator==(const SessionConfig &) const = default;
};

struct Session {
  std::string id;
  std::string name;
  // Absolute, symlink-resolved.
  std::string project_path;
  SessionConfig config;
  common::Timestamp created_at{};
  common::Timestamp updated_at{};
  std::optional<common::Timestamp> last_resumed_at;
};

/// Random RFC 4122 version 4 identifier.
[[nodiscard]] std::string generate_session_id();

[[nodiscard]] Status validate_session_name(const std::string &name);
[[nodiscard]] Status validate_session_config(const SessionConfig &config);

/// Checks absoluteness, ".." segments, existence and type, in that order, and returns
/// the canonical path.
[[nodiscard]] Result<std::string> validate_project_path(const std::string &path);

/// Builds a new session with a fresh id. An empty name falls back to the project
/// folder name.
[[nodiscard]] Result<Session> make_session(const std::string &name,
                                           const std::string &project_path,
                                           const SessionConfig &config = {},
                                           const common::Clock &clock = common::system_now);

} // namespace cairn::sessions
