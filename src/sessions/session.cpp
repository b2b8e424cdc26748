#include "cairn/sessions/session.hpp"

#include "cairn/common/fs.hpp"

#include <openssl/rand.h>

#include <array>
#include <cmath>
#include <filesystem>
#include <iomanip>
#include <random>
#include <sstream>

namespace cairn::sessions {

namespace {

bool is_continuation_byte(const char ch) {
  return (static_cast<unsigned char>(ch) & 0xC0) == 0x80;
}

std::size_t count_chars(const std::string &text) {
  std::size_t count = 0;
  for (const char ch : text) {
    if (!is_continuation_byte(ch)) {
      ++count;
    }
  }
  return count;
}

std::string truncate_chars(const std::string &text, const std::size_t max_chars) {
  std::size_t chars = 0;
  for (std::size_t i = 0; i < text.size(); ++i) {
    if (!is_continuation_byte(text[i])) {
      if (chars == max_chars) {
        return text.substr(0, i);
      }
      ++chars;
    }
  }
  return text;
}

} // namespace

std::string generate_session_id() {
  std::array<unsigned char, 16> bytes{};
  if (RAND_bytes(bytes.data(), static_cast<int>(bytes.size())) != 1) {
    // Unseeded CSPRNG.
    std::random_device device;
    for (auto &byte : bytes) {
      byte = static_cast<unsigned char>(device());
    }
  }
  bytes[6] = static_cast<unsigned char>((bytes[6] & 0x0F) | 0x40);
  bytes[8] = static_cast<unsigned char>((bytes[8] & 0x3F) | 0x80);

  std::ostringstream out;
  out << std::hex << std::setfill('0');
  for (std::size_t i = 0; i < bytes.size(); ++i) {
    if (i == 4 || i == 6 || i == 8 || i == 10) {
      out << '-';
    }
    out << std::setw(2) << static_cast<int>(bytes[i]);
  }
  return out.str();
}

Status validate_session_name(const std::string &name) {
  const std::size_t chars = count_chars(name);
  if (chars == 0 || chars > MAX_SESSION_NAME_CHARS) {
    return Status::failure(ErrorKind::InvalidName);
  }
  for (const char ch : name) {
    const auto byte = static_cast<unsigned char>(ch);
    if (byte < 0x20 || byte == 0x7F) {
      return Status::failure(ErrorKind::InvalidName);
    }
  }
  return Status::success();
}

Status validate_session_config(const SessionConfig &config) {
  if (common::trim(config.provider).empty() || common::trim(config.model).empty()) {
    return Status::failure(ErrorKind::InvalidConfig);
  }
  if (!std::isfinite(config.temperature) || config.temperature < 0.0 ||
      config.temperature > 2.0) {
    return Status::failure(ErrorKind::InvalidConfig);
  }
  if (config.max_tokens == 0) {
    return Status::failure(ErrorKind::InvalidConfig);
  }
  return Status::success();
}

Result<std::string> validate_project_path(const std::string &path) {
  const std::filesystem::path candidate(path);
  if (path.empty() || !candidate.is_absolute()) {
    return Result<std::string>::failure(ErrorKind::PathNotAbsolute);
  }
  if (common::has_parent_traversal(candidate)) {
    return Result<std::string>::failure(ErrorKind::PathTraversal);
  }

  std::error_code ec;
  const auto status = std::filesystem::status(candidate, ec);
  if (ec || !std::filesystem::exists(status)) {
    if (ec && ec != std::errc::no_such_file_or_directory) {
      return Result<std::string>::failure(from_error_code(ec));
    }
    return Result<std::string>::failure(ErrorKind::PathNotFound);
  }
  if (!std::filesystem::is_directory(status)) {
    return Result<std::string>::failure(ErrorKind::PathNotDirectory);
  }

  const auto resolved = std::filesystem::canonical(candidate, ec);
  if (ec) {
    return Result<std::string>::failure(from_error_code(ec));
  }
  return Result<std::string>::success(resolved.string());
}

Result<Session> make_session(const std::string &name, const std::string &project_path,
                             const SessionConfig &config, const common::Clock &clock) {
  const auto path = validate_project_path(project_path);
  if (!path.ok()) {
    return Result<Session>::failure(path.error());
  }

  std::string effective_name = common::trim(name);
  if (effective_name.empty()) {
    effective_name =
        truncate_chars(std::filesystem::path(path.value()).filename().string(),
                       MAX_SESSION_NAME_CHARS);
  }
  if (const auto status = validate_session_name(effective_name); !status.ok()) {
    return Result<Session>::failure(status.error());
  }
  if (const auto status = validate_session_config(config); !status.ok()) {
    return Result<Session>::failure(status.error());
  }

  const auto now = clock();
  Session session;
  session.id = generate_session_id();
  session.name = std::move(effective_name);
  session.project_path = path.value();
  session.config = config;
  session.created_at = now;
  session.updated_at = now;
  return Result<Session>::success(std::move(session));
}

} // namespace cairn::sessions
