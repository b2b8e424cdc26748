#pragma once

#include "cairn/common/result.hpp"

#include <array>
#include <cstdint>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>

namespace cairn::security {

using SigningKey = std::array<unsigned char, 32>;

struct IntegrityOptions {
  std::string app_salt = "cairn_session_v1";
  std::uint32_t kdf_iterations = 100'000;
  // Directory holding the machine_secret file.
  std::filesystem::path secret_dir;
};

/// HMAC-SHA256 signing of snapshot payloads. The key is derived with PBKDF2 the first
/// time it is needed and cached for the lifetime of the object.
class Integrity {
public:
  explicit Integrity(IntegrityOptions options);

  /// Base64 HMAC-SHA256 of `bytes`.
  [[nodiscard]] common::Result<std::string> sign(const std::string &bytes);

  /// Constant-time comparison against a freshly computed digest. Any failure to
  /// compute the digest counts as a mismatch.
  [[nodiscard]] bool verify(const std::string &bytes, const std::string &digest);

  /// Drops the cached key so the next sign/verify re-derives it. Tests only.
  void invalidate_key_cache();

  [[nodiscard]] std::filesystem::path machine_secret_path() const;

private:
  [[nodiscard]] common::Result<SigningKey> signing_key();
  [[nodiscard]] common::Result<SigningKey> derive_key(const std::string &machine_secret) const;

  IntegrityOptions options_;
  std::mutex key_mutex_;
  std::optional<SigningKey> cached_key_;
};

/// Reads `<dir>/machine_secret`, creating (or regenerating, when shorter than 32
/// characters) a hex-encoded 32-byte random secret with mode 0600.
[[nodiscard]] common::Result<std::string> load_or_create_machine_secret(const std::filesystem::path &dir);

[[nodiscard]] std::string local_hostname();

/// No early exit on length or content.
[[nodiscard]] bool constant_time_equals(const std::string &a, const std::string &b);

[[nodiscard]] std::string base64_encode(const unsigned char *data, std::size_t size);

} // namespace cairn::security
