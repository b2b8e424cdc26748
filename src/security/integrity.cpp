#include "cairn/security/integrity.hpp"

#include "cairn/common/fs.hpp"
#include "cairn/observability/global.hpp"

#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <openssl/rand.h>

#include <algorithm>
#include <array>
#include <cerrno>
#include <fstream>
#include <sstream>

#include <fcntl.h>
#include <unistd.h>

namespace cairn::security {

namespace {

constexpr const char *MACHINE_SECRET_FILE = "machine_secret";
constexpr std::size_t MACHINE_SECRET_BYTES = 32;
constexpr std::size_t MIN_SECRET_CHARS = 32;

std::string to_hex(const unsigned char *data, const std::size_t size) {
  static constexpr char kHex[] = "0123456789abcdef";
  std::string out;
  out.reserve(size * 2);
  for (std::size_t i = 0; i < size; ++i) {
    out.push_back(kHex[data[i] >> 4]);
    out.push_back(kHex[data[i] & 0x0F]);
  }
  return out;
}

common::Result<std::string> generate_secret() {
  std::array<unsigned char, MACHINE_SECRET_BYTES> bytes{};
  if (RAND_bytes(bytes.data(), static_cast<int>(bytes.size())) != 1) {
    return common::Result<std::string>::failure("RAND_bytes failed");
  }
  return common::Result<std::string>::success(to_hex(bytes.data(), bytes.size()));
}

// Created 0600 in one step so the secret is never readable under a wider umask.
common::Status write_secret_file(const std::filesystem::path &path, const std::string &secret) {
  const int fd =
      ::open(path.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_NOFOLLOW | O_CLOEXEC, 0600);
  if (fd < 0) {
    return common::Status::error("Failed to create machine secret");
  }
  std::size_t offset = 0;
  while (offset < secret.size()) {
    const ssize_t n = ::write(fd, secret.data() + offset, secret.size() - offset);
    if (n < 0) {
      if (errno == EINTR) {
        continue;
      }
      ::close(fd);
      return common::Status::error("Failed to write machine secret");
    }
    offset += static_cast<std::size_t>(n);
  }
  if (::fsync(fd) != 0) {
    ::close(fd);
    return common::Status::error("Failed to write machine secret");
  }
  if (::close(fd) != 0) {
    return common::Status::error("Failed to write machine secret");
  }
  return common::Status::success();
}

} // namespace

std::string base64_encode(const unsigned char *data, const std::size_t size) {
  const int output_len = 4 * static_cast<int>((size + 2) / 3);
  std::string output(static_cast<std::size_t>(output_len), '\0');
  EVP_EncodeBlock(reinterpret_cast<unsigned char *>(output.data()), data, static_cast<int>(size));
  return output;
}

bool constant_time_equals(const std::string &a, const std::string &b) {
  const std::size_t max_size = std::max(a.size(), b.size());
  unsigned char diff = a.size() == b.size() ? 0 : 1;

  for (std::size_t i = 0; i < max_size; ++i) {
    const unsigned char lhs = i < a.size() ? static_cast<unsigned char>(a[i]) : 0;
    const unsigned char rhs = i < b.size() ? static_cast<unsigned char>(b[i]) : 0;
    diff |= static_cast<unsigned char>(lhs ^ rhs);
  }

  return diff == 0;
}

std::string local_hostname() {
  std::array<char, 256> buffer{};
  if (gethostname(buffer.data(), buffer.size() - 1) != 0) {
    return "localhost";
  }
  return std::string(buffer.data());
}

common::Result<std::string> load_or_create_machine_secret(const std::filesystem::path &dir) {
  const std::filesystem::path path = dir / MACHINE_SECRET_FILE;

  std::error_code ec;
  if (std::filesystem::exists(path, ec)) {
    std::ifstream in(path);
    if (!in) {
      return common::Result<std::string>::failure("Failed to read machine secret");
    }
    std::stringstream buffer;
    buffer << in.rdbuf();
    const std::string existing = common::trim(buffer.str());
    if (existing.size() >= MIN_SECRET_CHARS) {
      return common::Result<std::string>::success(existing);
    }
    observability::log_warn("integrity", "machine secret too short, regenerating");
    std::filesystem::remove(path, ec);
  }

  const auto dir_ok = common::ensure_dir(dir);
  if (!dir_ok.ok()) {
    return common::Result<std::string>::failure(dir_ok.error());
  }

  auto secret = generate_secret();
  if (!secret.ok()) {
    return secret;
  }

  if (const auto written = write_secret_file(path, secret.value()); !written.ok()) {
    return common::Result<std::string>::failure(written.error());
  }

  return secret;
}

Integrity::Integrity(IntegrityOptions options) : options_(std::move(options)) {}

std::filesystem::path Integrity::machine_secret_path() const {
  return options_.secret_dir / MACHINE_SECRET_FILE;
}

common::Result<SigningKey> Integrity::derive_key(const std::string &machine_secret) const {
  const std::string salt = options_.app_salt + machine_secret + local_hostname();
  SigningKey key{};
  if (PKCS5_PBKDF2_HMAC(options_.app_salt.data(), static_cast<int>(options_.app_salt.size()),
                        reinterpret_cast<const unsigned char *>(salt.data()),
                        static_cast<int>(salt.size()), static_cast<int>(options_.kdf_iterations),
                        EVP_sha256(), static_cast<int>(key.size()), key.data()) != 1) {
    return common::Result<SigningKey>::failure("PBKDF2 key derivation failed");
  }
  return common::Result<SigningKey>::success(key);
}

common::Result<SigningKey> Integrity::signing_key() {
  std::lock_guard<std::mutex> lock(key_mutex_);
  if (cached_key_.has_value()) {
    return common::Result<SigningKey>::success(*cached_key_);
  }

  std::string machine_secret;
  if (auto loaded = load_or_create_machine_secret(options_.secret_dir); loaded.ok()) {
    machine_secret = loaded.value();
  } else {
    observability::log_error("integrity",
                             "machine secret unavailable, using hostname fallback: " +
                                 loaded.error());
    machine_secret = "fallback:" + local_hostname();
  }

  auto derived = derive_key(machine_secret);
  if (derived.ok()) {
    cached_key_ = derived.value();
  }
  return derived;
}

void Integrity::invalidate_key_cache() {
  std::lock_guard<std::mutex> lock(key_mutex_);
  cached_key_.reset();
}

common::Result<std::string> Integrity::sign(const std::string &bytes) {
  const auto key = signing_key();
  if (!key.ok()) {
    return common::Result<std::string>::failure(key.error());
  }

  std::array<unsigned char, EVP_MAX_MD_SIZE> digest{};
  unsigned int digest_len = 0;
  if (HMAC(EVP_sha256(), key.value().data(), static_cast<int>(key.value().size()),
           reinterpret_cast<const unsigned char *>(bytes.data()), bytes.size(), digest.data(),
           &digest_len) == nullptr) {
    return common::Result<std::string>::failure("HMAC computation failed");
  }
  return common::Result<std::string>::success(base64_encode(digest.data(), digest_len));
}

bool Integrity::verify(const std::string &bytes, const std::string &digest) {
  const auto expected = sign(bytes);
  if (!expected.ok()) {
    observability::log_error("integrity", "unable to compute digest: " + expected.error());
    return false;
  }
  return constant_time_equals(expected.value(), digest);
}

} // namespace cairn::security
