#include "cairn/config/config.hpp"

#include "cairn/common/fs.hpp"
#include "cairn/common/toml.hpp"
#include "cairn/observability/global.hpp"
#include "cairn/observability/observer.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <limits>
#include <sstream>

namespace cairn::config {

namespace {

constexpr const char *CONFIG_FOLDER = ".cairn";
constexpr const char *CONFIG_FILENAME = "config.toml";
constexpr const char *SESSIONS_FOLDER = "sessions";
std::optional<std::filesystem::path> g_config_path_override;

const std::vector<std::string> &known_keys() {
  static const std::vector<std::string> keys = {
      "persistence.sessions_dir",
      "persistence.max_file_bytes",
      "persistence.max_sessions",
      "persistence.auto_cleanup",
      "persistence.cleanup_max_age_days",
      "rate_limits.resume.limit",
      "rate_limits.resume.window_seconds",
      "rate_limits.resume_global.limit",
      "rate_limits.resume_global.window_seconds",
      "sessions.max_live_sessions",
      "sessions.max_messages",
      "signing.salt",
      "signing.kdf_iterations",
      "defaults.provider",
      "defaults.model",
      "defaults.temperature",
      "defaults.max_tokens",
      "log.level",
  };
  return keys;
}

std::optional<std::filesystem::path> resolved_config_path_override() {
  if (g_config_path_override.has_value()) {
    return std::filesystem::path(common::expand_path(g_config_path_override->string()));
  }
  if (const char *env = std::getenv("CAIRN_CONFIG_PATH"); env != nullptr && *env != '\0') {
    return std::filesystem::path(common::expand_path(env));
  }
  return std::nullopt;
}

std::uint32_t get_u32(const common::TomlDocument &doc, const std::string &key,
                      const std::uint32_t fallback) {
  const std::uint64_t value = doc.get_u64(key, fallback);
  if (value > std::numeric_limits<std::uint32_t>::max()) {
    return fallback;
  }
  return static_cast<std::uint32_t>(value);
}

void load_rule(RateLimitRule &rule, const common::TomlDocument &doc, const std::string &prefix) {
  rule.limit = get_u32(doc, prefix + ".limit", rule.limit);
  rule.window_seconds = get_u32(doc, prefix + ".window_seconds", rule.window_seconds);
}

std::string bool_to_toml(const bool value) { return value ? "true" : "false"; }

common::Status validate_rule(const RateLimitRule &rule, const std::string &name) {
  if (rule.limit == 0) {
    return common::Status::error(name + ".limit must be greater than 0");
  }
  if (rule.window_seconds == 0) {
    return common::Status::error(name + ".window_seconds must be greater than 0");
  }
  return common::Status::success();
}

} // namespace

common::Result<std::filesystem::path> config_dir() {
  if (const auto override_path = resolved_config_path_override(); override_path.has_value()) {
    std::error_code ec;
    std::filesystem::path candidate = *override_path;
    if (std::filesystem::is_directory(candidate, ec) || candidate.filename().empty()) {
      return common::ensure_dir(candidate);
    }

    auto parent = candidate.parent_path();
    if (parent.empty()) {
      parent = std::filesystem::current_path(ec);
      if (ec) {
        return common::Result<std::filesystem::path>::failure(
            "unable to resolve current directory");
      }
    }
    return common::ensure_dir(parent);
  }

  const auto home = common::home_dir();
  if (!home.ok()) {
    return common::Result<std::filesystem::path>::failure(home.error());
  }

  return common::ensure_dir(home.value() / CONFIG_FOLDER);
}

common::Result<std::filesystem::path> config_path() {
  if (const auto override_path = resolved_config_path_override(); override_path.has_value()) {
    std::error_code ec;
    if (std::filesystem::is_directory(*override_path, ec) || override_path->filename().empty()) {
      return common::Result<std::filesystem::path>::success(*override_path / CONFIG_FILENAME);
    }
    return common::Result<std::filesystem::path>::success(*override_path);
  }

  const auto cfg_dir = config_dir();
  if (!cfg_dir.ok()) {
    return common::Result<std::filesystem::path>::failure(cfg_dir.error());
  }
  return common::Result<std::filesystem::path>::success(cfg_dir.value() / CONFIG_FILENAME);
}

bool config_exists() {
  const auto path = config_path();
  std::error_code ec;
  return path.ok() && std::filesystem::exists(path.value(), ec);
}

void set_config_path_override(std::optional<std::filesystem::path> path) {
  if (!path.has_value()) {
    g_config_path_override = std::nullopt;
    return;
  }
  g_config_path_override = std::filesystem::path(common::expand_path(path->string()));
}

void clear_config_path_override() { g_config_path_override = std::nullopt; }

std::optional<std::filesystem::path> config_path_override() {
  return resolved_config_path_override();
}

common::Result<std::filesystem::path> sessions_dir(const Config &config) {
  const std::string configured = common::trim(config.persistence.sessions_dir);
  if (!configured.empty()) {
    return common::Result<std::filesystem::path>::success(
        std::filesystem::path(common::expand_path(configured)));
  }
  const auto cfg_dir = config_dir();
  if (!cfg_dir.ok()) {
    return common::Result<std::filesystem::path>::failure(cfg_dir.error());
  }
  return common::Result<std::filesystem::path>::success(cfg_dir.value() / SESSIONS_FOLDER);
}

void apply_env_overrides(Config &config) {
  if (const char *dir = std::getenv("CAIRN_SESSIONS_DIR"); dir != nullptr && *dir) {
    config.persistence.sessions_dir = dir;
  }
  if (const char *level = std::getenv("CAIRN_LOG_LEVEL"); level != nullptr && *level) {
    config.log.level = level;
  }
  if (const char *provider = std::getenv("CAIRN_PROVIDER"); provider != nullptr && *provider) {
    config.defaults.provider = provider;
  }
  if (const char *model = std::getenv("CAIRN_MODEL"); model != nullptr && *model) {
    config.defaults.model = model;
  }
}

common::Result<Config> parse_config(const std::string &toml_text) {
  const auto parsed = common::parse_toml(toml_text);
  if (!parsed.ok()) {
    return common::Result<Config>::failure(parsed.error());
  }
  const auto &doc = parsed.value();

  for (const auto &key : doc.unknown_keys(known_keys())) {
    observability::log_warn("config", "ignoring unknown key '" + key + "'");
  }

  Config config;
  auto &persistence = config.persistence;
  persistence.sessions_dir = doc.get_string("persistence.sessions_dir", persistence.sessions_dir);
  persistence.max_file_bytes =
      doc.get_u64("persistence.max_file_bytes", persistence.max_file_bytes);
  persistence.max_sessions = doc.get_u64("persistence.max_sessions", persistence.max_sessions);
  persistence.auto_cleanup = doc.get_bool("persistence.auto_cleanup", persistence.auto_cleanup);
  persistence.cleanup_max_age_days =
      get_u32(doc, "persistence.cleanup_max_age_days", persistence.cleanup_max_age_days);

  load_rule(config.rate_limits.resume, doc, "rate_limits.resume");
  load_rule(config.rate_limits.resume_global, doc, "rate_limits.resume_global");

  config.sessions.max_live_sessions =
      get_u32(doc, "sessions.max_live_sessions", config.sessions.max_live_sessions);
  config.sessions.max_messages =
      get_u32(doc, "sessions.max_messages", config.sessions.max_messages);

  config.signing.salt = doc.get_string("signing.salt", config.signing.salt);
  config.signing.kdf_iterations =
      get_u32(doc, "signing.kdf_iterations", config.signing.kdf_iterations);

  config.defaults.provider = doc.get_string("defaults.provider", config.defaults.provider);
  config.defaults.model = doc.get_string("defaults.model", config.defaults.model);
  config.defaults.temperature =
      doc.get_double("defaults.temperature", config.defaults.temperature);
  config.defaults.max_tokens =
      get_u32(doc, "defaults.max_tokens", config.defaults.max_tokens);

  config.log.level = doc.get_string("log.level", config.log.level);

  return common::Result<Config>::success(std::move(config));
}

common::Result<Config> load_config() {
  const auto cfg_path_result = config_path();
  if (!cfg_path_result.ok()) {
    return common::Result<Config>::failure(cfg_path_result.error());
  }

  const auto path = cfg_path_result.value();
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    Config config;
    apply_env_overrides(config);
    return common::Result<Config>::success(std::move(config));
  }

  std::ifstream file(path);
  if (!file) {
    return common::Result<Config>::failure("Unable to open config file: " + path.string());
  }

  std::stringstream buffer;
  buffer << file.rdbuf();
  auto parsed = parse_config(buffer.str());
  if (!parsed.ok()) {
    return common::Result<Config>::failure(path.string() + ": " + parsed.error());
  }

  Config config = parsed.value();
  apply_env_overrides(config);
  return common::Result<Config>::success(std::move(config));
}

common::Status save_config(const Config &config) {
  const auto cfg_path_result = config_path();
  if (!cfg_path_result.ok()) {
    return common::Status::error(cfg_path_result.error());
  }

  const std::filesystem::path path = cfg_path_result.value();
  if (!path.parent_path().empty()) {
    std::error_code ensure_ec;
    std::filesystem::create_directories(path.parent_path(), ensure_ec);
    if (ensure_ec) {
      return common::Status::error("Failed to create config directory: " + ensure_ec.message());
    }
  }
  const std::filesystem::path tmp_path = path.string() + ".tmp";

  std::ofstream file(tmp_path, std::ios::trunc);
  if (!file) {
    return common::Status::error("Unable to write temporary config file");
  }

  file << "[persistence]\n";
  if (!config.persistence.sessions_dir.empty()) {
    file << "sessions_dir = " << common::quote_toml_string(config.persistence.sessions_dir)
         << "\n";
  }
  file << "max_file_bytes = " << config.persistence.max_file_bytes << "\n";
  file << "max_sessions = " << config.persistence.max_sessions << "\n";
  file << "auto_cleanup = " << bool_to_toml(config.persistence.auto_cleanup) << "\n";
  file << "cleanup_max_age_days = " << config.persistence.cleanup_max_age_days << "\n";

  file << "\n[rate_limits.resume]\n";
  file << "limit = " << config.rate_limits.resume.limit << "\n";
  file << "window_seconds = " << config.rate_limits.resume.window_seconds << "\n";

  file << "\n[rate_limits.resume_global]\n";
  file << "limit = " << config.rate_limits.resume_global.limit << "\n";
  file << "window_seconds = " << config.rate_limits.resume_global.window_seconds << "\n";

  file << "\n[sessions]\n";
  file << "max_live_sessions = " << config.sessions.max_live_sessions << "\n";
  file << "max_messages = " << config.sessions.max_messages << "\n";

  file << "\n[signing]\n";
  file << "salt = " << common::quote_toml_string(config.signing.salt) << "\n";
  file << "kdf_iterations = " << config.signing.kdf_iterations << "\n";

  file << "\n[defaults]\n";
  file << "provider = " << common::quote_toml_string(config.defaults.provider) << "\n";
  file << "model = " << common::quote_toml_string(config.defaults.model) << "\n";
  file << "temperature = " << config.defaults.temperature << "\n";
  file << "max_tokens = " << config.defaults.max_tokens << "\n";

  file << "\n[log]\n";
  file << "level = " << common::quote_toml_string(config.log.level) << "\n";

  file.close();
  if (!file) {
    return common::Status::error("Failed writing temporary config file");
  }

  std::error_code ec;
  std::filesystem::rename(tmp_path, path, ec);
  if (ec) {
    return common::Status::error("Failed to atomically replace config: " + ec.message());
  }

  return common::Status::success();
}

common::Result<std::vector<std::string>> validate_config(const Config &config) {
  using R = common::Result<std::vector<std::string>>;
  std::vector<std::string> warnings;

  if (config.persistence.max_file_bytes == 0) {
    return R::failure("persistence.max_file_bytes must be greater than 0");
  }
  if (config.persistence.max_sessions == 0) {
    return R::failure("persistence.max_sessions must be greater than 0");
  }
  if (config.persistence.cleanup_max_age_days == 0) {
    return R::failure("persistence.cleanup_max_age_days must be greater than 0");
  }

  if (const auto status = validate_rule(config.rate_limits.resume, "rate_limits.resume");
      !status.ok()) {
    return R::failure(status.error());
  }
  if (const auto status =
          validate_rule(config.rate_limits.resume_global, "rate_limits.resume_global");
      !status.ok()) {
    return R::failure(status.error());
  }
  if (config.rate_limits.resume_global.limit < config.rate_limits.resume.limit) {
    warnings.push_back(
        "rate_limits.resume_global.limit is lower than rate_limits.resume.limit");
  }

  if (config.sessions.max_live_sessions == 0) {
    return R::failure("sessions.max_live_sessions must be greater than 0");
  }
  if (config.sessions.max_messages == 0) {
    return R::failure("sessions.max_messages must be greater than 0");
  }

  if (common::trim(config.signing.salt).empty()) {
    return R::failure("signing.salt must not be empty");
  }
  if (config.signing.kdf_iterations == 0) {
    return R::failure("signing.kdf_iterations must be greater than 0");
  }
  if (config.signing.kdf_iterations < 10'000) {
    warnings.push_back("signing.kdf_iterations below 10000 weakens key derivation");
  }

  if (common::trim(config.defaults.provider).empty()) {
    return R::failure("defaults.provider must not be empty");
  }
  if (common::trim(config.defaults.model).empty()) {
    return R::failure("defaults.model must not be empty");
  }
  if (config.defaults.temperature < 0.0 || config.defaults.temperature > 2.0) {
    return R::failure("defaults.temperature must be between 0.0 and 2.0");
  }
  if (config.defaults.max_tokens == 0) {
    return R::failure("defaults.max_tokens must be greater than 0");
  }

  if (!observability::parse_log_level(config.log.level).has_value()) {
    return R::failure("Invalid log.level: " + config.log.level);
  }

  return R::success(std::move(warnings));
}

} // namespace cairn::config
