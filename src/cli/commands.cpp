#include "cairn/cli/commands.hpp"

#include "cairn/common/fs.hpp"
#include "cairn/config/config.hpp"
#include "cairn/observability/factory.hpp"
#include "cairn/observability/global.hpp"
#include "cairn/security/integrity.hpp"
#include "cairn/security/rate_limiter.hpp"
#include "cairn/sessions/session.hpp"

#include <chrono>
#include <exception>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

namespace cairn::cli {

namespace {

std::string version_string() {
#ifdef CAIRN_VERSION
  std::string version = CAIRN_VERSION;
#else
  std::string version = "0.1.0";
#endif
#ifdef CAIRN_GIT_COMMIT
  const std::string commit = CAIRN_GIT_COMMIT;
  if (!commit.empty() && commit != "unknown") {
    version += " (" + commit + ")";
  }
#endif
  return "cairn " + version;
}

std::vector<std::string> collect_args(int argc, char **argv) {
  std::vector<std::string> out;
  out.reserve(static_cast<std::size_t>(argc));
  for (int i = 0; i < argc; ++i) {
    out.emplace_back(argv[i]);
  }
  return out;
}

bool apply_global_options(std::vector<std::string> &args, std::string &error) {
  for (std::size_t i = 0; i < args.size();) {
    if (args[i] == "--config") {
      if (i + 1 >= args.size()) {
        error = "missing value for --config";
        return false;
      }
      config::set_config_path_override(args[i + 1]);
      args.erase(args.begin() + static_cast<long>(i), args.begin() + static_cast<long>(i + 2));
      continue;
    }
    if (common::starts_with(args[i], "--config=")) {
      const auto value = args[i].substr(std::string("--config=").size());
      if (value.empty()) {
        error = "missing value for --config";
        return false;
      }
      config::set_config_path_override(value);
      args.erase(args.begin() + static_cast<long>(i));
      continue;
    }
    ++i;
  }
  return true;
}

std::string join_tokens(const std::vector<std::string> &args, const std::size_t begin = 0) {
  std::ostringstream out;
  for (std::size_t i = begin; i < args.size(); ++i) {
    if (i > begin) {
      out << ' ';
    }
    out << args[i];
  }
  return out.str();
}

sessions::SessionConfig session_defaults(const config::Config &config) {
  sessions::SessionConfig defaults;
  defaults.provider = config.defaults.provider;
  defaults.model = config.defaults.model;
  defaults.temperature = config.defaults.temperature;
  defaults.max_tokens = config.defaults.max_tokens;
  return defaults;
}

// Loads the config, installs the observer, then wires the runtime.
common::Result<std::unique_ptr<Runtime>> load_runtime() {
  auto cfg = config::load_config();
  if (!cfg.ok()) {
    return common::Result<std::unique_ptr<Runtime>>::failure(cfg.error());
  }
  auto warnings = config::validate_config(cfg.value());
  if (!warnings.ok()) {
    return common::Result<std::unique_ptr<Runtime>>::failure(warnings.error());
  }
  observability::set_global_observer(observability::create_observer(cfg.value()));
  for (const auto &warning : warnings.value()) {
    observability::log_warn("config", warning);
  }
  return build_runtime(cfg.value());
}

int print_result(const CommandResult &result) {
  if (result.ok) {
    std::cout << result.message << "\n";
    return 0;
  }
  std::cerr << result.message << "\n";
  return 1;
}

int run_show(Runtime &runtime, const std::vector<std::string> &args) {
  if (args.size() != 1) {
    std::cerr << "usage: cairn show <number|id>\n";
    return 1;
  }
  const auto sessions = runtime.engine->list_persisted();
  if (!sessions.ok()) {
    std::cerr << "Failed to list sessions: "
              << sessions::log_and_sanitize(sessions.error(), "list sessions") << "\n";
    return 1;
  }
  const auto id = resolve_target(args[0], sessions.value());
  if (!id.ok()) {
    std::cerr << id.error() << "\n";
    return 1;
  }
  const auto record = runtime.engine->load(id.value());
  if (!record.ok()) {
    std::cerr << sessions::log_and_sanitize(record.error(), "load session") << "\n";
    return 1;
  }

  const auto &r = record.value();
  std::cout << "id:       " << r.id << "\n";
  std::cout << "name:     " << r.name << "\n";
  std::cout << "project:  " << r.project_path << "\n";
  std::cout << "created:  " << common::format_iso8601(r.created_at) << "\n";
  std::cout << "closed:   " << common::format_iso8601(r.closed_at) << "\n";
  if (r.last_resumed_at.has_value()) {
    std::cout << "resumed:  " << common::format_iso8601(*r.last_resumed_at) << "\n";
  }
  std::cout << "messages: " << r.conversation.size() << "\n";
  std::cout << "todos:    " << r.todos.size() << "\n";
  std::cout << "signed:   " << (r.signature.has_value() ? "yes" : "no (legacy)") << "\n";
  return 0;
}

int run_config(std::vector<std::string> args) {
  const std::string action = args.empty() ? "show" : args[0];

  if (action == "init") {
    if (config::config_exists()) {
      std::cerr << "config already exists\n";
      return 1;
    }
    auto saved = config::save_config(config::Config{});
    if (!saved.ok()) {
      std::cerr << saved.error() << "\n";
      return 1;
    }
    const auto path = config::config_path();
    std::cout << "Wrote " << (path.ok() ? path.value().string() : "config") << "\n";
    return 0;
  }

  auto cfg = config::load_config();
  if (!cfg.ok()) {
    std::cerr << cfg.error() << "\n";
    return 1;
  }

  if (action == "validate") {
    const auto warnings = config::validate_config(cfg.value());
    if (!warnings.ok()) {
      std::cerr << warnings.error() << "\n";
      return 1;
    }
    for (const auto &warning : warnings.value()) {
      std::cout << "warning: " << warning << "\n";
    }
    std::cout << "config ok\n";
    return 0;
  }

  if (action == "show") {
    const auto &c = cfg.value();
    const auto dir = config::sessions_dir(c);
    std::cout << "sessions_dir:         " << (dir.ok() ? dir.value().string() : dir.error())
              << "\n";
    std::cout << "max_sessions:         " << c.persistence.max_sessions << "\n";
    std::cout << "max_file_bytes:       " << c.persistence.max_file_bytes << "\n";
    std::cout << "auto_cleanup:         " << (c.persistence.auto_cleanup ? "true" : "false")
              << "\n";
    std::cout << "cleanup_max_age_days: " << c.persistence.cleanup_max_age_days << "\n";
    std::cout << "resume limit:         " << c.rate_limits.resume.limit << "/"
              << c.rate_limits.resume.window_seconds << "s\n";
    std::cout << "resume global limit:  " << c.rate_limits.resume_global.limit << "/"
              << c.rate_limits.resume_global.window_seconds << "s\n";
    std::cout << "max_live_sessions:    " << c.sessions.max_live_sessions << "\n";
    std::cout << "log level:            " << c.log.level << "\n";
    return 0;
  }

  std::cerr << "unknown config command\n";
  return 1;
}

int run_session_command(const std::string &subcommand, std::vector<std::string> args) {
  auto runtime = load_runtime();
  if (!runtime.ok()) {
    std::cerr << runtime.error() << "\n";
    return 1;
  }
  auto &rt = *runtime.value();

  if (subcommand == "list") {
    return print_result(rt.commands->list());
  }
  if (subcommand == "show") {
    return run_show(rt, args);
  }
  if (subcommand == "delete") {
    if (args.size() != 1) {
      std::cerr << "usage: cairn delete <number|id>\n";
      return 1;
    }
    return print_result(rt.commands->remove(args[0]));
  }
  if (subcommand == "clear") {
    return print_result(rt.commands->clear());
  }
  if (subcommand == "cleanup") {
    return print_result(rt.commands->execute("/cleanup " + join_tokens(args)));
  }
  return run_shell(rt, std::cin, std::cout);
}

} // namespace

Runtime::~Runtime() {
  if (supervisor) {
    supervisor->stop_all();
  }
}

common::Result<std::unique_ptr<Runtime>> build_runtime(const config::Config &config) {
  using R = common::Result<std::unique_ptr<Runtime>>;

  const auto dir = config::sessions_dir(config);
  if (!dir.ok()) {
    return R::failure(dir.error());
  }
  const auto secret_dir = config::config_dir();
  if (!secret_dir.ok()) {
    return R::failure(secret_dir.error());
  }

  auto runtime = std::make_unique<Runtime>();
  runtime->config = config;

  auto integrity = std::make_shared<security::Integrity>(security::IntegrityOptions{
      .app_salt = config.signing.salt,
      .kdf_iterations = config.signing.kdf_iterations,
      .secret_dir = secret_dir.value(),
  });

  auto limiter = std::make_shared<security::RateLimiter>();
  limiter->set_limit(security::RESUME_OPERATION,
                     security::RateLimit{
                         .limit = config.rate_limits.resume.limit,
                         .window = std::chrono::seconds(config.rate_limits.resume.window_seconds),
                     });
  limiter->set_global_limit(
      security::RESUME_OPERATION,
      security::RateLimit{
          .limit = config.rate_limits.resume_global.limit,
          .window = std::chrono::seconds(config.rate_limits.resume_global.window_seconds),
      });

  runtime->registry =
      std::make_shared<sessions::InMemorySessionRegistry>(config.sessions.max_live_sessions);
  runtime->supervisor = std::make_shared<sessions::SessionSupervisor>(
      runtime->registry, sessions::WorkerOptions{.max_messages = config.sessions.max_messages,
                                                 .clock = common::system_now});

  sessions::PersistenceOptions options;
  options.sessions_dir = dir.value();
  options.max_file_bytes = config.persistence.max_file_bytes;
  options.max_sessions = config.persistence.max_sessions;
  options.auto_cleanup = config.persistence.auto_cleanup;

  runtime->engine = std::make_unique<sessions::PersistenceEngine>(
      options, std::move(integrity), std::move(limiter), runtime->supervisor, runtime->registry);
  runtime->sweeper = std::make_unique<sessions::MaintenanceSweeper>(*runtime->engine);
  runtime->commands = std::make_unique<ResumeCommands>(
      *runtime->engine, *runtime->sweeper,
      static_cast<int>(config.persistence.cleanup_max_age_days));
  return R::success(std::move(runtime));
}

int run_shell(Runtime &runtime, std::istream &in, std::ostream &out) {
  std::shared_ptr<sessions::SessionWorker> active;

  const auto close_active = [&]() -> bool {
    if (!active) {
      return true;
    }
    const auto closed = runtime.engine->close_session(active->id());
    if (!closed.ok()) {
      out << "Failed to save session: "
          << sessions::log_and_sanitize(closed.error(), "close session") << "\n";
      return false;
    }
    out << "Session saved.\n";
    active.reset();
    return true;
  };

  std::string line;
  while (std::getline(in, line)) {
    line = common::trim(line);
    if (line.empty()) {
      continue;
    }

    if (line == "/quit" || line == "/exit") {
      return close_active() ? 0 : 1;
    }

    if (line == "/close") {
      if (!active) {
        out << "No active session.\n";
        continue;
      }
      close_active();
      continue;
    }

    if (line == "/new" || common::starts_with(line, "/new ")) {
      if (active) {
        out << "Close the active session first.\n";
        continue;
      }
      std::istringstream words(line.substr(4));
      std::string path;
      words >> path;
      std::string name;
      std::getline(words, name);
      if (path.empty()) {
        out << "usage: /new <project-path> [name]\n";
        continue;
      }
      auto session = sessions::make_session(common::trim(name), path,
                                            session_defaults(runtime.config));
      if (!session.ok()) {
        out << sessions::log_and_sanitize(session.error(), "create session") << "\n";
        continue;
      }
      auto started = runtime.supervisor->start(session.value());
      if (!started.ok()) {
        out << sessions::log_and_sanitize(started.error(), "start session") << "\n";
        continue;
      }
      active = started.value();
      out << "Started session " << active->id() << ".\n";
      continue;
    }

    if (common::starts_with(line, "/resume") || common::starts_with(line, "/cleanup")) {
      if (active && common::starts_with(line, "/resume ") &&
          !common::starts_with(line, "/resume delete") && line != "/resume clear") {
        out << "Close the active session first.\n";
        continue;
      }
      auto result = runtime.commands->execute(line);
      out << result.message << "\n";
      if (result.session) {
        active = result.session;
      }
      continue;
    }

    if (common::starts_with(line, "/")) {
      out << "Unknown command: " << line << "\n";
      continue;
    }

    if (!active) {
      out << "No active session. Use /new or /resume.\n";
      continue;
    }
    sessions::Message message;
    message.id = sessions::generate_session_id();
    message.role = sessions::Role::User;
    message.content = line;
    message.timestamp = common::system_now();
    if (const auto appended = active->append_message(std::move(message)); !appended.ok()) {
      out << sessions::log_and_sanitize(appended.error(), "append message") << "\n";
    }
  }

  return close_active() ? 0 : 1;
}

void print_help() {
  std::cout << version_string() << "\n\n";
  std::cout << "USAGE\n";
  std::cout << "  cairn [--config PATH] <command> [options]\n\n";
  std::cout << "SAVED SESSIONS\n";
  std::cout << "  list                 List resumable sessions\n";
  std::cout << "  show <n|id>          Verify and describe a saved session\n";
  std::cout << "  delete <n|id>        Delete a saved session\n";
  std::cout << "  clear                Delete every saved session\n";
  std::cout << "  cleanup [days]       Delete sessions closed at least DAYS ago\n";
  std::cout << "  shell                Interactive loop (/new, /resume, /close, /quit)\n\n";
  std::cout << "CONFIG\n";
  std::cout << "  config init          Write a default config file\n";
  std::cout << "  config show          Display the effective configuration\n";
  std::cout << "  config validate      Check the configuration\n";
  std::cout << "  config-path          Print the config file location\n\n";
  std::cout << "OTHER\n";
  std::cout << "  version              Show version\n";
  std::cout << "  help                 Show this help\n";
}

int run_cli(int argc, char **argv) {
  std::vector<std::string> args = collect_args(argc - 1, argv + 1);
  std::string global_error;
  if (!apply_global_options(args, global_error)) {
    std::cerr << global_error << "\n";
    return 1;
  }

  if (args.empty()) {
    print_help();
    return 0;
  }

  const std::string subcommand = args[0];
  args.erase(args.begin());

  try {
    if (subcommand == "--help" || subcommand == "-h" || subcommand == "help") {
      print_help();
      return 0;
    }
    if (subcommand == "--version" || subcommand == "-V" || subcommand == "version") {
      std::cout << version_string() << "\n";
      return 0;
    }
    if (subcommand == "config-path") {
      auto path_result = config::config_path();
      if (!path_result.ok()) {
        std::cerr << path_result.error() << "\n";
        return 1;
      }
      std::cout << path_result.value().string() << "\n";
      return 0;
    }
    if (subcommand == "config") {
      return run_config(std::move(args));
    }
    if (subcommand == "list" || subcommand == "show" || subcommand == "delete" ||
        subcommand == "clear" || subcommand == "cleanup" || subcommand == "shell") {
      return run_session_command(subcommand, std::move(args));
    }
  } catch (const std::exception &ex) {
    observability::log_error("cli", ex.what());
    std::cerr << "An unexpected error occurred.\n";
    return 1;
  }

  std::cerr << "Unknown command: " << subcommand << "\n";
  print_help();
  return 1;
}

} // namespace cairn::cli
