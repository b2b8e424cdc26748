#pragma once

#include "cairn/cli/resume_commands.hpp"
#include "cairn/common/result.hpp"
#include "cairn/config/schema.hpp"
#include "cairn/sessions/persistence.hpp"
#include "cairn/sessions/registry.hpp"
#include "cairn/sessions/supervisor.hpp"
#include "cairn/sessions/sweeper.hpp"

#include <iosfwd>
#include <memory>

namespace cairn::cli {

/// Everything one invocation needs, wired from a loaded config. Live workers are
/// stopped without saving when the runtime is destroyed.
struct Runtime {
  Runtime() = default;
  Runtime(const Runtime &) = delete;
  Runtime &operator=(const Runtime &) = delete;
  ~Runtime();

  config::Config config;
  std::shared_ptr<sessions::InMemorySessionRegistry> registry;
  std::shared_ptr<sessions::SessionSupervisor> supervisor;
  std::unique_ptr<sessions::PersistenceEngine> engine;
  std::unique_ptr<sessions::MaintenanceSweeper> sweeper;
  std::unique_ptr<ResumeCommands> commands;
};

[[nodiscard]] common::Result<std::unique_ptr<Runtime>> build_runtime(const config::Config &config);

/// Line-oriented session loop: /new, /resume, /cleanup, /close, /quit. Plain lines are
/// appended to the active session as user messages. The active session is saved on
/// /quit and at end of input.
int run_shell(Runtime &runtime, std::istream &in, std::ostream &out);

void print_help();
int run_cli(int argc, char **argv);

} // namespace cairn::cli
