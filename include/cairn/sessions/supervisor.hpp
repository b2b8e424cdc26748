#pragma once

#include "cairn/sessions/registry.hpp"
#include "cairn/sessions/worker.hpp"

#include <memory>
#include <string>

namespace cairn::sessions {

class IProcessSupervisor {
public:
  virtual ~IProcessSupervisor() = default;

  /// Registers and starts a worker for `session`. Nothing is left running on failure.
  [[nodiscard]] virtual Result<std::shared_ptr<SessionWorker>> start(const Session &session) = 0;
  [[nodiscard]] virtual Status stop(const std::string &id) = 0;
  [[nodiscard]] virtual std::shared_ptr<SessionWorker> find(const std::string &id) const = 0;
};

class SessionSupervisor final : public IProcessSupervisor {
public:
  SessionSupervisor(std::shared_ptr<ISessionRegistry> registry, WorkerOptions options = {});
  ~SessionSupervisor() override;

  [[nodiscard]] Result<std::shared_ptr<SessionWorker>> start(const Session &session) override;
  [[nodiscard]] Status stop(const std::string &id) override;
  [[nodiscard]] std::shared_ptr<SessionWorker> find(const std::string &id) const override;

  void stop_all();
  [[nodiscard]] ISessionRegistry &registry() { return *registry_; }

private:
  std::shared_ptr<ISessionRegistry> registry_;
  WorkerOptions options_;
};

} // namespace cairn::sessions
