#include "cairn/sessions/supervisor.hpp"

#include "cairn/observability/global.hpp"

namespace cairn::sessions {

SessionSupervisor::SessionSupervisor(std::shared_ptr<ISessionRegistry> registry,
                                     WorkerOptions options)
    : registry_(std::move(registry)), options_(std::move(options)) {}

SessionSupervisor::~SessionSupervisor() { stop_all(); }

Result<std::shared_ptr<SessionWorker>> SessionSupervisor::start(const Session &session) {
  using R = Result<std::shared_ptr<SessionWorker>>;

  auto worker = std::make_shared<SessionWorker>(session, options_);
  if (const auto registered = registry_->register_session(worker); !registered.ok()) {
    return R::failure(registered.error());
  }
  if (const auto started = worker->start(); !started.ok()) {
    registry_->unregister_session(session.id);
    return R::failure(started.error());
  }

  observability::log_debug("supervisor", "started worker for session " + session.id);
  observability::record_active_sessions(registry_->count());
  return R::success(std::move(worker));
}

Status SessionSupervisor::stop(const std::string &id) {
  auto worker = registry_->find_by_id(id);
  if (worker == nullptr) {
    return Status::failure(ErrorKind::SessionNotFound);
  }
  registry_->unregister_session(id);
  worker->stop();

  observability::log_debug("supervisor", "stopped worker for session " + id);
  observability::record_active_sessions(registry_->count());
  return Status::success();
}

std::shared_ptr<SessionWorker> SessionSupervisor::find(const std::string &id) const {
  return registry_->find_by_id(id);
}

void SessionSupervisor::stop_all() {
  for (const auto &live : registry_->list()) {
    if (const auto status = stop(live.id); !status.ok()) {
      observability::log_debug("supervisor", "worker already gone: " + live.id);
    }
  }
}

} // namespace cairn::sessions
