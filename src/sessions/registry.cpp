#include "cairn/sessions/registry.hpp"

#include <algorithm>

namespace cairn::sessions {

InMemorySessionRegistry::InMemorySessionRegistry(const std::size_t max_sessions)
    : max_sessions_(max_sessions) {}

Status InMemorySessionRegistry::register_session(std::shared_ptr<SessionWorker> worker) {
  if (worker == nullptr) {
    return Status::failure(ErrorKind::InvalidArgument);
  }
  std::lock_guard<std::mutex> lock(mutex_);
  if (by_id_.size() >= max_sessions_) {
    return Status::failure(ErrorKind::SessionLimitReached);
  }
  if (by_id_.count(worker->id()) != 0) {
    return Status::failure(ErrorKind::SessionExists);
  }
  const bool path_taken =
      std::any_of(by_id_.begin(), by_id_.end(), [&worker](const auto &entry) {
        return entry.second->project_path() == worker->project_path();
      });
  if (path_taken) {
    return Status::failure(ErrorKind::ProjectAlreadyOpen);
  }
  by_id_.emplace(worker->id(), std::move(worker));
  return Status::success();
}

void InMemorySessionRegistry::unregister_session(const std::string &id) {
  std::lock_guard<std::mutex> lock(mutex_);
  by_id_.erase(id);
}

std::size_t InMemorySessionRegistry::count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return by_id_.size();
}

std::shared_ptr<SessionWorker> InMemorySessionRegistry::find_by_id(const std::string &id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = by_id_.find(id);
  return it == by_id_.end() ? nullptr : it->second;
}

std::shared_ptr<SessionWorker>
InMemorySessionRegistry::find_by_path(const std::string &project_path) const {
  std::lock_guard<std::mutex> lock(mutex_);
  for (const auto &[id, worker] : by_id_) {
    if (worker->project_path() == project_path) {
      return worker;
    }
  }
  return nullptr;
}

std::vector<LiveSession> InMemorySessionRegistry::list() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<LiveSession> out;
  out.reserve(by_id_.size());
  for (const auto &[id, worker] : by_id_) {
    out.push_back(LiveSession{.id = id, .project_path = worker->project_path()});
  }
  return out;
}

} // namespace cairn::sessions
