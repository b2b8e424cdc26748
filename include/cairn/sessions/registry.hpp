#pragma once

#include "cairn/sessions/errors.hpp"
#include "cairn/sessions/worker.hpp"

#include <cstddef>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace cairn::sessions {

struct LiveSession {
  std::string id;
  std::string project_path;
};

/// Index of live sessions by id and by project path.
class ISessionRegistry {
public:
  virtual ~ISessionRegistry() = default;

  /// Fails with SessionLimitReached, SessionExists or ProjectAlreadyOpen.
  [[nodiscard]] virtual Status register_session(std::shared_ptr<SessionWorker> worker) = 0;
  virtual void unregister_session(const std::string &id) = 0;
  [[nodiscard]] virtual std::size_t count() const = 0;
  [[nodiscard]] virtual std::shared_ptr<SessionWorker> find_by_id(const std::string &id) const = 0;
  [[nodiscard]] virtual std::shared_ptr<SessionWorker>
  find_by_path(const std::string &project_path) const = 0;
  [[nodiscard]] virtual std::vector<LiveSession> list() const = 0;
};

class InMemorySessionRegistry final : public ISessionRegistry {
public:
  explicit InMemorySessionRegistry(std::size_t max_sessions = 10);

  [[nodiscard]] Status register_session(std::shared_ptr<SessionWorker> worker) override;
  void unregister_session(const std::string &id) override;
  [[nodiscard]] std::size_t count() const override;
  [[nodiscard]] std::shared_ptr<SessionWorker> find_by_id(const std::string &id) const override;
  [[nodiscard]] std::shared_ptr<SessionWorker>
  find_by_path(const std::string &project_path) const override;
  [[nodiscard]] std::vector<LiveSession> list() const override;

private:
  std::size_t max_sessions_;
  mutable std::mutex mutex_;
  std::map<std::string, std::shared_ptr<SessionWorker>> by_id_;
};

} // namespace cairn::sessions
