#pragma once

#include "cairn/common/time.hpp"
#include "cairn/observability/observer.hpp"
#include "cairn/security/integrity.hpp"
#include "cairn/security/rate_limiter.hpp"
#include "cairn/sessions/conversation.hpp"
#include "cairn/sessions/persistence.hpp"
#include "cairn/sessions/registry.hpp"
#include "cairn/sessions/session.hpp"
#include "cairn/sessions/supervisor.hpp"

#include <chrono>
#include <filesystem>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace cairn::testing {

class TempWorkspace {
public:
  TempWorkspace();
  ~TempWorkspace();

  TempWorkspace(const TempWorkspace &) = delete;
  TempWorkspace &operator=(const TempWorkspace &) = delete;

  [[nodiscard]] const std::filesystem::path &path() const { return path_; }
  void create_file(const std::string &name, const std::string &content) const;
  [[nodiscard]] std::filesystem::path create_dir(const std::string &name) const;

private:
  std::filesystem::path path_;
};

/// Hand-advanced clock shared by copies of as_clock().
class ManualClock {
public:
  explicit ManualClock(common::Timestamp start = default_start());

  [[nodiscard]] common::Timestamp now() const;
  void advance(std::chrono::system_clock::duration by);
  void set(common::Timestamp at);
  [[nodiscard]] common::Clock as_clock() const;

  static common::Timestamp default_start();

private:
  struct State {
    std::mutex mutex;
    common::Timestamp now;
  };
  std::shared_ptr<State> state_;
};

class RecordingObserver final : public observability::IObserver {
public:
  void record_event(const observability::ObserverEvent &event) override;
  void record_metric(const observability::ObserverMetric &metric) override;
  [[nodiscard]] std::string_view name() const override { return "recording"; }

  [[nodiscard]] std::vector<observability::ObserverEvent> events() const;
  [[nodiscard]] std::vector<observability::ObserverMetric> metrics() const;

  template <typename T> [[nodiscard]] std::size_t count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::size_t n = 0;
    for (const auto &event : events_) {
      if (std::holds_alternative<T>(event)) {
        ++n;
      }
    }
    return n;
  }

private:
  mutable std::mutex mutex_;
  std::vector<observability::ObserverEvent> events_;
  std::vector<observability::ObserverMetric> metrics_;
};

/// Installs a RecordingObserver as the global observer for the scope's lifetime.
class ScopedRecordingObserver {
public:
  ScopedRecordingObserver();
  ~ScopedRecordingObserver();

  ScopedRecordingObserver(const ScopedRecordingObserver &) = delete;
  ScopedRecordingObserver &operator=(const ScopedRecordingObserver &) = delete;

  [[nodiscard]] RecordingObserver &observer() { return *observer_; }

private:
  std::shared_ptr<RecordingObserver> observer_;
  std::shared_ptr<observability::IObserver> previous_;
};

/// A persistence engine over a temp sessions dir with a fast KDF and a manual clock.
struct PersistenceFixture {
  explicit PersistenceFixture(std::uint64_t max_sessions = 100, bool auto_cleanup = false);

  TempWorkspace workspace;
  ManualClock clock;
  std::filesystem::path sessions_dir;
  std::filesystem::path project_dir;
  std::shared_ptr<security::Integrity> integrity;
  std::shared_ptr<security::RateLimiter> rate_limiter;
  std::shared_ptr<sessions::InMemorySessionRegistry> registry;
  std::shared_ptr<sessions::SessionSupervisor> supervisor;
  std::unique_ptr<sessions::PersistenceEngine> engine;

  /// A fresh session rooted at a new directory under the workspace.
  [[nodiscard]] sessions::Session new_session(const std::string &name = "demo");
  [[nodiscard]] std::string read_snapshot(const std::string &id) const;
  void write_snapshot(const std::string &id, const std::string &content) const;
};

[[nodiscard]] security::IntegrityOptions fast_integrity_options(const std::filesystem::path &dir);

[[nodiscard]] std::vector<sessions::Message> sample_messages(std::size_t count,
                                                             common::Timestamp start);
[[nodiscard]] std::vector<sessions::Todo> sample_todos();

} // namespace cairn::testing
