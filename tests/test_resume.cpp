#include "test_framework.hpp"

#include "cairn/observability/observer.hpp"
#include "cairn/sessions/persistence.hpp"
#include "tests/helpers/test_helpers.hpp"

#include <chrono>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

namespace s = cairn::sessions;
namespace fs = std::filesystem;
using cairn::testing::PersistenceFixture;

// Saves a session with three messages and two todos and returns it.
s::Session save_sample(PersistenceFixture &fx, const std::string &name = "sample") {
  const auto session = fx.new_session(name);
  const auto saved = fx.engine->save(session, cairn::testing::sample_messages(3, fx.clock.now()),
                                     cairn::testing::sample_todos());
  if (!saved.ok()) {
    throw std::runtime_error("save_sample failed");
  }
  return session;
}

// Writes an unsigned (legacy) snapshot for `session` exactly as given, bypassing
// make_session validation.
void write_legacy_snapshot(PersistenceFixture &fx, const s::Session &session) {
  const auto payload = s::encode(session, cairn::testing::sample_messages(2, fx.clock.now()), {},
                                 fx.clock.now());
  if (!payload.ok()) {
    throw std::runtime_error("encode failed");
  }
  fx.write_snapshot(session.id, payload.value());
}

void toggle_others_exec(const fs::path &dir) {
  const auto perms = fs::status(dir).permissions();
  const bool has = (perms & fs::perms::others_exec) != fs::perms::none;
  fs::permissions(dir, fs::perms::others_exec,
                  has ? fs::perm_options::remove : fs::perm_options::add);
}

} // namespace

void register_resume_tests(std::vector<cairn::tests::TestCase> &tests) {
  using cairn::tests::require;
  using namespace std::chrono_literals;

  tests.push_back({"resume_restores_conversation_and_removes_snapshot", [] {
                     PersistenceFixture fx;
                     cairn::testing::ScopedRecordingObserver recording;
                     const auto session = fx.new_session("roundtrip");
                     auto started = fx.supervisor->start(session);
                     require(started.ok(), "start failed");
                     const auto messages = cairn::testing::sample_messages(3, fx.clock.now());
                     require(started.value()->append_messages(messages).ok(), "append");
                     require(started.value()->replace_todos(cairn::testing::sample_todos()).ok(),
                             "todos");
                     require(fx.engine->close_session(session.id).ok(), "close");
                     require(fs::exists(fx.sessions_dir / (session.id + ".json")), "saved");

                     fx.clock.advance(2h);
                     auto resumed = fx.engine->resume(session.id);
                     require(resumed.ok(), "resume failed");
                     auto &worker = *resumed.value();
                     require(worker.running(), "worker running");

                     auto restored = worker.get_all_messages();
                     require(restored.ok() && restored.value() == messages,
                             "conversation restored in order");
                     auto todos = worker.get_todos();
                     require(todos.ok() && todos.value() == cairn::testing::sample_todos(),
                             "todos restored");
                     auto live = worker.session();
                     require(live.ok(), "session");
                     require(live.value().id == session.id, "same id");
                     require(live.value().name == "roundtrip", "same name");
                     require(live.value().last_resumed_at == fx.clock.now(), "last_resumed_at");
                     require(live.value().updated_at >= fx.clock.now(), "updated_at refreshed");

                     require(!fs::exists(fx.sessions_dir / (session.id + ".json")),
                             "snapshot deleted after resume");
                     require(fx.registry->find_by_id(session.id) != nullptr, "registered");
                     require(recording.observer().count<cairn::observability::SnapshotResumedEvent>() ==
                                 1,
                             "resumed event");
                   }});

  tests.push_back({"resume_walks_stages_in_order", [] {
                     PersistenceFixture fx;
                     const auto session = save_sample(fx);
                     std::vector<s::ResumeStage> stages;
                     fx.engine->set_stage_hook(
                         [&stages](s::ResumeStage stage, const std::string &) {
                           stages.push_back(stage);
                         });
                     require(fx.engine->resume(session.id).ok(), "resume failed");
                     const std::vector<s::ResumeStage> expected = {
                         s::ResumeStage::Loading,        s::ResumeStage::PathValidating,
                         s::ResumeStage::Rebuilding,     s::ResumeStage::ProcessStarting,
                         s::ResumeStage::StateRestoring, s::ResumeStage::Cleanup,
                         s::ResumeStage::Active};
                     require(stages == expected, "stage sequence mismatch");
                   }});

  tests.push_back({"resume_detects_permission_change_between_checks", [] {
                     PersistenceFixture fx;
                     const auto session = save_sample(fx);
                     std::vector<s::ResumeStage> stages;
                     fx.engine->set_stage_hook([&](s::ResumeStage stage, const std::string &) {
                       stages.push_back(stage);
                       if (stage == s::ResumeStage::StateRestoring) {
                         toggle_others_exec(session.project_path);
                       }
                     });

                     auto resumed = fx.engine->resume(session.id);
                     require(!resumed.ok() &&
                                 resumed.error() == s::ErrorKind::ProjectPathChanged,
                             "permission change should be detected");
                     require(stages.back() == s::ResumeStage::Failed, "ends in Failed");
                     require(fx.registry->count() == 0, "no worker left registered");
                     require(fx.supervisor->find(session.id) == nullptr, "no worker left");
                     require(fs::exists(fx.sessions_dir / (session.id + ".json")),
                             "snapshot kept for retry");
                   }});

  tests.push_back({"resume_detects_directory_swap", [] {
                     PersistenceFixture fx;
                     const auto session = save_sample(fx);
                     fx.engine->set_stage_hook([&](s::ResumeStage stage, const std::string &) {
                       if (stage == s::ResumeStage::StateRestoring) {
                         fs::rename(session.project_path, session.project_path + "-moved");
                         fs::create_directory(session.project_path);
                       }
                     });
                     auto resumed = fx.engine->resume(session.id);
                     require(!resumed.ok() &&
                                 resumed.error() == s::ErrorKind::ProjectPathChanged,
                             "replaced directory should be detected");
                     require(fx.registry->count() == 0, "no worker left");
                   }});

  tests.push_back({"resume_missing_project_dir_then_retry", [] {
                     PersistenceFixture fx;
                     const auto session = save_sample(fx);
                     fs::remove_all(session.project_path);

                     auto missing = fx.engine->resume(session.id);
                     require(!missing.ok() &&
                                 missing.error() == s::ErrorKind::ProjectPathNotFound,
                             "missing dir should be reported");
                     require(fs::exists(fx.sessions_dir / (session.id + ".json")),
                             "snapshot untouched");
                     require(fx.registry->count() == 0, "nothing started");

                     fs::create_directories(session.project_path);
                     auto retried = fx.engine->resume(session.id);
                     require(retried.ok(), "retry after recreating the dir should work");
                   }});

  tests.push_back({"resume_project_path_not_directory", [] {
                     PersistenceFixture fx;
                     const auto session = save_sample(fx);
                     fs::remove_all(session.project_path);
                     fx.workspace.create_file(
                         fs::path(session.project_path).lexically_relative(fx.workspace.path())
                             .string(),
                         "now a file");
                     auto resumed = fx.engine->resume(session.id);
                     require(!resumed.ok() &&
                                 resumed.error() == s::ErrorKind::ProjectPathNotDirectory,
                             "file in place of dir should be reported");
                   }});

  tests.push_back({"resume_rejects_tampered_snapshot", [] {
                     PersistenceFixture fx;
                     const auto session = save_sample(fx, "honest");
                     std::string body = fx.read_snapshot(session.id);
                     const auto at = body.find("message 2");
                     require(at != std::string::npos, "content present");
                     body[at + 8] = '9';
                     fx.write_snapshot(session.id, body);

                     auto resumed = fx.engine->resume(session.id);
                     require(!resumed.ok() &&
                                 resumed.error() == s::ErrorKind::SignatureVerificationFailed,
                             "tampering should be detected");
                     require(fx.registry->count() == 0, "nothing started");
                     require(fs::exists(fx.sessions_dir / (session.id + ".json")),
                             "tampered file is not deleted");
                   }});

  tests.push_back({"resume_corrupt_json_reports_decode_error", [] {
                     PersistenceFixture fx;
                     fx.write_snapshot("corrupt", "{\"version\":1,\"id\":");
                     auto resumed = fx.engine->resume("corrupt");
                     require(!resumed.ok() && resumed.error() == s::ErrorKind::DecodeError,
                             "corrupt JSON should be a decode error");

                     auto invalid = fx.engine->resume("../../etc/passwd");
                     require(!invalid.ok() && invalid.error() == s::ErrorKind::InvalidSessionId,
                             "path-like id rejected");
                     auto absent = fx.engine->resume("absent");
                     require(!absent.ok() && absent.error() == s::ErrorKind::NotFound,
                             "absent snapshot");
                   }});

  tests.push_back({"resume_conflicts_with_live_project", [] {
                     PersistenceFixture fx;
                     const auto session = save_sample(fx);
                     auto occupant = fx.new_session("occupant");
                     occupant.project_path = session.project_path;
                     require(fx.supervisor->start(occupant).ok(), "occupant start");

                     auto resumed = fx.engine->resume(session.id);
                     require(!resumed.ok() &&
                                 resumed.error() == s::ErrorKind::ProjectAlreadyOpen,
                             "project already open");
                     require(fx.registry->count() == 1, "only the occupant is live");
                     require(fs::exists(fx.sessions_dir / (session.id + ".json")),
                             "snapshot kept");
                   }});

  tests.push_back({"resume_rate_limited_per_session", [] {
                     PersistenceFixture fx;
                     cairn::testing::ScopedRecordingObserver recording;
                     fx.rate_limiter->set_limit(
                         cairn::security::RESUME_OPERATION,
                         cairn::security::RateLimit{.limit = 5, .window = 60s});
                     const auto session = save_sample(fx);
                     for (int i = 0; i < 5; ++i) {
                       auto resumed = fx.engine->resume(session.id);
                       require(resumed.ok(), "resume " + std::to_string(i) + " failed");
                       fx.clock.advance(1s);
                       require(fx.engine->close_session(session.id).ok(), "close failed");
                     }
                     auto limited = fx.engine->resume(session.id);
                     require(!limited.ok() && limited.error() == s::ErrorKind::RateLimited,
                             "sixth resume should be limited");
                     require(limited.error().retry_after_seconds == 55,
                             "retry_after mismatch: " +
                                 std::to_string(limited.error().retry_after_seconds));
                     require(s::sanitize_error(limited.error()) ==
                                 "Rate limit exceeded. Try again in 55 seconds.",
                             "sanitized message");
                     require(recording.observer().count<cairn::observability::RateLimitedEvent>() == 1,
                             "rate limit recorded");
                     require(fs::exists(fx.sessions_dir / (session.id + ".json")),
                             "limited resume leaves the snapshot");

                     fx.clock.advance(60s);
                     require(fx.engine->resume(session.id).ok(), "window passed");
                   }});

  tests.push_back({"resume_failures_do_not_consume_rate_limit", [] {
                     PersistenceFixture fx;
                     fx.rate_limiter->set_limit(
                         cairn::security::RESUME_OPERATION,
                         cairn::security::RateLimit{.limit = 2, .window = 60s});
                     const auto session = save_sample(fx);
                     fs::remove_all(session.project_path);
                     for (int i = 0; i < 4; ++i) {
                       auto missing = fx.engine->resume(session.id);
                       require(!missing.ok() &&
                                   missing.error() == s::ErrorKind::ProjectPathNotFound,
                               "missing dir");
                     }
                     fs::create_directories(session.project_path);
                     require(fx.engine->resume(session.id).ok(),
                             "failed attempts should not count");
                   }});

  tests.push_back({"resume_global_limit_blocks_fan_out", [] {
                     PersistenceFixture fx;
                     fx.rate_limiter->set_global_limit(
                         cairn::security::RESUME_OPERATION,
                         cairn::security::RateLimit{.limit = 3, .window = 60s});
                     std::vector<s::Session> sessions;
                     for (int i = 0; i < 4; ++i) {
                       sessions.push_back(save_sample(fx, "fan-" + std::to_string(i)));
                     }
                     for (int i = 0; i < 3; ++i) {
                       require(fx.engine->resume(sessions[static_cast<std::size_t>(i)].id).ok(),
                               "resume under global limit");
                     }
                     auto limited = fx.engine->resume(sessions[3].id);
                     require(!limited.ok() && limited.error() == s::ErrorKind::RateLimited,
                             "fourth distinct session should hit the global limit");
                     require(limited.error().retry_after_seconds == 60, "global retry_after");
                   }});

  tests.push_back({"resume_revalidates_legacy_project_path", [] {
                     PersistenceFixture fx;
                     auto occupant = fx.new_session("occupant");
                     require(fx.supervisor->start(occupant).ok(), "occupant start");

                     auto aliased = fx.new_session("aliased");
                     aliased.project_path = occupant.project_path + "/.";
                     write_legacy_snapshot(fx, aliased);
                     auto conflict = fx.engine->resume(aliased.id);
                     require(!conflict.ok() &&
                                 conflict.error() == s::ErrorKind::ProjectAlreadyOpen,
                             "a dot-suffixed alias of a live project must conflict");
                     require(fx.registry->count() == 1, "only the occupant is live");

                     auto traversal = fx.new_session("traversal");
                     traversal.project_path = traversal.project_path + "/../" +
                                              fs::path(traversal.project_path).filename().string();
                     write_legacy_snapshot(fx, traversal);
                     auto traversed = fx.engine->resume(traversal.id);
                     require(!traversed.ok() && traversed.error() == s::ErrorKind::PathTraversal,
                             "'..' segments are rejected");

                     auto relative = fx.new_session("relative");
                     relative.project_path = "relative/project";
                     write_legacy_snapshot(fx, relative);
                     auto rel = fx.engine->resume(relative.id);
                     require(!rel.ok() && rel.error() == s::ErrorKind::PathNotAbsolute,
                             "relative paths are rejected");
                     require(fx.registry->count() == 1, "nothing else started");
                   }});

  tests.push_back({"resume_uses_canonical_project_path", [] {
                     PersistenceFixture fx;
                     auto session = fx.new_session("dotted");
                     const std::string canonical = session.project_path;
                     session.project_path = canonical + "/.";
                     write_legacy_snapshot(fx, session);

                     auto resumed = fx.engine->resume(session.id);
                     require(resumed.ok(), "legacy snapshot with an equivalent path resumes");
                     auto live = resumed.value()->session();
                     require(live.ok() && live.value().project_path == canonical,
                             "live session holds the canonical path");
                     require(fx.registry->find_by_path(canonical) != nullptr,
                             "registered under the canonical path");
                   }});

  tests.push_back({"resume_revalidates_name_and_config", [] {
                     PersistenceFixture fx;
                     auto hot = fx.new_session("hot");
                     hot.config.temperature = 9.5;
                     write_legacy_snapshot(fx, hot);
                     auto too_hot = fx.engine->resume(hot.id);
                     require(!too_hot.ok() && too_hot.error() == s::ErrorKind::InvalidConfig,
                             "out-of-range temperature is rejected");

                     auto unnamed = fx.new_session("unnamed");
                     unnamed.name = std::string(80, 'n');
                     write_legacy_snapshot(fx, unnamed);
                     auto long_name = fx.engine->resume(unnamed.id);
                     require(!long_name.ok() && long_name.error() == s::ErrorKind::InvalidName,
                             "over-long name is rejected");

                     require(fx.registry->count() == 0, "nothing started");
                     require(fs::exists(fx.sessions_dir / (hot.id + ".json")),
                             "rejected snapshot is kept");
                   }});

  tests.push_back({"resume_does_not_accumulate_rate_limit_keys", [] {
                     PersistenceFixture fx;
                     for (int i = 0; i < 15; ++i) {
                       const auto session = save_sample(fx, "churn-" + std::to_string(i));
                       auto resumed = fx.engine->resume(session.id);
                       require(resumed.ok(), "resume " + std::to_string(i));
                       require(fx.supervisor->stop(session.id).ok(), "stop");
                       fx.clock.advance(10min);
                     }
                     require(fx.rate_limiter->tracked_keys().size() <= 2,
                             "expired session keys are pruned: " +
                                 std::to_string(fx.rate_limiter->tracked_keys().size()));
                   }});
  tests.push_back({"resume_reports_snapshot_left_behind", [] {
                     PersistenceFixture fx;
                     cairn::testing::ScopedRecordingObserver recording;
                     const auto session = save_sample(fx);
                     const auto file = fx.sessions_dir / (session.id + ".json");
                     fx.engine->set_stage_hook([&](s::ResumeStage stage, const std::string &) {
                       if (stage == s::ResumeStage::Cleanup) {
                         fs::remove(file);
                         fs::create_directory(file);
                         fs::create_directory(file / "pinned");
                       }
                     });

                     auto resumed = fx.engine->resume(session.id);
                     require(resumed.ok(), "session is live even if the file stays");
                     require(fx.registry->find_by_id(session.id) != nullptr, "registered");
                     require(fs::exists(file), "leftover still on disk");
                     require(recording.observer()
                                     .count<cairn::observability::SnapshotDeleteFailedEvent>() == 1,
                             "delete failure reported");
                     require(recording.observer()
                                     .count<cairn::observability::SnapshotDeletedEvent>() == 0,
                             "no deleted event");
                   }});
}
