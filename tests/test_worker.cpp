#include "test_framework.hpp"

#include "cairn/sessions/worker.hpp"
#include "tests/helpers/test_helpers.hpp"

#include <chrono>
#include <future>
#include <thread>
#include <vector>

namespace {

namespace s = cairn::sessions;

s::Session worker_session(const cairn::testing::ManualClock &clock) {
  s::Session session;
  session.id = "worker-test";
  session.name = "worker";
  session.project_path = "/tmp/worker-project";
  session.created_at = clock.now();
  session.updated_at = clock.now();
  return session;
}

} // namespace

void register_worker_tests(std::vector<cairn::tests::TestCase> &tests) {
  using cairn::tests::require;
  using namespace std::chrono_literals;

  tests.push_back({"worker_append_and_page_messages", [] {
                     cairn::testing::ManualClock clock;
                     s::SessionWorker worker(worker_session(clock),
                                             s::WorkerOptions{.max_messages = 100,
                                                              .clock = clock.as_clock()});
                     require(worker.start().ok(), "start failed");
                     require(worker.running(), "worker should be running");

                     auto appended =
                         worker.append_messages(cairn::testing::sample_messages(5, clock.now()));
                     require(appended.ok(), "append failed");

                     auto page = worker.get_messages(1, 2);
                     require(page.ok(), "get_messages failed");
                     require(page.value().total == 5, "total mismatch");
                     require(page.value().items.size() == 2, "page size mismatch");
                     require(page.value().items[0].id == "msg-2", "page offset mismatch");
                     require(page.value().has_more, "more pages expected");

                     auto tail = worker.get_messages(3, std::nullopt);
                     require(tail.ok() && tail.value().items.size() == 2 && !tail.value().has_more,
                             "tail page mismatch");

                     auto beyond = worker.get_messages(10, 5);
                     require(beyond.ok() && beyond.value().items.empty() &&
                                 !beyond.value().has_more,
                             "offset past the end should be empty");
                   }});

  tests.push_back({"worker_rejects_bad_message_ids_atomically", [] {
                     cairn::testing::ManualClock clock;
                     s::SessionWorker worker(worker_session(clock), {.clock = clock.as_clock()});
                     require(worker.start().ok(), "start failed");
                     require(worker.append_messages(cairn::testing::sample_messages(2, clock.now()))
                                 .ok(),
                             "initial append failed");

                     auto duplicate = worker.append_message(
                         s::Message{.id = "msg-1", .role = s::Role::User, .content = "again"});
                     require(!duplicate.ok() && duplicate.error() == s::ErrorKind::InvalidMessage,
                             "duplicate id should fail");

                     std::vector<s::Message> batch = {
                         s::Message{.id = "new-1", .role = s::Role::User, .content = "a"},
                         s::Message{.id = "", .role = s::Role::User, .content = "b"},
                     };
                     require(!worker.append_messages(batch).ok(), "empty id should fail");

                     auto all = worker.get_all_messages();
                     require(all.ok() && all.value().size() == 2,
                             "rejected batch must not be partially applied");
                   }});

  tests.push_back({"worker_fills_missing_timestamp_and_touches_session", [] {
                     cairn::testing::ManualClock clock;
                     s::SessionWorker worker(worker_session(clock), {.clock = clock.as_clock()});
                     require(worker.start().ok(), "start failed");
                     clock.advance(90s);
                     require(worker.append_message(s::Message{.id = "m",
                                                              .role = s::Role::Assistant,
                                                              .content = "hello"})
                                 .ok(),
                             "append failed");
                     auto all = worker.get_all_messages();
                     require(all.ok() && all.value()[0].timestamp == clock.now(),
                             "timestamp should default to now");
                     auto session = worker.session();
                     require(session.ok() && session.value().updated_at == clock.now(),
                             "updated_at should advance");
                   }});

  tests.push_back({"worker_evicts_oldest_messages", [] {
                     cairn::testing::ManualClock clock;
                     s::SessionWorker worker(worker_session(clock),
                                             {.max_messages = 3, .clock = clock.as_clock()});
                     require(worker.start().ok(), "start failed");
                     require(worker.append_messages(cairn::testing::sample_messages(5, clock.now()))
                                 .ok(),
                             "append failed");
                     auto all = worker.get_all_messages();
                     require(all.ok() && all.value().size() == 3, "cap should hold");
                     require(all.value().front().id == "msg-3", "oldest should be evicted");
                     require(worker.append_message(s::Message{.id = "msg-1",
                                                              .role = s::Role::User,
                                                              .content = "reused",
                                                              .timestamp = clock.now()})
                                 .ok(),
                             "evicted id may be reused");
                   }});

  tests.push_back({"worker_replaces_todos", [] {
                     cairn::testing::ManualClock clock;
                     s::SessionWorker worker(worker_session(clock), {.clock = clock.as_clock()});
                     require(worker.start().ok(), "start failed");
                     require(worker.replace_todos(cairn::testing::sample_todos()).ok(),
                             "replace failed");
                     require(worker.replace_todos({s::Todo{.content = "only"}}).ok(),
                             "second replace failed");
                     auto todos = worker.get_todos();
                     require(todos.ok() && todos.value().size() == 1 &&
                                 todos.value()[0].content == "only",
                             "todos should be replaced wholesale");
                   }});

  tests.push_back({"worker_calls_fail_fast_when_not_running", [] {
                     cairn::testing::ManualClock clock;
                     s::SessionWorker worker(worker_session(clock), {.clock = clock.as_clock()});
                     auto before = worker.get_todos();
                     require(!before.ok() && before.error() == s::ErrorKind::WorkerStopped,
                             "calls before start should fail");
                     require(worker.start().ok(), "start failed");
                     worker.stop();
                     worker.stop();
                     require(!worker.running(), "worker should be stopped");
                     auto after = worker.append_message(s::Message{.id = "x"});
                     require(!after.ok() && after.error() == s::ErrorKind::WorkerStopped,
                             "calls after stop should fail");
                     auto restart = worker.start();
                     require(!restart.ok(), "a stopped worker cannot be restarted");
                   }});

  tests.push_back({"worker_serialises_concurrent_appends", [] {
                     cairn::testing::ManualClock clock;
                     s::SessionWorker worker(worker_session(clock),
                                             {.max_messages = 1000, .clock = clock.as_clock()});
                     require(worker.start().ok(), "start failed");

                     std::vector<std::future<bool>> results;
                     for (int t = 0; t < 4; ++t) {
                       results.push_back(std::async(std::launch::async, [&worker, t] {
                         bool ok = true;
                         for (int i = 0; i < 25; ++i) {
                           ok = ok && worker
                                          .append_message(s::Message{
                                              .id = std::to_string(t) + "-" + std::to_string(i),
                                              .role = s::Role::User,
                                              .content = "x"})
                                          .ok();
                         }
                         return ok;
                       }));
                     }
                     for (auto &result : results) {
                       require(result.get(), "concurrent append failed");
                     }
                     auto page = worker.get_messages(0, 0);
                     require(page.ok() && page.value().total == 100, "all appends should land");
                   }});
}
