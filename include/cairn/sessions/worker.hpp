#pragma once

#include "cairn/sessions/conversation.hpp"
#include "cairn/sessions/errors.hpp"
#include "cairn/sessions/session.hpp"

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <future>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_set>
#include <variant>
#include <vector>

namespace cairn::sessions {

struct WorkerOptions {
  std::size_t max_messages = 1000;
  common::Clock clock = common::system_now;
};

/// Owns one live session's conversation and task list. All state is touched only by
/// the worker thread; public calls enqueue a request and block on its reply.
class SessionWorker {
public:
  explicit SessionWorker(Session session, WorkerOptions options = {});
  ~SessionWorker();

  SessionWorker(const SessionWorker &) = delete;
  SessionWorker &operator=(const SessionWorker &) = delete;

  [[nodiscard]] Status start();
  /// Pending and later requests fail with WorkerStopped. Idempotent.
  void stop();
  [[nodiscard]] bool running() const { return running_.load(); }

  [[nodiscard]] const std::string &id() const { return id_; }
  [[nodiscard]] const std::string &project_path() const { return project_path_; }

  /// Oldest messages are evicted beyond max_messages. Ids must be unique and non-empty.
  [[nodiscard]] Status append_message(Message message);
  /// Appends in order, as one mailbox request.
  [[nodiscard]] Status append_messages(std::vector<Message> messages);
  [[nodiscard]] Status replace_todos(std::vector<Todo> todos);

  /// limit == nullopt returns everything from offset on.
  [[nodiscard]] Result<MessagePage> get_messages(std::size_t offset,
                                                 std::optional<std::size_t> limit);
  [[nodiscard]] Result<std::vector<Message>> get_all_messages();
  [[nodiscard]] Result<std::vector<Todo>> get_todos();
  [[nodiscard]] Result<Session> session();

private:
  struct AppendMessages {
    using Reply = Status;
    std::vector<Message> messages;
    std::promise<Reply> reply;
  };
  struct ReplaceTodos {
    using Reply = Status;
    std::vector<Todo> todos;
    std::promise<Reply> reply;
  };
  struct GetMessages {
    using Reply = Result<MessagePage>;
    std::size_t offset = 0;
    std::optional<std::size_t> limit;
    std::promise<Reply> reply;
  };
  struct GetTodos {
    using Reply = Result<std::vector<Todo>>;
    std::promise<Reply> reply;
  };
  struct GetSession {
    using Reply = Result<Session>;
    std::promise<Reply> reply;
  };

  using Request = std::variant<AppendMessages, ReplaceTodos, GetMessages, GetTodos, GetSession>;

  template <typename Req> typename Req::Reply call(Req request);

  void run_loop();
  void handle(AppendMessages &request);
  void handle(ReplaceTodos &request);
  void handle(GetMessages &request);
  void handle(GetTodos &request);
  void handle(GetSession &request);
  void touch();

  const std::string id_;
  const std::string project_path_;
  WorkerOptions options_;

  // Worker-thread state.
  Session session_;
  std::deque<Message> messages_;
  std::unordered_set<std::string> message_ids_;
  std::vector<Todo> todos_;

  std::mutex mailbox_mutex_;
  std::condition_variable mailbox_cv_;
  std::deque<Request> mailbox_;
  bool stopping_ = false;
  std::atomic<bool> running_{false};
  std::mutex lifecycle_mutex_;
  std::thread thread_;
};

} // namespace cairn::sessions
