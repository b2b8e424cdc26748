#include "cairn/sessions/worker.hpp"

#include "cairn/observability/global.hpp"

#include <algorithm>
#include <system_error>
#include <type_traits>

namespace cairn::sessions {

SessionWorker::SessionWorker(Session session, WorkerOptions options)
    : id_(session.id), project_path_(session.project_path), options_(std::move(options)),
      session_(std::move(session)) {
  if (options_.max_messages == 0) {
    options_.max_messages = 1;
  }
  if (!options_.clock) {
    options_.clock = common::system_now;
  }
}

SessionWorker::~SessionWorker() { stop(); }

Status SessionWorker::start() {
  std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);
  if (thread_.joinable()) {
    return Status::success();
  }
  {
    std::lock_guard<std::mutex> lock(mailbox_mutex_);
    if (stopping_) {
      return Status::failure(ErrorKind::WorkerStopped);
    }
  }
  try {
    running_ = true;
    thread_ = std::thread([this]() { run_loop(); });
  } catch (const std::system_error &err) {
    running_ = false;
    observability::log_error("worker", std::string("thread start failed: ") + err.what());
    return Status::failure(ErrorKind::IoError);
  }
  return Status::success();
}

void SessionWorker::stop() {
  std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);
  {
    std::lock_guard<std::mutex> lock(mailbox_mutex_);
    stopping_ = true;
  }
  mailbox_cv_.notify_all();
  if (thread_.joinable()) {
    thread_.join();
  }
  running_ = false;
}

template <typename Req> typename Req::Reply SessionWorker::call(Req request) {
  auto future = request.reply.get_future();
  {
    std::lock_guard<std::mutex> lock(mailbox_mutex_);
    if (stopping_ || !running_) {
      return Req::Reply::failure(ErrorKind::WorkerStopped);
    }
    mailbox_.emplace_back(std::move(request));
  }
  mailbox_cv_.notify_one();
  return future.get();
}

void SessionWorker::run_loop() {
  while (true) {
    Request request;
    {
      std::unique_lock<std::mutex> lock(mailbox_mutex_);
      mailbox_cv_.wait(lock, [this]() { return stopping_ || !mailbox_.empty(); });
      if (stopping_) {
        break;
      }
      request = std::move(mailbox_.front());
      mailbox_.pop_front();
    }
    std::visit([this](auto &req) { handle(req); }, request);
  }

  std::deque<Request> pending;
  {
    std::lock_guard<std::mutex> lock(mailbox_mutex_);
    pending.swap(mailbox_);
  }
  for (auto &request : pending) {
    std::visit(
        [](auto &req) {
          using Reply = typename std::decay_t<decltype(req)>::Reply;
          req.reply.set_value(Reply::failure(ErrorKind::WorkerStopped));
        },
        request);
  }
}

void SessionWorker::touch() {
  session_.updated_at = std::max(options_.clock(), session_.created_at);
}

void SessionWorker::handle(AppendMessages &request) {
  std::unordered_set<std::string> incoming;
  for (const auto &message : request.messages) {
    if (message.id.empty() || message_ids_.count(message.id) != 0 ||
        !incoming.insert(message.id).second) {
      request.reply.set_value(Status::failure(ErrorKind::InvalidMessage));
      return;
    }
  }

  for (auto &message : request.messages) {
    if (message.timestamp == common::Timestamp{}) {
      message.timestamp = options_.clock();
    }
    message_ids_.insert(message.id);
    messages_.push_back(std::move(message));
    while (messages_.size() > options_.max_messages) {
      message_ids_.erase(messages_.front().id);
      messages_.pop_front();
    }
  }
  touch();
  request.reply.set_value(Status::success());
}

void SessionWorker::handle(ReplaceTodos &request) {
  todos_ = std::move(request.todos);
  touch();
  request.reply.set_value(Status::success());
}

void SessionWorker::handle(GetMessages &request) {
  MessagePage page;
  page.total = messages_.size();
  if (request.offset < messages_.size()) {
    const std::size_t available = messages_.size() - request.offset;
    const std::size_t count =
        request.limit.has_value() ? std::min(*request.limit, available) : available;
    const auto first = messages_.begin() + static_cast<std::ptrdiff_t>(request.offset);
    page.items.assign(first, first + static_cast<std::ptrdiff_t>(count));
    page.has_more = request.offset + count < messages_.size();
  }
  request.reply.set_value(Result<MessagePage>::success(std::move(page)));
}

void SessionWorker::handle(GetTodos &request) {
  request.reply.set_value(Result<std::vector<Todo>>::success(todos_));
}

void SessionWorker::handle(GetSession &request) {
  request.reply.set_value(Result<Session>::success(session_));
}

Status SessionWorker::append_message(Message message) {
  std::vector<Message> batch;
  batch.push_back(std::move(message));
  return append_messages(std::move(batch));
}

Status SessionWorker::append_messages(std::vector<Message> messages) {
  AppendMessages request;
  request.messages = std::move(messages);
  return call(std::move(request));
}

Status SessionWorker::replace_todos(std::vector<Todo> todos) {
  ReplaceTodos request;
  request.todos = std::move(todos);
  return call(std::move(request));
}

Result<MessagePage> SessionWorker::get_messages(const std::size_t offset,
                                                const std::optional<std::size_t> limit) {
  GetMessages request;
  request.offset = offset;
  request.limit = limit;
  return call(std::move(request));
}

Result<std::vector<Message>> SessionWorker::get_all_messages() {
  auto page = get_messages(0, std::nullopt);
  if (!page.ok()) {
    return Result<std::vector<Message>>::failure(page.error());
  }
  return Result<std::vector<Message>>::success(std::move(page.value().items));
}

Result<std::vector<Todo>> SessionWorker::get_todos() { return call(GetTodos{}); }

Result<Session> SessionWorker::session() { return call(GetSession{}); }

} // namespace cairn::sessions
