#include "cairn/sessions/conversation.hpp"

namespace cairn::sessions {

std::string_view to_string(const Role role) {
  switch (role) {
  case Role::User:
    return "user";
  case Role::Assistant:
    return "assistant";
  case Role::System:
    return "system";
  }
  return "user";
}

std::optional<Role> parse_role(const std::string_view text) {
  if (text == "user") {
    return Role::User;
  }
  if (text == "assistant") {
    return Role::Assistant;
  }
  if (text == "system") {
    return Role::System;
  }
  return std::nullopt;
}

std::string_view to_string(const TodoStatus status) {
  switch (status) {
  case TodoStatus::Pending:
    return "pending";
  case TodoStatus::InProgress:
    return "in_progress";
  case TodoStatus::Completed:
    return "completed";
  }
  return "pending";
}

std::optional<TodoStatus> parse_todo_status(const std::string_view text) {
  if (text == "pending") {
    return TodoStatus::Pending;
  }
  if (text == "in_progress") {
    return TodoStatus::InProgress;
  }
  if (text == "completed") {
    return TodoStatus::Completed;
  }
  return std::nullopt;
}

} // namespace cairn::sessions
