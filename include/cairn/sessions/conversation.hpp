#pragma once

#include "cairn/common/time.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace cairn::sessions {

enum class Role { User, Assistant, System };

struct Message {
  std::string id;
  Role role = Role::User;
  std::string content;
  common::Timestamp timestamp{};

  bool operator==(const Message &) const = default;
};

enum class TodoStatus { Pending, InProgress, Completed };

struct Todo {
  std::string content;
  TodoStatus status = TodoStatus::Pending;
  std::string active_form;

  bool operator==(const Todo &) const = default;
};

/// One slice of a conversation plus enough context to request the next one.
struct MessagePage {
  std::vector<Message> items;
  std::size_t total = 0;
  bool has_more = false;
};

[[nodiscard]] std::string_view to_string(Role role);
[[nodiscard]] std::optional<Role> parse_role(std::string_view text);

[[nodiscard]] std::string_view to_string(TodoStatus status);
[[nodiscard]] std::optional<TodoStatus> parse_todo_status(std::string_view text);

} // namespace cairn::sessions
