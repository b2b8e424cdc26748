#include "cairn/sessions/snapshot_codec.hpp"

#include "cairn/common/fs.hpp"
#include "cairn/observability/global.hpp"

#include <algorithm>
#include <array>
#include <limits>
#include <utility>

namespace cairn::sessions {

namespace {

using common::JsonValue;

constexpr const char *SIGNATURE_PREFIX = "{\"signature\":\"";

const std::array<const char *, 10> REQUIRED_FIELDS = {
    "version",    "id",         "name",      "project_path", "config",
    "created_at", "updated_at", "closed_at", "conversation", "todos"};

const std::array<const char *, 2> OPTIONAL_FIELDS = {"last_resumed_at", "signature"};

bool is_known_field(const std::string &key) {
  const auto matches = [&key](const char *name) { return key == name; };
  return std::any_of(REQUIRED_FIELDS.begin(), REQUIRED_FIELDS.end(), matches) ||
         std::any_of(OPTIONAL_FIELDS.begin(), OPTIONAL_FIELDS.end(), matches);
}

bool is_base64_char(const char ch) {
  return (ch >= 'A' && ch <= 'Z') || (ch >= 'a' && ch <= 'z') || (ch >= '0' && ch <= '9') ||
         ch == '+' || ch == '/' || ch == '=';
}

JsonValue config_to_json(const SessionConfig &config) {
  JsonValue out = JsonValue::object();
  out.set("provider", JsonValue::string(config.provider));
  out.set("model", JsonValue::string(config.model));
  out.set("temperature", JsonValue::number(config.temperature));
  out.set("max_tokens", JsonValue::integer(config.max_tokens));
  return out;
}

JsonValue message_to_json(const Message &message) {
  JsonValue out = JsonValue::object();
  out.set("id", JsonValue::string(message.id));
  out.set("role", JsonValue::string(std::string(to_string(message.role))));
  out.set("content", JsonValue::string(message.content));
  out.set("timestamp", JsonValue::string(common::format_iso8601(message.timestamp)));
  return out;
}

JsonValue todo_to_json(const Todo &todo) {
  JsonValue out = JsonValue::object();
  out.set("content", JsonValue::string(todo.content));
  out.set("status", JsonValue::string(std::string(to_string(todo.status))));
  out.set("active_form", JsonValue::string(todo.active_form));
  return out;
}

Result<std::string> require_string(const JsonValue &object, const char *key) {
  const JsonValue *value = object.find(key);
  if (value == nullptr) {
    observability::log_debug("codec", std::string("missing field: ") + key);
    return Result<std::string>::failure(ErrorKind::MissingFields);
  }
  if (!value->is_string()) {
    observability::log_debug("codec", std::string("field is not a string: ") + key);
    return Result<std::string>::failure(ErrorKind::InvalidField);
  }
  return Result<std::string>::success(value->as_string());
}

Result<common::Timestamp> require_timestamp(const JsonValue &object, const char *key) {
  const auto text = require_string(object, key);
  if (!text.ok()) {
    return Result<common::Timestamp>::failure(text.error());
  }
  const auto parsed = common::parse_iso8601(text.value());
  if (!parsed.has_value()) {
    observability::log_debug("codec", std::string("unparseable timestamp in ") + key + ": " +
                                          text.value());
    return Result<common::Timestamp>::failure(ErrorKind::InvalidTimestamp);
  }
  return Result<common::Timestamp>::success(*parsed);
}

Result<Message> decode_message(const JsonValue &value) {
  if (!value.is_object()) {
    return Result<Message>::failure(ErrorKind::InvalidField);
  }
  const auto id = require_string(value, "id");
  if (!id.ok()) {
    return Result<Message>::failure(id.error());
  }
  if (id.value().empty()) {
    return Result<Message>::failure(ErrorKind::InvalidMessage);
  }
  const auto role_text = require_string(value, "role");
  if (!role_text.ok()) {
    return Result<Message>::failure(role_text.error());
  }
  const auto role = parse_role(role_text.value());
  if (!role.has_value()) {
    observability::log_debug("codec", "unknown role: " + role_text.value());
    return Result<Message>::failure(ErrorKind::UnknownRole);
  }
  const auto content = require_string(value, "content");
  if (!content.ok()) {
    return Result<Message>::failure(content.error());
  }
  const auto timestamp = require_timestamp(value, "timestamp");
  if (!timestamp.ok()) {
    return Result<Message>::failure(timestamp.error());
  }
  return Result<Message>::success(Message{.id = id.value(),
                                          .role = *role,
                                          .content = content.value(),
                                          .timestamp = timestamp.value()});
}

Result<Todo> decode_todo(const JsonValue &value) {
  if (!value.is_object()) {
    return Result<Todo>::failure(ErrorKind::InvalidField);
  }
  const auto content = require_string(value, "content");
  if (!content.ok()) {
    return Result<Todo>::failure(content.error());
  }
  const auto status_text = require_string(value, "status");
  if (!status_text.ok()) {
    return Result<Todo>::failure(status_text.error());
  }
  const auto status = parse_todo_status(status_text.value());
  if (!status.has_value()) {
    observability::log_debug("codec", "unknown todo status: " + status_text.value());
    return Result<Todo>::failure(ErrorKind::UnknownStatus);
  }
  std::string active_form;
  if (const JsonValue *form = value.find("active_form"); form != nullptr) {
    if (!form->is_string()) {
      return Result<Todo>::failure(ErrorKind::InvalidField);
    }
    active_form = form->as_string();
  }
  return Result<Todo>::success(
      Todo{.content = content.value(), .status = *status, .active_form = active_form});
}

Status validate_version(const JsonValue &value) {
  if (!value.is_integer()) {
    observability::log_debug("codec", "version is not an integer");
    return Status::failure(ErrorKind::InvalidVersion);
  }
  const std::int64_t version = value.as_integer();
  if (version < 1) {
    observability::log_debug("codec", "invalid version: " + std::to_string(version));
    return Status::failure(ErrorKind::InvalidVersion);
  }
  if (version > SNAPSHOT_SCHEMA_VERSION) {
    observability::log_debug("codec", "unsupported version: " + std::to_string(version));
    return Status::failure(ErrorKind::UnsupportedVersion);
  }
  return Status::success();
}

Status validate_config_object(const JsonValue &config) {
  if (!config.is_object()) {
    return Status::failure(ErrorKind::InvalidField);
  }
  for (const char *key : {"provider", "model"}) {
    if (const JsonValue *value = config.find(key); value != nullptr && !value->is_string()) {
      observability::log_debug("codec", std::string("config.") + key + " is not a string");
      return Status::failure(ErrorKind::InvalidField);
    }
  }
  if (const JsonValue *value = config.find("temperature");
      value != nullptr && !value->is_number()) {
    return Status::failure(ErrorKind::InvalidField);
  }
  if (const JsonValue *value = config.find("max_tokens");
      value != nullptr && (!value->is_integer() || value->as_integer() <= 0)) {
    return Status::failure(ErrorKind::InvalidField);
  }
  return Status::success();
}

} // namespace

bool is_valid_snapshot_id(const std::string &id) {
  if (id.empty() || id.size() > MAX_SNAPSHOT_ID_CHARS) {
    return false;
  }
  return std::all_of(id.begin(), id.end(), [](const char ch) {
    return (ch >= 'a' && ch <= 'z') || (ch >= 'A' && ch <= 'Z') || (ch >= '0' && ch <= '9') ||
           ch == '_' || ch == '-';
  });
}

Result<PersistedRecord> make_record(const Session &session, const std::vector<Message> &messages,
                                    const std::vector<Todo> &todos,
                                    const common::Timestamp closed_at) {
  for (const auto &message : messages) {
    if (message.id.empty() || message.timestamp == common::Timestamp{}) {
      return Result<PersistedRecord>::failure(ErrorKind::InvalidMessage);
    }
  }
  if (!is_valid_snapshot_id(session.id)) {
    return Result<PersistedRecord>::failure(ErrorKind::InvalidSessionId);
  }

  PersistedRecord record;
  record.id = session.id;
  record.name = session.name;
  record.project_path = session.project_path;
  record.config = config_to_json(session.config);
  record.created_at = session.created_at;
  record.updated_at = session.updated_at;
  record.closed_at = closed_at;
  record.last_resumed_at = session.last_resumed_at;
  record.conversation = messages;
  record.todos = todos;
  return Result<PersistedRecord>::success(std::move(record));
}

Result<std::string> encode(const Session &session, const std::vector<Message> &messages,
                           const std::vector<Todo> &todos, const common::Timestamp closed_at) {
  const auto record = make_record(session, messages, todos, closed_at);
  if (!record.ok()) {
    return Result<std::string>::failure(record.error());
  }
  return Result<std::string>::success(canonical_payload(record.value()));
}

JsonValue to_json(const PersistedRecord &record) {
  JsonValue out = JsonValue::object();
  out.set("version", JsonValue::integer(record.version));
  out.set("id", JsonValue::string(record.id));
  out.set("name", JsonValue::string(record.name));
  out.set("project_path", JsonValue::string(record.project_path));
  out.set("config", record.config.is_object() ? record.config : JsonValue::object());
  out.set("created_at", JsonValue::string(common::format_iso8601(record.created_at)));
  out.set("updated_at", JsonValue::string(common::format_iso8601(record.updated_at)));
  out.set("closed_at", JsonValue::string(common::format_iso8601(record.closed_at)));
  if (record.last_resumed_at.has_value()) {
    out.set("last_resumed_at",
            JsonValue::string(common::format_iso8601(*record.last_resumed_at)));
  }

  JsonValue conversation = JsonValue::array();
  for (const auto &message : record.conversation) {
    conversation.push_back(message_to_json(message));
  }
  out.set("conversation", std::move(conversation));

  JsonValue todos = JsonValue::array();
  for (const auto &todo : record.todos) {
    todos.push_back(todo_to_json(todo));
  }
  out.set("todos", std::move(todos));
  return out;
}

std::string canonical_payload(const PersistedRecord &record) {
  return common::to_canonical_json(to_json(record));
}

Result<PersistedRecord> decode(const std::string &bytes) {
  using R = Result<PersistedRecord>;

  const auto parsed = common::parse_json(bytes);
  if (!parsed.ok()) {
    observability::log_debug("codec", "json parse failed: " + parsed.error());
    return R::failure(ErrorKind::DecodeError);
  }
  const JsonValue &root = parsed.value();
  if (!root.is_object()) {
    return R::failure(ErrorKind::DecodeError);
  }

  for (const char *field : REQUIRED_FIELDS) {
    if (root.find(field) == nullptr) {
      observability::log_debug("codec", std::string("missing field: ") + field);
      return R::failure(ErrorKind::MissingFields);
    }
  }
  for (const auto &[key, value] : root.as_object()) {
    if (!is_known_field(key)) {
      observability::log_debug("codec", "unexpected field: " + key);
      return R::failure(ErrorKind::InvalidField);
    }
  }

  if (const auto version = validate_version(*root.find("version")); !version.ok()) {
    return R::failure(version.error());
  }

  PersistedRecord record;
  record.version = root.find("version")->as_integer();

  const auto id = require_string(root, "id");
  if (!id.ok()) {
    return R::failure(id.error());
  }
  if (!is_valid_snapshot_id(id.value())) {
    return R::failure(ErrorKind::InvalidField);
  }
  record.id = id.value();

  const auto name = require_string(root, "name");
  if (!name.ok()) {
    return R::failure(name.error());
  }
  record.name = name.value();

  const auto project_path = require_string(root, "project_path");
  if (!project_path.ok()) {
    return R::failure(project_path.error());
  }
  record.project_path = project_path.value();

  const JsonValue &config = *root.find("config");
  if (const auto status = validate_config_object(config); !status.ok()) {
    return R::failure(status.error());
  }
  record.config = config;

  const std::array<std::pair<const char *, common::Timestamp *>, 3> timestamps = {{
      {"created_at", &record.created_at},
      {"updated_at", &record.updated_at},
      {"closed_at", &record.closed_at},
  }};
  for (const auto &[key, target] : timestamps) {
    const auto timestamp = require_timestamp(root, key);
    if (!timestamp.ok()) {
      return R::failure(timestamp.error());
    }
    *target = timestamp.value();
  }
  if (root.find("last_resumed_at") != nullptr) {
    const auto resumed = require_timestamp(root, "last_resumed_at");
    if (!resumed.ok()) {
      return R::failure(resumed.error());
    }
    record.last_resumed_at = resumed.value();
  }

  const JsonValue &conversation = *root.find("conversation");
  if (!conversation.is_array()) {
    return R::failure(ErrorKind::InvalidField);
  }
  for (const auto &item : conversation.as_array()) {
    auto message = decode_message(item);
    if (!message.ok()) {
      return R::failure(message.error());
    }
    record.conversation.push_back(std::move(message.value()));
  }

  const JsonValue &todos = *root.find("todos");
  if (!todos.is_array()) {
    return R::failure(ErrorKind::InvalidField);
  }
  for (const auto &item : todos.as_array()) {
    auto todo = decode_todo(item);
    if (!todo.ok()) {
      return R::failure(todo.error());
    }
    record.todos.push_back(std::move(todo.value()));
  }

  if (const JsonValue *signature = root.find("signature"); signature != nullptr) {
    if (!signature->is_string()) {
      return R::failure(ErrorKind::InvalidField);
    }
    record.signature = signature->as_string();
  }

  return R::success(std::move(record));
}

Session to_session(const PersistedRecord &record) {
  Session session;
  session.id = record.id;
  session.name = record.name;
  session.project_path = record.project_path;
  session.created_at = record.created_at;
  session.updated_at = record.updated_at;
  session.last_resumed_at = record.last_resumed_at;

  const JsonValue &config = record.config;
  if (const JsonValue *value = config.find("provider"); value != nullptr && value->is_string()) {
    session.config.provider = value->as_string();
  }
  if (const JsonValue *value = config.find("model"); value != nullptr && value->is_string()) {
    session.config.model = value->as_string();
  }
  if (const JsonValue *value = config.find("temperature");
      value != nullptr && value->is_number()) {
    session.config.temperature = value->as_double();
  }
  if (const JsonValue *value = config.find("max_tokens");
      value != nullptr && value->is_integer() && value->as_integer() > 0 &&
      value->as_integer() <= std::numeric_limits<std::uint32_t>::max()) {
    session.config.max_tokens = static_cast<std::uint32_t>(value->as_integer());
  }
  return session;
}

std::string seal(const std::string &payload, const std::string &signature) {
  // payload is a canonical object with at least one member.
  return std::string(SIGNATURE_PREFIX) + signature + "\"," + payload.substr(1);
}

Result<SnapshotEnvelope> open_envelope(const std::string &raw) {
  if (!common::starts_with(raw, SIGNATURE_PREFIX)) {
    return Result<SnapshotEnvelope>::success(SnapshotEnvelope{.payload = raw});
  }

  const std::size_t sig_start = std::char_traits<char>::length(SIGNATURE_PREFIX);
  std::size_t pos = sig_start;
  while (pos < raw.size() && is_base64_char(raw[pos])) {
    ++pos;
  }
  if (pos == sig_start || pos + 1 >= raw.size() || raw[pos] != '"' || raw[pos + 1] != ',') {
    return Result<SnapshotEnvelope>::failure(ErrorKind::SignatureVerificationFailed);
  }

  SnapshotEnvelope envelope;
  envelope.signature = raw.substr(sig_start, pos - sig_start);
  envelope.payload = "{" + raw.substr(pos + 2);
  return Result<SnapshotEnvelope>::success(std::move(envelope));
}

} // namespace cairn::sessions
