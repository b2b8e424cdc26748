#include "test_framework.hpp"

#include "cairn/common/fs.hpp"
#include "cairn/common/json.hpp"
#include "cairn/sessions/snapshot_codec.hpp"
#include "tests/helpers/test_helpers.hpp"

#include <chrono>
#include <functional>
#include <stdexcept>

namespace {

namespace s = cairn::sessions;
namespace c = cairn::common;

s::Session fixture_session() {
  s::Session session;
  session.id = "0f8b6a52-4a0e-4c1b-9a39-6f1d2a7c9e01";
  session.name = "codec";
  session.project_path = "/home/dev/project";
  session.config.model = "claude-test";
  session.config.temperature = 0.5;
  session.created_at = cairn::testing::ManualClock::default_start();
  session.updated_at = session.created_at + std::chrono::minutes(5);
  return session;
}

std::string fixture_payload() {
  const auto start = cairn::testing::ManualClock::default_start();
  auto encoded = s::encode(fixture_session(), cairn::testing::sample_messages(3, start),
                           cairn::testing::sample_todos(), start + std::chrono::hours(1));
  if (!encoded.ok()) {
    throw std::runtime_error("fixture encode failed");
  }
  return encoded.value();
}

// Re-encodes the fixture after applying `edit` to its JSON form.
std::string mutated_payload(const std::function<void(c::JsonValue &)> &edit) {
  auto parsed = c::parse_json(fixture_payload());
  if (!parsed.ok()) {
    throw std::runtime_error("fixture parse failed");
  }
  c::JsonValue root = parsed.value();
  edit(root);
  return c::to_canonical_json(root);
}

c::JsonValue edited_message(const std::string &key, c::JsonValue value) {
  auto message = c::JsonValue::object();
  message.set("id", c::JsonValue::string("m1"));
  message.set("role", c::JsonValue::string("user"));
  message.set("content", c::JsonValue::string("hi"));
  message.set("timestamp", c::JsonValue::string("2024-06-01T12:00:00.000Z"));
  message.set(key, std::move(value));
  auto conversation = c::JsonValue::array();
  conversation.push_back(std::move(message));
  return conversation;
}

void require_decode_error(const std::string &bytes, const s::ErrorKind expected,
                          const std::string &label) {
  const auto decoded = s::decode(bytes);
  cairn::tests::require(!decoded.ok(), label + ": decode should fail");
  cairn::tests::require(decoded.error() == expected,
                        label + ": got " + std::string(s::to_string(decoded.error().kind)));
}

} // namespace

void register_codec_tests(std::vector<cairn::tests::TestCase> &tests) {
  using cairn::tests::require;

  tests.push_back({"codec_encode_decode_preserves_record", [] {
                     const auto start = cairn::testing::ManualClock::default_start();
                     const auto session = fixture_session();
                     const auto messages = cairn::testing::sample_messages(3, start);
                     const auto todos = cairn::testing::sample_todos();
                     auto decoded = s::decode(fixture_payload());
                     require(decoded.ok(), "decode failed");
                     const auto &record = decoded.value();
                     require(record.version == s::SNAPSHOT_SCHEMA_VERSION, "version");
                     require(record.id == session.id, "id");
                     require(record.name == "codec", "name");
                     require(record.project_path == session.project_path, "project_path");
                     require(record.created_at == session.created_at, "created_at");
                     require(record.updated_at == session.updated_at, "updated_at");
                     require(record.closed_at == start + std::chrono::hours(1), "closed_at");
                     require(!record.last_resumed_at.has_value(), "last_resumed_at");
                     require(record.conversation == messages, "conversation");
                     require(record.todos == todos, "todos");
                     require(!record.signature.has_value(), "no signature in payload");

                     const auto restored = s::to_session(record);
                     require(restored.config == session.config, "config round trip");
                   }});

  tests.push_back({"codec_payload_is_canonical", [] {
                     const std::string payload = fixture_payload();
                     require(payload == fixture_payload(), "encoding should be deterministic");
                     require(c::starts_with(payload, "{\"closed_at\":"),
                             "keys should be sorted");
                     require(payload.find('\n') == std::string::npos, "no whitespace");
                     auto decoded = s::decode(payload);
                     require(decoded.ok(), "decode failed");
                     require(s::canonical_payload(decoded.value()) == payload,
                             "canonical payload should be reproducible from the record");
                   }});

  tests.push_back({"codec_unknown_config_keys_survive", [] {
                     const auto payload = mutated_payload([](c::JsonValue &root) {
                       auto config = *root.find("config");
                       config.set("top_p", c::JsonValue::number(0.9));
                       config.erase("model");
                       root.set("config", config);
                     });
                     auto decoded = s::decode(payload);
                     require(decoded.ok(), "decode failed");
                     require(decoded.value().config.find("top_p") != nullptr,
                             "unknown config key should be kept");
                     require(s::canonical_payload(decoded.value()) == payload,
                             "re-encoding should keep the extra key");
                     require(s::to_session(decoded.value()).config.model ==
                                 s::SessionConfig{}.model,
                             "missing model falls back to default");
                   }});

  tests.push_back({"codec_seal_and_open_envelope", [] {
                     const std::string payload = fixture_payload();
                     const std::string sealed = s::seal(payload, "c2lnbmF0dXJl");
                     require(c::starts_with(sealed, "{\"signature\":\"c2lnbmF0dXJl\","),
                             "signature should lead");
                     auto opened = s::open_envelope(sealed);
                     require(opened.ok(), "open failed");
                     require(opened.value().payload == payload, "payload bytes preserved");
                     require(opened.value().signature == std::optional<std::string>("c2lnbmF0dXJl"),
                             "signature extracted");

                     auto decoded = s::decode(sealed);
                     require(decoded.ok(), "sealed body is still a valid record");
                     require(decoded.value().signature.has_value(), "signature carried");
                   }});

  tests.push_back({"codec_open_envelope_legacy_and_damaged", [] {
                     const std::string payload = fixture_payload();
                     auto legacy = s::open_envelope(payload);
                     require(legacy.ok() && !legacy.value().signature.has_value(),
                             "unsigned body is legacy");
                     require(legacy.value().payload == payload, "legacy payload whole");

                     auto damaged = s::open_envelope("{\"signature\":\"abc$def\",\"id\":1}");
                     require(!damaged.ok() &&
                                 damaged.error() == s::ErrorKind::SignatureVerificationFailed,
                             "bad signature characters");
                     auto empty = s::open_envelope("{\"signature\":\"\",\"id\":1}");
                     require(!empty.ok(), "empty signature");
                     auto truncated = s::open_envelope("{\"signature\":\"abc");
                     require(!truncated.ok(), "truncated envelope");
                   }});

  tests.push_back({"codec_decode_rejects_malformed_documents", [] {
                     require_decode_error("not json", s::ErrorKind::DecodeError, "garbage");
                     require_decode_error("[]", s::ErrorKind::DecodeError, "array root");
                     require_decode_error("", s::ErrorKind::DecodeError, "empty");
                     require_decode_error(
                         mutated_payload([](c::JsonValue &r) { r.erase("todos"); }),
                         s::ErrorKind::MissingFields, "missing todos");
                     require_decode_error(mutated_payload([](c::JsonValue &r) {
                                            r.set("extra", c::JsonValue::integer(1));
                                          }),
                                          s::ErrorKind::InvalidField, "unknown field");
                     require_decode_error(mutated_payload([](c::JsonValue &r) {
                                            r.set("name", c::JsonValue::integer(1));
                                          }),
                                          s::ErrorKind::InvalidField, "name type");
                     require_decode_error(mutated_payload([](c::JsonValue &r) {
                                            r.set("id", c::JsonValue::string("../etc/passwd"));
                                          }),
                                          s::ErrorKind::InvalidField, "path-like id");
                   }});

  tests.push_back({"codec_decode_checks_version", [] {
                     require_decode_error(mutated_payload([](c::JsonValue &r) {
                                            r.set("version", c::JsonValue::string("1"));
                                          }),
                                          s::ErrorKind::InvalidVersion, "string version");
                     require_decode_error(mutated_payload([](c::JsonValue &r) {
                                            r.set("version", c::JsonValue::integer(0));
                                          }),
                                          s::ErrorKind::InvalidVersion, "zero version");
                     require_decode_error(mutated_payload([](c::JsonValue &r) {
                                            r.set("version", c::JsonValue::integer(2));
                                          }),
                                          s::ErrorKind::UnsupportedVersion, "future version");
                   }});

  tests.push_back({"codec_decode_checks_entries", [] {
                     require_decode_error(mutated_payload([](c::JsonValue &r) {
                                            r.set("conversation",
                                                  edited_message("role", c::JsonValue::string("tool")));
                                          }),
                                          s::ErrorKind::UnknownRole, "unknown role");
                     require_decode_error(mutated_payload([](c::JsonValue &r) {
                                            r.set("conversation",
                                                  edited_message("id", c::JsonValue::string("")));
                                          }),
                                          s::ErrorKind::InvalidMessage, "empty message id");
                     require_decode_error(
                         mutated_payload([](c::JsonValue &r) {
                           r.set("conversation",
                                 edited_message("timestamp", c::JsonValue::string("yesterday")));
                         }),
                         s::ErrorKind::InvalidTimestamp, "message timestamp");
                     require_decode_error(mutated_payload([](c::JsonValue &r) {
                                            r.set("closed_at", c::JsonValue::string("2024-13-01"));
                                          }),
                                          s::ErrorKind::InvalidTimestamp, "closed_at");
                     require_decode_error(mutated_payload([](c::JsonValue &r) {
                                            auto todo = c::JsonValue::object();
                                            todo.set("content", c::JsonValue::string("x"));
                                            todo.set("status", c::JsonValue::string("blocked"));
                                            auto todos = c::JsonValue::array();
                                            todos.push_back(todo);
                                            r.set("todos", todos);
                                          }),
                                          s::ErrorKind::UnknownStatus, "todo status");
                   }});

  tests.push_back({"codec_todo_active_form_optional", [] {
                     const auto payload = mutated_payload([](c::JsonValue &r) {
                       auto todo = c::JsonValue::object();
                       todo.set("content", c::JsonValue::string("x"));
                       todo.set("status", c::JsonValue::string("completed"));
                       auto todos = c::JsonValue::array();
                       todos.push_back(todo);
                       r.set("todos", todos);
                     });
                     auto decoded = s::decode(payload);
                     require(decoded.ok(), "decode failed");
                     require(decoded.value().todos.size() == 1 &&
                                 decoded.value().todos[0].status == s::TodoStatus::Completed &&
                                 decoded.value().todos[0].active_form.empty(),
                             "todo mismatch");
                   }});

  tests.push_back({"codec_decode_truncations_never_throw", [] {
                     const std::string payload = fixture_payload();
                     for (std::size_t len = 0; len < payload.size(); len += 7) {
                       const auto decoded = s::decode(payload.substr(0, len));
                       require(!decoded.ok(), "truncated payload should not decode");
                     }
                   }});

  tests.push_back({"codec_make_record_validates_inputs", [] {
                     const auto start = cairn::testing::ManualClock::default_start();
                     auto messages = cairn::testing::sample_messages(1, start);
                     messages[0].timestamp = c::Timestamp{};
                     auto record = s::make_record(fixture_session(), messages, {}, start);
                     require(!record.ok() && record.error() == s::ErrorKind::InvalidMessage,
                             "epoch timestamp should be rejected");

                     auto bad_id = fixture_session();
                     bad_id.id = "has space";
                     record = s::make_record(bad_id, {}, {}, start);
                     require(!record.ok() && record.error() == s::ErrorKind::InvalidSessionId,
                             "invalid id should be rejected");

                     require(s::is_valid_snapshot_id("abc_DEF-123"), "valid id");
                     require(!s::is_valid_snapshot_id(std::string(129, 'a')), "too long id");
                     require(!s::is_valid_snapshot_id("a/b"), "slash in id");
                   }});
}
