#pragma once

#include "cairn/common/json.hpp"
#include "cairn/common/time.hpp"
#include "cairn/sessions/conversation.hpp"
#include "cairn/sessions/errors.hpp"
#include "cairn/sessions/session.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace cairn::sessions {

inline constexpr std::int64_t SNAPSHOT_SCHEMA_VERSION = 1;
inline constexpr std::size_t MAX_SNAPSHOT_ID_CHARS = 128;

/// On-disk form of a closed session.
struct PersistedRecord {
  std::int64_t version = SNAPSHOT_SCHEMA_VERSION;
  std::string id;
  std::string name;
  std::string project_path;
  // String-keyed: provider, model, temperature, max_tokens. Unknown keys survive.
  common::JsonValue config = common::JsonValue::object();
  common::Timestamp created_at{};
  common::Timestamp updated_at{};
  common::Timestamp closed_at{};
  std::optional<common::Timestamp> last_resumed_at;
  std::vector<Message> conversation;
  std::vector<Todo> todos;
  std::optional<std::string> signature;
};

/// Snapshot file body split into the signed payload and its detached signature.
struct SnapshotEnvelope {
  std::string payload;
  std::optional<std::string> signature;
};

/// Letters, digits, '_' and '-', at most MAX_SNAPSHOT_ID_CHARS.
[[nodiscard]] bool is_valid_snapshot_id(const std::string &id);

[[nodiscard]] Result<PersistedRecord> make_record(const Session &session,
                                                  const std::vector<Message> &messages,
                                                  const std::vector<Todo> &todos,
                                                  common::Timestamp closed_at);

/// Canonical bytes of a new record: sorted keys, no whitespace. Fails with
/// InvalidMessage for a message without id or timestamp.
[[nodiscard]] Result<std::string> encode(const Session &session,
                                         const std::vector<Message> &messages,
                                         const std::vector<Todo> &todos,
                                         common::Timestamp closed_at);

/// Canonical encoding of every field except `signature`.
[[nodiscard]] std::string canonical_payload(const PersistedRecord &record);
[[nodiscard]] common::JsonValue to_json(const PersistedRecord &record);

/// Strict decode of a JSON record. The optional "signature" member is carried but not
/// checked here.
[[nodiscard]] Result<PersistedRecord> decode(const std::string &bytes);

/// Typed session; config keys that are missing fall back to SessionConfig defaults.
[[nodiscard]] Session to_session(const PersistedRecord &record);

/// File body with the signature as the leading member: {"signature":"...",<payload>}.
[[nodiscard]] std::string seal(const std::string &payload, const std::string &signature);

/// Inverse of seal(). Bodies that do not start with the signature member come back
/// whole with no signature (legacy files). A damaged leading member fails with
/// SignatureVerificationFailed.
[[nodiscard]] Result<SnapshotEnvelope> open_envelope(const std::string &raw);

} // namespace cairn::sessions
