#include "test_framework.hpp"

#include "cairn/common/fs.hpp"
#include "cairn/common/json.hpp"
#include "cairn/common/result.hpp"
#include "cairn/common/time.hpp"
#include "cairn/common/toml.hpp"
#include "cairn/sessions/errors.hpp"
#include "tests/helpers/test_helpers.hpp"

#include <chrono>
#include <string>

void register_common_tests(std::vector<cairn::tests::TestCase> &tests) {
  using cairn::tests::require;
  namespace c = cairn::common;

  tests.push_back({"result_error_is_safe_on_success", [] {
                     const auto value = c::Result<int>::success(7);
                     require(value.ok() && value.value() == 7, "value");
                     require(value.error().empty(), "success carries an empty message");
                     const auto status = c::Result<void>::success();
                     require(status.ok() && status.error().empty(), "void success");

                     const auto typed = cairn::sessions::Result<int>::success(1);
                     require(typed.error().retry_after_seconds == 0, "typed success");
                     const auto failed = cairn::sessions::Status::failure(
                         cairn::sessions::Error(cairn::sessions::ErrorKind::RateLimited, 12));
                     require(!failed.ok() && failed.error() == cairn::sessions::ErrorKind::RateLimited &&
                                 failed.error().retry_after_seconds == 12,
                             "failure keeps its error");
                   }});

  tests.push_back({"json_parse_nested_document", [] {
                     auto parsed = c::parse_json(
                         R"({"a":[1,2.5,"x",true,null],"b":{"c":-7},"s":"line\nbreak é"})");
                     require(parsed.ok(), parsed.error());
                     const auto &doc = parsed.value();
                     require(doc.is_object(), "root should be an object");
                     const auto *a = doc.find("a");
                     require(a != nullptr && a->is_array(), "a should be an array");
                     require(a->as_array().size() == 5, "array size mismatch");
                     require(a->as_array()[0].is_integer(), "1 should parse as integer");
                     require(!a->as_array()[1].is_integer() && a->as_array()[1].is_number(),
                             "2.5 should parse as double");
                     require(a->as_array()[4].is_null(), "null mismatch");
                     require(doc.find("b")->find("c")->as_integer() == -7, "nested integer");
                     require(doc.find("s")->as_string() == "line\nbreak \xc3\xa9",
                             "escape decoding mismatch");
                   }});

  tests.push_back({"json_parse_rejects_malformed_input", [] {
                     require(!c::parse_json("").ok(), "empty document should fail");
                     require(!c::parse_json("{\"a\":1,}").ok(), "trailing comma should fail");
                     require(!c::parse_json("{\"a\":1} x").ok(), "trailing data should fail");
                     require(!c::parse_json("{\"a\":1,\"a\":2}").ok(), "duplicate keys should fail");
                     require(!c::parse_json("\"unterminated").ok(), "unterminated string");
                     require(!c::parse_json("[01]").ok(), "leading zero should fail");
                     require(!c::parse_json("{'a':1}").ok(), "single quotes should fail");
                   }});

  tests.push_back({"json_parse_enforces_depth_limit", [] {
                     std::string deep(100, '[');
                     deep += std::string(100, ']');
                     require(!c::parse_json(deep).ok(), "deep nesting should fail");
                     require(c::parse_json(deep, 200).ok(), "raised limit should accept");
                   }});

  tests.push_back({"json_canonical_encoding_sorts_keys", [] {
                     auto value = c::JsonValue::object();
                     value.set("zeta", c::JsonValue::integer(1));
                     value.set("alpha", c::JsonValue::number(1.0));
                     value.set("mid", c::JsonValue::string("q\"uote"));
                     require(c::to_canonical_json(value) ==
                                 R"({"alpha":1.0,"mid":"q\"uote","zeta":1})",
                             "canonical form mismatch: " + c::to_canonical_json(value));
                   }});

  tests.push_back({"json_canonical_encoding_is_stable_across_parse", [] {
                     const std::string text = R"({"b":[0.7,3],"a":{"y":false,"x":"\u0001"}})";
                     auto parsed = c::parse_json(text);
                     require(parsed.ok(), parsed.error());
                     const std::string once = c::to_canonical_json(parsed.value());
                     auto reparsed = c::parse_json(once);
                     require(reparsed.ok(), reparsed.error());
                     require(c::to_canonical_json(reparsed.value()) == once,
                             "canonical form should be a fixed point");
                     require(once.find("\\u0001") != std::string::npos,
                             "control characters should stay escaped");
                   }});

  tests.push_back({"toml_parse_sections_and_types", [] {
                     auto doc = c::parse_toml("# comment\n"
                                              "[persistence]\n"
                                              "sessions_dir = \"/tmp/x # not a comment\"\n"
                                              "max_sessions = 1_000\n"
                                              "auto_cleanup = true\n"
                                              "[defaults]\n"
                                              "temperature = 0.25 # trailing\n");
                     require(doc.ok(), doc.error());
                     const auto &d = doc.value();
                     require(d.get_string("persistence.sessions_dir") == "/tmp/x # not a comment",
                             "quoted hash should survive");
                     require(d.get_u64("persistence.max_sessions", 0) == 1000, "u64 mismatch");
                     require(d.get_bool("persistence.auto_cleanup", false), "bool mismatch");
                     require(d.get_double("defaults.temperature", 0.0) == 0.25, "double mismatch");
                     require(d.get_i64("missing", -3) == -3, "fallback mismatch");
                   }});

  tests.push_back({"toml_reports_bad_lines", [] {
                     require(!c::parse_toml("[unterminated\n").ok(), "bad header should fail");
                     require(!c::parse_toml("novalue\n").ok(), "missing '=' should fail");
                     require(!c::parse_toml("bad key = 1\n").ok(), "space in key should fail");
                     require(!c::parse_toml("a = 1\na = 2\n").ok(), "duplicate key should fail");
                   }});

  tests.push_back({"toml_unknown_keys_sorted", [] {
                     auto doc = c::parse_toml("b = 1\na = 2\nknown = 3\n");
                     require(doc.ok(), doc.error());
                     const auto unknown = doc.value().unknown_keys({"known"});
                     require(unknown.size() == 2 && unknown[0] == "a" && unknown[1] == "b",
                             "unknown keys mismatch");
                   }});

  tests.push_back({"time_iso8601_format_and_parse", [] {
                     const auto start = cairn::testing::ManualClock::default_start() +
                                        std::chrono::milliseconds(123);
                     const std::string text = c::format_iso8601(start);
                     require(text == "2024-06-01T12:00:00.123Z", "format mismatch: " + text);
                     const auto parsed = c::parse_iso8601(text);
                     require(parsed.has_value() && *parsed == start, "round trip mismatch");

                     const auto offset = c::parse_iso8601("2024-06-01T14:00:00+02:00");
                     require(offset.has_value() &&
                                 *offset == cairn::testing::ManualClock::default_start(),
                             "offset should normalise to UTC");
                   }});

  tests.push_back({"time_iso8601_rejects_invalid", [] {
                     require(!c::parse_iso8601("").has_value(), "empty");
                     require(!c::parse_iso8601("2024-02-30T00:00:00Z").has_value(), "Feb 30");
                     require(!c::parse_iso8601("2024-06-01 12:00:00Z").has_value(), "space");
                     require(!c::parse_iso8601("2024-06-01T12:00:00").has_value(), "no zone");
                     require(!c::parse_iso8601("2024-06-01T12:00:00Zjunk").has_value(), "junk");
                     require(!c::parse_iso8601("2024-13-01T12:00:00Z").has_value(), "month 13");
                   }});

  tests.push_back({"fs_path_helpers", [] {
                     require(c::trim("  x y \n") == "x y", "trim mismatch");
                     require(c::has_parent_traversal("/a/../b"), "traversal should be detected");
                     require(!c::has_parent_traversal("/a/..b/c"), "..b is not traversal");
                   }});

  tests.push_back({"fs_read_file_capped", [] {
                     cairn::testing::TempWorkspace ws;
                     ws.create_file("small.txt", "hello");
                     ws.create_file("big.txt", std::string(64, 'x'));
                     auto small = c::read_file_capped(ws.path() / "small.txt", 16);
                     require(small.ok() && small.value() == "hello", "small file mismatch");
                     auto big = c::read_file_capped(ws.path() / "big.txt", 16);
                     require(!big.ok() && big.error() == std::errc::file_too_large,
                             "oversized file should fail");
                     auto missing = c::read_file_capped(ws.path() / "missing.txt", 16);
                     require(!missing.ok() &&
                                 missing.error() == std::errc::no_such_file_or_directory,
                             "missing file should report ENOENT");
                   }});
}
