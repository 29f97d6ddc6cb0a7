#include "test_framework.hpp"

#include "orbitcore/common/fs.hpp"
#include "orbitcore/common/ids.hpp"
#include "orbitcore/common/json_util.hpp"
#include "orbitcore/common/time.hpp"
#include "orbitcore/common/toml.hpp"

#include <cstdlib>
#include <set>

void register_common_tests(std::vector<orbitcore::tests::TestCase> &tests) {
  using orbitcore::tests::require;
  namespace common = orbitcore::common;

  tests.push_back({"common_json_object_parsing", [] {
                     const auto fields = common::json_parse_object(
                         R"({"type":"x","n":42,"flag":true,"nested":{"a":[1,2]},)"
                         R"("text":"line\nbreak \"q\"","none":null})");
                     require(fields.has_value(), "object should parse");
                     require(common::json_string_field(*fields, "type") ==
                                 std::optional<std::string>("x"),
                             "string field");
                     require(common::json_u64_field(*fields, "n") == std::optional<std::uint64_t>(42),
                             "number field");
                     require(common::json_bool_field(*fields, "flag") == std::optional<bool>(true),
                             "bool field");
                     require(common::json_raw_field(*fields, "nested") ==
                                 std::optional<std::string>(R"({"a":[1,2]})"),
                             "nested kept raw");
                     require(common::json_string_field(*fields, "text") ==
                                 std::optional<std::string>("line\nbreak \"q\""),
                             "escapes decoded");
                     require(common::json_is_null(*common::json_raw_field(*fields, "none")),
                             "null detected");
                     require(!common::json_string_field(*fields, "n").has_value(),
                             "mistyped field is empty");
                     require(!common::json_parse_object("[1,2]").has_value(), "arrays rejected");
                     require(!common::json_parse_object(R"({"a":)").has_value(),
                             "truncated rejected");
                   }});

  tests.push_back({"common_json_writer_round_trips", [] {
                     const auto text = common::JsonObjectWriter()
                                           .add("name", "tab\there")
                                           .add("count", std::uint64_t{7})
                                           .add_bool("ok", false)
                                           .add_optional("missing", std::optional<std::string>{})
                                           .add_nullable("cleared",
                                                         std::optional<std::optional<std::string>>(
                                                             std::optional<std::string>{}))
                                           .add_string_array("tags", {"a", "b"})
                                           .str();
                     const auto fields = common::json_parse_object(text);
                     require(fields.has_value(), "writer output parses");
                     require(common::json_string_field(*fields, "name") ==
                                 std::optional<std::string>("tab\there"),
                             "escaped string survives");
                     require(common::json_u64_field(*fields, "count") ==
                                 std::optional<std::uint64_t>(7),
                             "number survives");
                     require(!fields->contains("missing"), "absent optional skipped");
                     require(common::json_is_null(fields->at("cleared")), "inner empty is null");
                     require(common::json_string_array_field(*fields, "tags") ==
                                 std::vector<std::string>({"a", "b"}),
                             "array survives");
                     const auto split = common::json_split_array(R"([{"a":1}, "x,y", 3])");
                     require(split.has_value() && split->size() == 3, "array split");
                   }});

  tests.push_back({"common_json_unescape_decodes_surrogate_pairs", [] {
                     require(common::json_unescape("\\ud83d\\ude00") == "\xF0\x9F\x98\x80",
                             "pair becomes one 4-byte sequence");
                     require(common::json_unescape("caf\\u00e9") == "caf\xC3\xA9", "2-byte");
                     require(common::json_unescape("\\u20ac") == "\xE2\x82\xAC", "3-byte");
                     require(common::json_unescape("x\\ud83dy") == "x\xEF\xBF\xBDy",
                             "lone high surrogate replaced");
                     require(common::json_unescape("\\ude00") == "\xEF\xBF\xBD",
                             "lone low surrogate replaced");
                     const auto fields =
                         common::json_parse_object(R"({"content":"ok \ud83d\ude00"})");
                     require(fields.has_value() &&
                                 common::json_string_field(*fields, "content") ==
                                     std::optional<std::string>("ok \xF0\x9F\x98\x80"),
                             "string fields decode pairs");
                   }});

  tests.push_back({"common_toml_sections_and_comments", [] {
                     auto doc = common::parse_toml(R"(
top = "value" # trailing
[registry]
shards = 8
name = "with # hash"
enabled = true
)");
                     require(doc.ok(), "toml should parse");
                     require(doc.value().get_string("top") == "value", "top-level key");
                     require(doc.value().get_u64("registry.shards", 0) == 8, "section key");
                     require(doc.value().get_string("registry.name") == "with # hash",
                             "hash inside quotes kept");
                     require(doc.value().get_bool("registry.enabled", false), "bool value");
                     require(doc.value().get_u64("registry.missing", 5) == 5, "fallback");
                     require(!common::parse_toml("[]\n").ok(), "empty section rejected");
                     require(!common::parse_toml("just words\n").ok(), "missing '=' rejected");
                   }});

  tests.push_back({"common_rfc3339_round_trip", [] {
                     const auto parsed = common::parse_rfc3339("2026-01-02T03:04:05.678Z");
                     require(parsed.has_value(), "timestamp parses");
                     require(common::to_rfc3339(*parsed) == "2026-01-02T03:04:05.678Z",
                             "formatting is stable");
                     const auto later = common::parse_rfc3339("2026-01-02T03:05:05.678Z");
                     require(*later - *parsed == std::chrono::seconds(60), "difference in seconds");
                     require(!common::parse_rfc3339("yesterday").has_value(), "garbage rejected");
                     require(common::parse_rfc3339(common::now_rfc3339()).has_value(),
                             "now parses");
                   }});

  tests.push_back({"common_ids_are_unique_and_shaped", [] {
                     std::set<std::string> seen;
                     for (int i = 0; i < 50; ++i) {
                       auto id = common::new_session_id();
                       require(id.ok(), "id generation should succeed");
                       require(id.value().size() == 36, "8-4-4-4-12 length");
                       require(id.value()[8] == '-' && id.value()[13] == '-' &&
                                   id.value()[18] == '-' && id.value()[23] == '-',
                               "dash positions");
                       seen.insert(id.value());
                     }
                     require(seen.size() == 50, "ids should not repeat");
                     require(common::sha256_hex("abc") ==
                                 "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad",
                             "sha256 of abc");
                   }});

  tests.push_back({"common_string_and_path_helpers", [] {
                     require(common::trim("  x \n") == "x", "trim");
                     require(common::to_lower("MiXeD") == "mixed", "lower");
                     require(common::split("a,b,,c", ',').size() >= 3, "split");
                     require(common::parse_u64("42") == std::optional<std::uint64_t>(42), "u64");
                     require(!common::parse_u64("-1").has_value(), "negative rejected");
                     require(!common::parse_u64("12abc").has_value(), "junk rejected");
                     setenv("ORBITCORE_TEST_DIR", "/opt/data", 1);
                     require(common::expand_path("${ORBITCORE_TEST_DIR}/db") == "/opt/data/db",
                             "env expanded");
                     unsetenv("ORBITCORE_TEST_DIR");
                   }});
}
