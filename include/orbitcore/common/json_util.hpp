#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace orbitcore::common {

/// Escape a string for embedding inside a JSON string literal.
[[nodiscard]] std::string json_escape(const std::string &value);

/// Unescape the body of a JSON string literal (no surrounding quotes).
[[nodiscard]] std::string json_unescape(const std::string &raw);

/// Skip whitespace starting at pos, returning the first non-whitespace position.
[[nodiscard]] std::size_t json_skip_ws(const std::string &text, std::size_t pos);

/// Find the closing quote of a JSON string starting at quote_pos.
[[nodiscard]] std::size_t json_find_string_end(const std::string &json, std::size_t quote_pos);

/// Find matching bracket/brace for nested JSON structures.
[[nodiscard]] std::size_t json_find_matching_token(const std::string &json, std::size_t open_pos,
                                                    char open_ch, char close_ch);

/// Top-level members of a JSON object, keyed by name. Values are kept as raw
/// JSON text (strings keep their quotes) so nested documents can be parsed
/// again without ambiguity.
using JsonFields = std::unordered_map<std::string, std::string>;

[[nodiscard]] std::optional<JsonFields> json_parse_object(const std::string &json);

/// Split a JSON array into raw element texts.
[[nodiscard]] std::optional<std::vector<std::string>> json_split_array(const std::string &json);

[[nodiscard]] bool json_is_null(const std::string &raw);
[[nodiscard]] std::optional<std::string> json_as_string(const std::string &raw);
[[nodiscard]] std::optional<std::uint64_t> json_as_u64(const std::string &raw);
[[nodiscard]] std::optional<bool> json_as_bool(const std::string &raw);

/// Field lookups on a parsed object; missing or mistyped fields yield nullopt.
[[nodiscard]] std::optional<std::string> json_string_field(const JsonFields &fields,
                                                           const std::string &key);
[[nodiscard]] std::optional<std::uint64_t> json_u64_field(const JsonFields &fields,
                                                          const std::string &key);
[[nodiscard]] std::optional<bool> json_bool_field(const JsonFields &fields,
                                                  const std::string &key);
[[nodiscard]] std::optional<std::string> json_raw_field(const JsonFields &fields,
                                                        const std::string &key);
[[nodiscard]] std::vector<std::string> json_string_array_field(const JsonFields &fields,
                                                               const std::string &key);

/// Incremental writer for a single JSON object.
class JsonObjectWriter {
public:
  JsonObjectWriter &add(const std::string &key, const std::string &value);
  JsonObjectWriter &add(const std::string &key, const char *value);
  JsonObjectWriter &add(const std::string &key, std::uint64_t value);
  JsonObjectWriter &add_bool(const std::string &key, bool value);
  JsonObjectWriter &add_null(const std::string &key);
  JsonObjectWriter &add_raw(const std::string &key, const std::string &raw_json);
  JsonObjectWriter &add_string_array(const std::string &key,
                                     const std::vector<std::string> &values);

  /// Writes the member only when the value is present.
  JsonObjectWriter &add_optional(const std::string &key, const std::optional<std::string> &value);
  JsonObjectWriter &add_optional(const std::string &key,
                                 const std::optional<std::uint64_t> &value);
  JsonObjectWriter &add_optional_bool(const std::string &key, const std::optional<bool> &value);

  /// Absent outer optional skips the member; an empty inner optional writes null.
  JsonObjectWriter &add_nullable(const std::string &key,
                                 const std::optional<std::optional<std::string>> &value);

  [[nodiscard]] std::string str() const;

private:
  void begin_member(const std::string &key);

  std::string body_;
};

[[nodiscard]] std::string json_quote(const std::string &value);
[[nodiscard]] std::string json_array(const std::vector<std::string> &raw_elements);

} // namespace orbitcore::common
