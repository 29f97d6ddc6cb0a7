#include "orbitcore/common/json_util.hpp"

#include "orbitcore/common/fs.hpp"

#include <cctype>
#include <cstdio>

namespace orbitcore::common {

namespace {

void append_utf8(std::string &out, const unsigned int code_point) {
  if (code_point < 0x80) {
    out.push_back(static_cast<char>(code_point));
  } else if (code_point < 0x800) {
    out.push_back(static_cast<char>(0xC0 | (code_point >> 6)));
    out.push_back(static_cast<char>(0x80 | (code_point & 0x3F)));
  } else if (code_point < 0x10000) {
    out.push_back(static_cast<char>(0xE0 | (code_point >> 12)));
    out.push_back(static_cast<char>(0x80 | ((code_point >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (code_point & 0x3F)));
  } else {
    out.push_back(static_cast<char>(0xF0 | (code_point >> 18)));
    out.push_back(static_cast<char>(0x80 | ((code_point >> 12) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | ((code_point >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (code_point & 0x3F)));
  }
}

std::optional<unsigned int> parse_hex4(const std::string &raw, const std::size_t pos) {
  if (pos + 4 > raw.size()) {
    return std::nullopt;
  }
  unsigned int value = 0;
  for (std::size_t i = pos; i < pos + 4; ++i) {
    const char ch = raw[i];
    value <<= 4;
    if (ch >= '0' && ch <= '9') {
      value |= static_cast<unsigned int>(ch - '0');
    } else if (ch >= 'a' && ch <= 'f') {
      value |= static_cast<unsigned int>(ch - 'a' + 10);
    } else if (ch >= 'A' && ch <= 'F') {
      value |= static_cast<unsigned int>(ch - 'A' + 10);
    } else {
      return std::nullopt;
    }
  }
  return value;
}

// Returns the position one past the end of the value starting at pos.
std::size_t find_value_end(const std::string &json, const std::size_t pos) {
  if (pos >= json.size()) {
    return std::string::npos;
  }
  const char ch = json[pos];
  if (ch == '"') {
    const auto end = json_find_string_end(json, pos);
    return end == std::string::npos ? end : end + 1;
  }
  if (ch == '{' || ch == '[') {
    const auto end = json_find_matching_token(json, pos, ch, ch == '{' ? '}' : ']');
    return end == std::string::npos ? end : end + 1;
  }
  std::size_t end = pos;
  while (end < json.size() && json[end] != ',' && json[end] != '}' && json[end] != ']' &&
         std::isspace(static_cast<unsigned char>(json[end])) == 0) {
    ++end;
  }
  return end == pos ? std::string::npos : end;
}

} // namespace

std::string json_escape(const std::string &value) {
  std::string escaped;
  escaped.reserve(value.size() + 8);
  for (const char ch : value) {
    switch (ch) {
    case '"':
      escaped += "\\\"";
      break;
    case '\\':
      escaped += "\\\\";
      break;
    case '\n':
      escaped += "\\n";
      break;
    case '\r':
      escaped += "\\r";
      break;
    case '\t':
      escaped += "\\t";
      break;
    default:
      if (static_cast<unsigned char>(ch) < 0x20) {
        char buffer[8];
        std::snprintf(buffer, sizeof(buffer), "\\u%04x", static_cast<unsigned int>(ch));
        escaped += buffer;
      } else {
        escaped.push_back(ch);
      }
      break;
    }
  }
  return escaped;
}

std::string json_unescape(const std::string &raw) {
  std::string out;
  out.reserve(raw.size());
  for (std::size_t i = 0; i < raw.size(); ++i) {
    const char ch = raw[i];
    if (ch != '\\' || i + 1 >= raw.size()) {
      out.push_back(ch);
      continue;
    }
    const char next = raw[++i];
    switch (next) {
    case 'n':
      out.push_back('\n');
      break;
    case 'r':
      out.push_back('\r');
      break;
    case 't':
      out.push_back('\t');
      break;
    case 'b':
      out.push_back('\b');
      break;
    case 'f':
      out.push_back('\f');
      break;
    case 'u':
      if (auto code = parse_hex4(raw, i + 1); code.has_value()) {
        i += 4;
        unsigned int code_point = *code;
        if (code_point >= 0xD800 && code_point <= 0xDBFF) {
          // High surrogate: combine with a following \uDC00-\uDFFF escape.
          std::optional<unsigned int> low;
          if (i + 2 < raw.size() && raw[i + 1] == '\\' && raw[i + 2] == 'u') {
            low = parse_hex4(raw, i + 3);
          }
          if (low.has_value() && *low >= 0xDC00 && *low <= 0xDFFF) {
            code_point = 0x10000 + ((code_point - 0xD800) << 10) + (*low - 0xDC00);
            i += 6;
          } else {
            code_point = 0xFFFD;
          }
        } else if (code_point >= 0xDC00 && code_point <= 0xDFFF) {
          code_point = 0xFFFD;
        }
        append_utf8(out, code_point);
      } else {
        out.push_back(next);
      }
      break;
    default:
      out.push_back(next);
      break;
    }
  }
  return out;
}

std::size_t json_skip_ws(const std::string &text, std::size_t pos) {
  while (pos < text.size() && std::isspace(static_cast<unsigned char>(text[pos])) != 0) {
    ++pos;
  }
  return pos;
}

std::size_t json_find_string_end(const std::string &json, const std::size_t quote_pos) {
  bool escaped = false;
  for (std::size_t i = quote_pos + 1; i < json.size(); ++i) {
    const char ch = json[i];
    if (!escaped && ch == '"') {
      return i;
    }
    escaped = !escaped && ch == '\\';
  }
  return std::string::npos;
}

std::size_t json_find_matching_token(const std::string &json, const std::size_t open_pos,
                                      const char open_ch, const char close_ch) {
  if (open_pos >= json.size() || json[open_pos] != open_ch) {
    return std::string::npos;
  }
  std::size_t depth = 0;
  for (std::size_t i = open_pos; i < json.size(); ++i) {
    const char ch = json[i];
    if (ch == '"') {
      const auto end = json_find_string_end(json, i);
      if (end == std::string::npos) {
        return std::string::npos;
      }
      i = end;
      continue;
    }
    if (ch == open_ch) {
      ++depth;
    } else if (ch == close_ch) {
      if (--depth == 0) {
        return i;
      }
    }
  }
  return std::string::npos;
}

std::optional<JsonFields> json_parse_object(const std::string &json) {
  const std::string text = trim(json);
  if (text.size() < 2 || text.front() != '{' || text.back() != '}') {
    return std::nullopt;
  }

  JsonFields fields;
  std::size_t pos = 1;
  while (true) {
    pos = json_skip_ws(text, pos);
    if (pos >= text.size()) {
      return std::nullopt;
    }
    if (text[pos] == '}') {
      break;
    }
    if (text[pos] != '"') {
      return std::nullopt;
    }
    const auto key_end = json_find_string_end(text, pos);
    if (key_end == std::string::npos) {
      return std::nullopt;
    }
    std::string key = json_unescape(text.substr(pos + 1, key_end - pos - 1));

    pos = json_skip_ws(text, key_end + 1);
    if (pos >= text.size() || text[pos] != ':') {
      return std::nullopt;
    }
    pos = json_skip_ws(text, pos + 1);
    const auto value_end = find_value_end(text, pos);
    if (value_end == std::string::npos) {
      return std::nullopt;
    }
    fields[std::move(key)] = text.substr(pos, value_end - pos);

    pos = json_skip_ws(text, value_end);
    if (pos < text.size() && text[pos] == ',') {
      ++pos;
    }
  }
  return fields;
}

std::optional<std::vector<std::string>> json_split_array(const std::string &json) {
  const std::string text = trim(json);
  if (text.size() < 2 || text.front() != '[' || text.back() != ']') {
    return std::nullopt;
  }

  std::vector<std::string> elements;
  std::size_t pos = 1;
  while (true) {
    pos = json_skip_ws(text, pos);
    if (pos >= text.size()) {
      return std::nullopt;
    }
    if (text[pos] == ']') {
      break;
    }
    const auto end = find_value_end(text, pos);
    if (end == std::string::npos) {
      return std::nullopt;
    }
    elements.push_back(text.substr(pos, end - pos));
    pos = json_skip_ws(text, end);
    if (pos < text.size() && text[pos] == ',') {
      ++pos;
    }
  }
  return elements;
}

bool json_is_null(const std::string &raw) { return trim(raw) == "null"; }

std::optional<std::string> json_as_string(const std::string &raw) {
  const std::string text = trim(raw);
  if (text.size() < 2 || text.front() != '"' || json_find_string_end(text, 0) != text.size() - 1) {
    return std::nullopt;
  }
  return json_unescape(text.substr(1, text.size() - 2));
}

std::optional<std::uint64_t> json_as_u64(const std::string &raw) { return parse_u64(raw); }

std::optional<bool> json_as_bool(const std::string &raw) {
  const std::string text = trim(raw);
  if (text == "true") {
    return true;
  }
  if (text == "false") {
    return false;
  }
  return std::nullopt;
}

std::optional<std::string> json_string_field(const JsonFields &fields, const std::string &key) {
  const auto it = fields.find(key);
  if (it == fields.end()) {
    return std::nullopt;
  }
  return json_as_string(it->second);
}

std::optional<std::uint64_t> json_u64_field(const JsonFields &fields, const std::string &key) {
  const auto it = fields.find(key);
  if (it == fields.end()) {
    return std::nullopt;
  }
  return json_as_u64(it->second);
}

std::optional<bool> json_bool_field(const JsonFields &fields, const std::string &key) {
  const auto it = fields.find(key);
  if (it == fields.end()) {
    return std::nullopt;
  }
  return json_as_bool(it->second);
}

std::optional<std::string> json_raw_field(const JsonFields &fields, const std::string &key) {
  const auto it = fields.find(key);
  if (it == fields.end() || json_is_null(it->second)) {
    return std::nullopt;
  }
  return it->second;
}

std::vector<std::string> json_string_array_field(const JsonFields &fields,
                                                 const std::string &key) {
  std::vector<std::string> out;
  const auto raw = json_raw_field(fields, key);
  if (!raw.has_value()) {
    return out;
  }
  const auto elements = json_split_array(*raw);
  if (!elements.has_value()) {
    return out;
  }
  for (const auto &element : *elements) {
    if (auto value = json_as_string(element); value.has_value()) {
      out.push_back(std::move(*value));
    }
  }
  return out;
}

void JsonObjectWriter::begin_member(const std::string &key) {
  if (!body_.empty()) {
    body_.push_back(',');
  }
  body_ += json_quote(key);
  body_.push_back(':');
}

JsonObjectWriter &JsonObjectWriter::add(const std::string &key, const std::string &value) {
  begin_member(key);
  body_ += json_quote(value);
  return *this;
}

JsonObjectWriter &JsonObjectWriter::add(const std::string &key, const char *value) {
  return add(key, std::string(value == nullptr ? "" : value));
}

JsonObjectWriter &JsonObjectWriter::add(const std::string &key, const std::uint64_t value) {
  begin_member(key);
  body_ += std::to_string(value);
  return *this;
}

JsonObjectWriter &JsonObjectWriter::add_bool(const std::string &key, const bool value) {
  begin_member(key);
  body_ += value ? "true" : "false";
  return *this;
}

JsonObjectWriter &JsonObjectWriter::add_null(const std::string &key) {
  begin_member(key);
  body_ += "null";
  return *this;
}

JsonObjectWriter &JsonObjectWriter::add_raw(const std::string &key, const std::string &raw_json) {
  begin_member(key);
  body_ += raw_json;
  return *this;
}

JsonObjectWriter &JsonObjectWriter::add_string_array(const std::string &key,
                                                     const std::vector<std::string> &values) {
  std::vector<std::string> quoted;
  quoted.reserve(values.size());
  for (const auto &value : values) {
    quoted.push_back(json_quote(value));
  }
  return add_raw(key, json_array(quoted));
}

JsonObjectWriter &JsonObjectWriter::add_optional(const std::string &key,
                                                 const std::optional<std::string> &value) {
  if (value.has_value()) {
    add(key, *value);
  }
  return *this;
}

JsonObjectWriter &JsonObjectWriter::add_optional(const std::string &key,
                                                 const std::optional<std::uint64_t> &value) {
  if (value.has_value()) {
    add(key, *value);
  }
  return *this;
}

JsonObjectWriter &JsonObjectWriter::add_optional_bool(const std::string &key,
                                                      const std::optional<bool> &value) {
  if (value.has_value()) {
    add_bool(key, *value);
  }
  return *this;
}

JsonObjectWriter &
JsonObjectWriter::add_nullable(const std::string &key,
                               const std::optional<std::optional<std::string>> &value) {
  if (!value.has_value()) {
    return *this;
  }
  if (value->has_value()) {
    return add(key, **value);
  }
  return add_null(key);
}

std::string JsonObjectWriter::str() const { return "{" + body_ + "}"; }

std::string json_quote(const std::string &value) { return "\"" + json_escape(value) + "\""; }

std::string json_array(const std::vector<std::string> &raw_elements) {
  std::string out = "[";
  for (std::size_t i = 0; i < raw_elements.size(); ++i) {
    if (i > 0) {
      out.push_back(',');
    }
    out += raw_elements[i];
  }
  out.push_back(']');
  return out;
}

} // namespace orbitcore::common
