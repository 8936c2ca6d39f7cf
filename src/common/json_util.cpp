#include "liteagent/common/json_util.hpp"

#include <cctype>
#include <cstdint>
#include <cstdio>

namespace liteagent::common {

namespace {

constexpr std::size_t MAX_NESTING_DEPTH = 512;

int hex_value(const char ch) {
  if (ch >= '0' && ch <= '9') {
    return ch - '0';
  }
  if (ch >= 'a' && ch <= 'f') {
    return ch - 'a' + 10;
  }
  if (ch >= 'A' && ch <= 'F') {
    return ch - 'A' + 10;
  }
  return -1;
}

bool parse_hex4(const std::string &text, const std::size_t pos, std::uint32_t &out) {
  if (pos + 4 > text.size()) {
    return false;
  }
  out = 0;
  for (std::size_t i = pos; i < pos + 4; ++i) {
    const int value = hex_value(text[i]);
    if (value < 0) {
      return false;
    }
    out = (out << 4U) | static_cast<std::uint32_t>(value);
  }
  return true;
}

void append_utf8(std::string &out, const std::uint32_t code_point) {
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

std::size_t scan_string(const std::string &text, std::size_t pos) {
  if (pos >= text.size() || text[pos] != '"') {
    return std::string::npos;
  }
  ++pos;
  while (pos < text.size()) {
    const auto ch = static_cast<unsigned char>(text[pos]);
    if (ch == '"') {
      return pos + 1;
    }
    if (ch < 0x20) {
      return std::string::npos;
    }
    if (ch == '\\') {
      if (pos + 1 >= text.size()) {
        return std::string::npos;
      }
      const char esc = text[pos + 1];
      if (esc == 'u') {
        std::uint32_t unused = 0;
        if (!parse_hex4(text, pos + 2, unused)) {
          return std::string::npos;
        }
        pos += 6;
        continue;
      }
      if (esc != '"' && esc != '\\' && esc != '/' && esc != 'b' && esc != 'f' && esc != 'n' &&
          esc != 'r' && esc != 't') {
        return std::string::npos;
      }
      pos += 2;
      continue;
    }
    ++pos;
  }
  return std::string::npos;
}

std::size_t scan_digits(const std::string &text, std::size_t pos) {
  const std::size_t start = pos;
  while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos])) != 0) {
    ++pos;
  }
  return pos == start ? std::string::npos : pos;
}

std::size_t scan_number(const std::string &text, std::size_t pos) {
  if (pos < text.size() && text[pos] == '-') {
    ++pos;
  }
  if (pos >= text.size()) {
    return std::string::npos;
  }
  if (text[pos] == '0') {
    ++pos;
  } else {
    pos = scan_digits(text, pos);
    if (pos == std::string::npos) {
      return pos;
    }
  }
  if (pos < text.size() && text[pos] == '.') {
    pos = scan_digits(text, pos + 1);
    if (pos == std::string::npos) {
      return pos;
    }
  }
  if (pos < text.size() && (text[pos] == 'e' || text[pos] == 'E')) {
    ++pos;
    if (pos < text.size() && (text[pos] == '+' || text[pos] == '-')) {
      ++pos;
    }
    pos = scan_digits(text, pos);
  }
  return pos;
}

std::size_t scan_literal(const std::string &text, const std::size_t pos, const char *literal) {
  const std::string expected(literal);
  if (text.compare(pos, expected.size(), expected) != 0) {
    return std::string::npos;
  }
  return pos + expected.size();
}

std::size_t scan_value(const std::string &text, std::size_t pos, std::size_t depth);

std::size_t scan_object(const std::string &text, std::size_t pos, const std::size_t depth) {
  pos = json_skip_ws(text, pos + 1);
  if (pos < text.size() && text[pos] == '}') {
    return pos + 1;
  }
  while (pos < text.size()) {
    pos = scan_string(text, pos);
    if (pos == std::string::npos) {
      return pos;
    }
    pos = json_skip_ws(text, pos);
    if (pos >= text.size() || text[pos] != ':') {
      return std::string::npos;
    }
    pos = scan_value(text, pos + 1, depth + 1);
    if (pos == std::string::npos) {
      return pos;
    }
    pos = json_skip_ws(text, pos);
    if (pos >= text.size()) {
      return std::string::npos;
    }
    if (text[pos] == '}') {
      return pos + 1;
    }
    if (text[pos] != ',') {
      return std::string::npos;
    }
    pos = json_skip_ws(text, pos + 1);
  }
  return std::string::npos;
}

std::size_t scan_array(const std::string &text, std::size_t pos, const std::size_t depth) {
  pos = json_skip_ws(text, pos + 1);
  if (pos < text.size() && text[pos] == ']') {
    return pos + 1;
  }
  while (pos < text.size()) {
    pos = scan_value(text, pos, depth + 1);
    if (pos == std::string::npos) {
      return pos;
    }
    pos = json_skip_ws(text, pos);
    if (pos >= text.size()) {
      return std::string::npos;
    }
    if (text[pos] == ']') {
      return pos + 1;
    }
    if (text[pos] != ',') {
      return std::string::npos;
    }
    ++pos;
  }
  return std::string::npos;
}

std::size_t scan_value(const std::string &text, std::size_t pos, const std::size_t depth) {
  if (depth > MAX_NESTING_DEPTH) {
    return std::string::npos;
  }
  pos = json_skip_ws(text, pos);
  if (pos >= text.size()) {
    return std::string::npos;
  }
  switch (text[pos]) {
  case '{':
    return scan_object(text, pos, depth);
  case '[':
    return scan_array(text, pos, depth);
  case '"':
    return scan_string(text, pos);
  case 't':
    return scan_literal(text, pos, "true");
  case 'f':
    return scan_literal(text, pos, "false");
  case 'n':
    return scan_literal(text, pos, "null");
  default:
    break;
  }
  if (text[pos] == '-' || std::isdigit(static_cast<unsigned char>(text[pos])) != 0) {
    return scan_number(text, pos);
  }
  return std::string::npos;
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
    case '\b':
      escaped += "\\b";
      break;
    case '\f':
      escaped += "\\f";
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

std::string json_quote(const std::string &value) { return "\"" + json_escape(value) + "\""; }

std::string json_unescape(const std::string &raw) {
  std::string out;
  out.reserve(raw.size());
  for (std::size_t i = 0; i < raw.size(); ++i) {
    const char ch = raw[i];
    if (ch != '\\' || i + 1 >= raw.size()) {
      out.push_back(ch);
      continue;
    }
    const char esc = raw[++i];
    switch (esc) {
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
    case 'u': {
      std::uint32_t code = 0;
      if (!parse_hex4(raw, i + 1, code)) {
        out.push_back('u');
        break;
      }
      i += 4;
      if (code >= 0xD800 && code <= 0xDBFF && i + 2 < raw.size() && raw[i + 1] == '\\' &&
          raw[i + 2] == 'u') {
        std::uint32_t low = 0;
        if (parse_hex4(raw, i + 3, low) && low >= 0xDC00 && low <= 0xDFFF) {
          code = 0x10000 + ((code - 0xD800) << 10U) + (low - 0xDC00);
          i += 6;
        }
      }
      append_utf8(out, code);
      break;
    }
    default:
      out.push_back(esc);
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

std::size_t json_find_string_end(const std::string &json, std::size_t quote_pos) {
  bool escaped = false;
  for (std::size_t i = quote_pos + 1; i < json.size(); ++i) {
    const char ch = json[i];
    if (!escaped && ch == '"') {
      return i;
    }
    if (!escaped && ch == '\\') {
      escaped = true;
      continue;
    }
    escaped = false;
  }
  return std::string::npos;
}

std::size_t json_scan_value(const std::string &text, const std::size_t pos) {
  return scan_value(text, pos, 0);
}

bool json_is_valid(const std::string &text) {
  const auto end = json_scan_value(text, 0);
  return end != std::string::npos && json_skip_ws(text, end) == text.size();
}

Result<JsonRawMap> json_parse_object(const std::string &json) {
  const std::size_t start = json_skip_ws(json, 0);
  if (start >= json.size() || json[start] != '{') {
    return Result<JsonRawMap>::failure("expected a JSON object", ErrorKind::InvalidArgument);
  }
  const std::size_t end = json_scan_value(json, start);
  if (end == std::string::npos) {
    return Result<JsonRawMap>::failure("malformed JSON object", ErrorKind::InvalidArgument);
  }
  if (json_skip_ws(json, end) != json.size()) {
    return Result<JsonRawMap>::failure("unexpected trailing data after JSON object",
                                       ErrorKind::InvalidArgument);
  }

  // The object is known to be valid, so the member walk below cannot run off the end.
  JsonRawMap members;
  std::size_t pos = json_skip_ws(json, start + 1);
  while (pos < end && json[pos] != '}') {
    const std::size_t key_end = json_find_string_end(json, pos);
    std::string key = json_unescape(json.substr(pos + 1, key_end - pos - 1));
    pos = json_skip_ws(json, key_end + 1) + 1;
    const std::size_t value_start = json_skip_ws(json, pos);
    const std::size_t value_end = json_scan_value(json, value_start);
    members[std::move(key)] = json.substr(value_start, value_end - value_start);
    pos = json_skip_ws(json, value_end);
    if (json[pos] == ',') {
      pos = json_skip_ws(json, pos + 1);
    }
  }
  return Result<JsonRawMap>::success(std::move(members));
}

std::optional<std::string> json_decode_string(const std::string &raw) {
  if (raw.size() < 2 || raw.front() != '"' || raw.back() != '"') {
    return std::nullopt;
  }
  return json_unescape(raw.substr(1, raw.size() - 2));
}

std::optional<bool> json_decode_bool(const std::string &raw) {
  if (raw == "true") {
    return true;
  }
  if (raw == "false") {
    return false;
  }
  return std::nullopt;
}

} // namespace liteagent::common
