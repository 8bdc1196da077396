#include "gardener/common/json_util.hpp"

#include <cctype>
#include <cstdio>

namespace gardener::common {

namespace {

std::size_t skip_ws(const std::string &text, std::size_t pos) {
  while (pos < text.size() && std::isspace(static_cast<unsigned char>(text[pos])) != 0) {
    ++pos;
  }
  return pos;
}

std::size_t find_string_end(const std::string &json, const std::size_t quote_pos) {
  bool escaped = false;
  for (std::size_t i = quote_pos + 1; i < json.size(); ++i) {
    const char ch = json[i];
    if (escaped) {
      escaped = false;
      continue;
    }
    if (ch == '\\') {
      escaped = true;
    } else if (ch == '"') {
      return i;
    }
  }
  return std::string::npos;
}

// Position of the first character of `field`'s value, or npos. Only keys that
// sit in key position (followed by ':') are accepted so that string values
// equal to a key name are not mistaken for it.
std::size_t find_value_start(const std::string &json, const std::string &field) {
  const std::string quoted = "\"" + field + "\"";
  std::size_t pos = 0;
  while ((pos = json.find(quoted, pos)) != std::string::npos) {
    const std::size_t after = skip_ws(json, pos + quoted.size());
    if (after < json.size() && json[after] == ':') {
      return skip_ws(json, after + 1);
    }
    pos += quoted.size();
  }
  return std::string::npos;
}

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
        std::snprintf(buffer, sizeof(buffer), "\\u%04x", static_cast<unsigned>(ch));
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
    case 'u': {
      // Only the control-character range json_escape emits is decoded.
      if (i + 4 < raw.size() && raw[i + 1] == '0' && raw[i + 2] == '0') {
        const int hi = hex_value(raw[i + 3]);
        const int lo = hex_value(raw[i + 4]);
        if (hi >= 0 && lo >= 0) {
          out.push_back(static_cast<char>(hi * 16 + lo));
          i += 4;
          break;
        }
      }
      out += "\\u";
      break;
    }
    default:
      out.push_back(next);
      break;
    }
  }
  return out;
}

std::string json_get_string(const std::string &json, const std::string &field) {
  const std::size_t start = find_value_start(json, field);
  if (start == std::string::npos || start >= json.size() || json[start] != '"') {
    return "";
  }
  const std::size_t end = find_string_end(json, start);
  if (end == std::string::npos) {
    return "";
  }
  return json_unescape(json.substr(start + 1, end - start - 1));
}

std::string json_get_number(const std::string &json, const std::string &field) {
  std::size_t pos = find_value_start(json, field);
  if (pos == std::string::npos || pos >= json.size() || json[pos] == '"') {
    return "";
  }
  const std::size_t start = pos;
  while (pos < json.size()) {
    const char ch = json[pos];
    if (ch == ',' || ch == '}' || ch == ']' || std::isspace(static_cast<unsigned char>(ch)) != 0) {
      break;
    }
    ++pos;
  }
  return json.substr(start, pos - start);
}

} // namespace gardener::common
