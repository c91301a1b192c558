#include "memroute/common/json_util.hpp"

#include <cctype>
#include <cstdlib>

namespace memroute::common {

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
    if (escaped) {
      escaped = false;
    } else if (json[i] == '\\') {
      escaped = true;
    } else if (json[i] == '"') {
      return i;
    }
  }
  return std::string::npos;
}

std::size_t find_matching(const std::string &json, const std::size_t open_pos,
                          const char open_ch, const char close_ch) {
  std::size_t depth = 0;
  for (std::size_t i = open_pos; i < json.size(); ++i) {
    const char ch = json[i];
    if (ch == '"') {
      i = find_string_end(json, i);
      if (i == std::string::npos) {
        return std::string::npos;
      }
    } else if (ch == open_ch) {
      ++depth;
    } else if (ch == close_ch && --depth == 0) {
      return i;
    }
  }
  return std::string::npos;
}

// Position of the first byte of the value for `"field":`, or npos.
std::size_t value_start(const std::string &json, const std::string &field) {
  const std::string quoted = "\"" + field + "\"";
  std::size_t key_pos = json.find(quoted);
  while (key_pos != std::string::npos) {
    const std::size_t colon = skip_ws(json, key_pos + quoted.size());
    if (colon < json.size() && json[colon] == ':') {
      return skip_ws(json, colon + 1);
    }
    key_pos = json.find(quoted, key_pos + 1);
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
    default:
      escaped.push_back(ch);
      break;
    }
  }
  return escaped;
}

std::string json_unescape(const std::string &raw) {
  std::string out;
  out.reserve(raw.size());
  for (std::size_t i = 0; i < raw.size(); ++i) {
    if (raw[i] != '\\' || i + 1 >= raw.size()) {
      out.push_back(raw[i]);
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
    default:
      out.push_back(next);
      break;
    }
  }
  return out;
}

std::string json_get_string(const std::string &json, const std::string &field) {
  const std::size_t pos = value_start(json, field);
  if (pos >= json.size() || json[pos] != '"') {
    return "";
  }
  const std::size_t end = find_string_end(json, pos);
  if (end == std::string::npos) {
    return "";
  }
  return json_unescape(json.substr(pos + 1, end - pos - 1));
}

std::string json_get_number(const std::string &json, const std::string &field) {
  const std::size_t start = value_start(json, field);
  if (start >= json.size()) {
    return "";
  }
  std::size_t pos = start;
  while (pos < json.size() && (std::isdigit(static_cast<unsigned char>(json[pos])) != 0 ||
                               json[pos] == '-' || json[pos] == '+' || json[pos] == '.' ||
                               json[pos] == 'e' || json[pos] == 'E')) {
    ++pos;
  }
  return json.substr(start, pos - start);
}

std::string json_get_array(const std::string &json, const std::string &field) {
  const std::size_t pos = value_start(json, field);
  if (pos >= json.size() || json[pos] != '[') {
    return "";
  }
  const std::size_t end = find_matching(json, pos, '[', ']');
  if (end == std::string::npos) {
    return "";
  }
  return json.substr(pos, end - pos + 1);
}

bool json_parse_number_array(const std::string &array_json, std::vector<float> &out) {
  out.clear();
  if (array_json.size() < 2 || array_json.front() != '[' || array_json.back() != ']') {
    return false;
  }
  const char *cursor = array_json.c_str() + 1;
  const char *end = array_json.c_str() + array_json.size() - 1;
  while (cursor < end) {
    while (cursor < end && (std::isspace(static_cast<unsigned char>(*cursor)) != 0 || *cursor == ',')) {
      ++cursor;
    }
    if (cursor >= end) {
      break;
    }
    char *parsed_end = nullptr;
    const float value = std::strtof(cursor, &parsed_end);
    if (parsed_end == cursor) {
      return false;
    }
    out.push_back(value);
    cursor = parsed_end;
  }
  return true;
}

} // namespace memroute::common
