#include "memroute/common/toml.hpp"

#include "memroute/common/fs.hpp"

#include <algorithm>
#include <charconv>
#include <cstdlib>
#include <sstream>

namespace memroute::common {

namespace {

bool is_unescaped_quote(const std::string &text, std::size_t index) {
  return text[index] == '"' && (index == 0 || text[index - 1] != '\\');
}

std::string strip_comment(const std::string &line) {
  bool in_quotes = false;
  for (std::size_t i = 0; i < line.size(); ++i) {
    if (is_unescaped_quote(line, i)) {
      in_quotes = !in_quotes;
    } else if (!in_quotes && line[i] == '#') {
      return line.substr(0, i);
    }
  }
  return line;
}

std::string unquote(const std::string &raw) {
  std::string value = trim(raw);
  if (value.size() < 2 || value.front() != '"' || value.back() != '"') {
    return value;
  }
  std::string out;
  out.reserve(value.size() - 2);
  for (std::size_t i = 1; i + 1 < value.size(); ++i) {
    if (value[i] == '\\' && i + 2 < value.size()) {
      ++i;
    }
    out.push_back(value[i]);
  }
  return out;
}

std::vector<std::string> split_array(const std::string &body) {
  std::vector<std::string> elements;
  std::string current;
  bool in_quotes = false;
  for (std::size_t i = 0; i < body.size(); ++i) {
    if (is_unescaped_quote(body, i)) {
      in_quotes = !in_quotes;
    }
    if (!in_quotes && body[i] == ',') {
      elements.push_back(trim(current));
      current.clear();
      continue;
    }
    current.push_back(body[i]);
  }
  if (!trim(current).empty()) {
    elements.push_back(trim(current));
  }
  return elements;
}

// Arrays may span several lines; keep reading until brackets balance.
bool array_is_open(const std::string &value) {
  bool in_quotes = false;
  int depth = 0;
  for (std::size_t i = 0; i < value.size(); ++i) {
    if (is_unescaped_quote(value, i)) {
      in_quotes = !in_quotes;
    } else if (!in_quotes && value[i] == '[') {
      ++depth;
    } else if (!in_quotes && value[i] == ']') {
      --depth;
    }
  }
  return depth > 0;
}

} // namespace

bool TomlDocument::has(const std::string &key) const { return values.contains(key); }

std::string TomlDocument::get_string(const std::string &key, const std::string &fallback) const {
  const auto it = values.find(key);
  return it == values.end() ? fallback : unquote(it->second);
}

bool TomlDocument::get_bool(const std::string &key, const bool fallback) const {
  const auto it = values.find(key);
  if (it == values.end()) {
    return fallback;
  }
  const std::string normalized = to_lower(trim(it->second));
  if (normalized == "true") {
    return true;
  }
  if (normalized == "false") {
    return false;
  }
  return fallback;
}

std::uint64_t TomlDocument::get_u64(const std::string &key, const std::uint64_t fallback) const {
  const auto it = values.find(key);
  if (it == values.end()) {
    return fallback;
  }
  const std::string normalized = trim(it->second);
  std::uint64_t parsed = 0;
  const char *last = normalized.data() + normalized.size();
  const auto [ptr, ec] = std::from_chars(normalized.data(), last, parsed);
  if (ec != std::errc() || ptr != last) {
    return fallback;
  }
  return parsed;
}

double TomlDocument::get_double(const std::string &key, const double fallback) const {
  const auto it = values.find(key);
  if (it == values.end()) {
    return fallback;
  }
  const std::string normalized = trim(it->second);
  char *end = nullptr;
  const double parsed = std::strtod(normalized.c_str(), &end);
  if (normalized.empty() || end != normalized.c_str() + normalized.size()) {
    return fallback;
  }
  return parsed;
}

std::vector<std::string>
TomlDocument::get_string_array(const std::string &key,
                               const std::vector<std::string> &fallback) const {
  const auto it = values.find(key);
  if (it == values.end()) {
    return fallback;
  }
  const std::string raw = trim(it->second);
  if (raw.size() < 2 || raw.front() != '[' || raw.back() != ']') {
    return fallback;
  }
  std::vector<std::string> out;
  for (const auto &element : split_array(raw.substr(1, raw.size() - 2))) {
    if (!element.empty()) {
      out.push_back(unquote(element));
    }
  }
  return out;
}

std::vector<std::string> TomlDocument::keys_in(const std::string &section) const {
  const std::string prefix = section + ".";
  std::vector<std::string> keys;
  for (const auto &[key, _] : values) {
    if (starts_with(key, prefix) && key.find('.', prefix.size()) == std::string::npos) {
      keys.push_back(key.substr(prefix.size()));
    }
  }
  std::sort(keys.begin(), keys.end());
  return keys;
}

Result<TomlDocument> parse_toml(const std::string &content) {
  TomlDocument document;
  std::istringstream stream(content);
  std::string line;
  std::string section;
  std::string pending_key;
  std::string pending_value;
  std::size_t line_number = 0;

  while (std::getline(stream, line)) {
    ++line_number;
    const std::string clean = trim(strip_comment(line));

    if (!pending_key.empty()) {
      pending_value += " " + clean;
      if (!array_is_open(pending_value)) {
        document.values[pending_key] = pending_value;
        pending_key.clear();
        pending_value.clear();
      }
      continue;
    }
    if (clean.empty()) {
      continue;
    }

    if (clean.front() == '[' && clean.back() == ']') {
      section = trim(clean.substr(1, clean.size() - 2));
      if (section.empty()) {
        return Result<TomlDocument>::failure("empty section header at line " +
                                             std::to_string(line_number));
      }
      continue;
    }

    const std::size_t equals = clean.find('=');
    if (equals == std::string::npos) {
      return Result<TomlDocument>::failure("expected key = value at line " +
                                           std::to_string(line_number));
    }
    const std::string key = trim(clean.substr(0, equals));
    const std::string value = trim(clean.substr(equals + 1));
    if (key.empty()) {
      return Result<TomlDocument>::failure("missing key at line " + std::to_string(line_number));
    }

    const std::string full_key = section.empty() ? key : section + "." + key;
    if (array_is_open(value)) {
      pending_key = full_key;
      pending_value = value;
      continue;
    }
    document.values[full_key] = value;
  }

  if (!pending_key.empty()) {
    return Result<TomlDocument>::failure("unterminated array for key " + pending_key);
  }
  return Result<TomlDocument>::success(std::move(document));
}

std::string quote_toml_string(const std::string &value) {
  std::string escaped = "\"";
  for (const char ch : value) {
    if (ch == '"' || ch == '\\') {
      escaped.push_back('\\');
    }
    escaped.push_back(ch);
  }
  escaped.push_back('"');
  return escaped;
}

std::string toml_string_array(const std::vector<std::string> &values) {
  std::string out = "[";
  for (std::size_t i = 0; i < values.size(); ++i) {
    if (i > 0) {
      out += ", ";
    }
    out += quote_toml_string(values[i]);
  }
  out += "]";
  return out;
}

} // namespace memroute::common
