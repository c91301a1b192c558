#include "memroute/common/text.hpp"

#include <array>
#include <cctype>
#include <sstream>
#include <string_view>

namespace memroute::common {

std::string normalize_text(const std::string &text) {
  std::string out;
  out.reserve(text.size());
  for (const char ch : text) {
    const auto uch = static_cast<unsigned char>(ch);
    if (std::isalnum(uch) != 0 || ch == '\'') {
      out.push_back(static_cast<char>(std::tolower(uch)));
    } else {
      out.push_back(' ');
    }
  }
  return out;
}

std::vector<std::string> tokenize(const std::string &text) {
  std::vector<std::string> tokens;
  std::istringstream stream(normalize_text(text));
  std::string token;
  while (stream >> token) {
    tokens.push_back(std::move(token));
  }
  return tokens;
}

bool contains_phrase(const std::string &normalized, const std::string &phrase) {
  if (phrase.empty()) {
    return false;
  }
  std::size_t pos = normalized.find(phrase);
  while (pos != std::string::npos) {
    const bool left_ok = pos == 0 || normalized[pos - 1] == ' ';
    const std::size_t end = pos + phrase.size();
    const bool right_ok = end == normalized.size() || normalized[end] == ' ';
    if (left_ok && right_ok) {
      return true;
    }
    pos = normalized.find(phrase, pos + 1);
  }
  return false;
}

bool word_matches(const std::string &token, const std::string &keyword) {
  if (token == keyword) {
    return true;
  }
  if (token.size() <= keyword.size() || token.compare(0, keyword.size(), keyword) != 0) {
    return false;
  }
  const std::string_view suffix(token.data() + keyword.size(), token.size() - keyword.size());
  return suffix == "s" || suffix == "es" || suffix == "ing" || suffix == "ed" || suffix == "d";
}

bool is_stopword(const std::string &token) {
  static constexpr std::array<std::string_view, 48> kStopwords = {
      "a",     "an",   "the",  "and",  "or",    "but",  "if",    "of",    "to",    "in",
      "on",    "at",   "for",  "with", "about", "from", "by",    "is",    "are",   "was",
      "were",  "be",   "been", "do",   "does",  "did",  "i",     "me",    "my",    "we",
      "our",   "you",  "your", "it",   "its",   "that", "this",  "these", "those", "what",
      "which", "who",  "how",  "when", "where", "why",  "there", "their"};
  for (const auto word : kStopwords) {
    if (token == word) {
      return true;
    }
  }
  return false;
}

} // namespace memroute::common
