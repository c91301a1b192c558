#pragma once

#include <string>
#include <vector>

namespace memroute::common {

/// Lower-cases and replaces every non-alphanumeric byte (apostrophes excepted) with a space.
[[nodiscard]] std::string normalize_text(const std::string &text);

/// Splits normalized text into word tokens.
[[nodiscard]] std::vector<std::string> tokenize(const std::string &text);

/// True when `phrase` (one or more words) occurs in `normalized` on word boundaries.
[[nodiscard]] bool contains_phrase(const std::string &normalized, const std::string &phrase);

/// Matches a keyword against a token, accepting the plural and -ing/-ed inflections.
[[nodiscard]] bool word_matches(const std::string &token, const std::string &keyword);

[[nodiscard]] bool is_stopword(const std::string &token);

} // namespace memroute::common
