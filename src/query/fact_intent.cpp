#include "memroute/query/fact_intent.hpp"

#include "memroute/common/text.hpp"

#include <algorithm>

namespace memroute::query {

namespace {

struct RelationshipIntent {
  std::vector<std::string> triggers;
  std::vector<std::string> relationships;
};

const std::vector<RelationshipIntent> &relationship_intents() {
  static const std::vector<RelationshipIntent> intents = {
      {{"dislike", "hate", "avoid"}, {"dislikes", "hates", "avoids"}},
      {{"like", "love", "enjoy", "favorite", "favourite", "prefer"},
       {"likes", "favorite", "loves", "enjoys", "prefers"}},
      {{"familiar", "aware"}, {"knows"}},
      {{"visit", "travel", "been to"}, {"visited", "been_to", "traveled_to"}},
      {{"want", "wish", "desire", "hope"}, {"wants"}},
      {{"own", "possess"}, {"owns", "has"}},
  };
  return intents;
}

bool is_negation(const std::string &token) {
  return token == "not" || token == "don't" || token == "dont" || token == "never" ||
         token == "doesn't" || token == "didn't";
}

// "don't like" and "never wanted" read as the opposite group.
bool negated_preference(const std::vector<std::string> &tokens) {
  for (std::size_t i = 1; i < tokens.size(); ++i) {
    if (!is_negation(tokens[i - 1])) {
      continue;
    }
    for (const char *verb : {"like", "love", "enjoy", "want"}) {
      if (common::word_matches(tokens[i], verb)) {
        return true;
      }
    }
  }
  return false;
}

} // namespace

knowledge::FactFilter infer_fact_filter(const std::string &text, const ClassifierConfig &config) {
  const std::string normalized = common::normalize_text(text);
  const auto tokens = common::tokenize(text);
  knowledge::FactFilter filter;

  for (const auto &[type, words] : config.entity_types) {
    const bool hit = std::any_of(words.begin(), words.end(), [&normalized, &tokens](const auto &w) {
      return keyword_matches(normalized, tokens, w);
    });
    if (hit) {
      filter.entity_type = type;
      break;
    }
  }

  if (negated_preference(tokens)) {
    filter.relationship_types = relationship_intents().front().relationships;
    return filter;
  }
  for (const auto &intent : relationship_intents()) {
    const bool hit = std::any_of(intent.triggers.begin(), intent.triggers.end(),
                                 [&normalized, &tokens](const auto &trigger) {
                                   return keyword_matches(normalized, tokens, trigger);
                                 });
    if (hit) {
      filter.relationship_types = intent.relationships;
      break;
    }
  }
  return filter;
}

std::optional<std::string> related_entity_seed(const std::string &text) {
  const auto tokens = common::tokenize(text);
  for (std::size_t i = 0; i + 1 < tokens.size(); ++i) {
    if ((tokens[i] != "similar" && tokens[i] != "related") || tokens[i + 1] != "to") {
      continue;
    }
    std::size_t j = i + 2;
    while (j < tokens.size() && common::is_stopword(tokens[j])) {
      ++j;
    }
    std::string seed;
    for (std::size_t taken = 0; j < tokens.size() && taken < 4; ++j, ++taken) {
      if (common::is_stopword(tokens[j])) {
        break;
      }
      if (!seed.empty()) {
        seed.push_back(' ');
      }
      seed += tokens[j];
    }
    if (!seed.empty()) {
      return seed;
    }
  }
  return std::nullopt;
}

} // namespace memroute::query
