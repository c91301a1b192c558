#include "memroute/query/classifier.hpp"

#include "memroute/common/fs.hpp"
#include "memroute/common/text.hpp"

#include <algorithm>
#include <numeric>

namespace memroute::query {

namespace {

constexpr std::size_t kMinPartialLength = 4;

void append_unique(std::vector<std::string> &target, const std::vector<std::string> &extra) {
  for (const auto &raw : extra) {
    const std::string keyword = common::trim(common::normalize_text(raw));
    if (!keyword.empty() && std::find(target.begin(), target.end(), keyword) == target.end()) {
      target.push_back(keyword);
    }
  }
}

} // namespace

bool keyword_matches(const std::string &normalized, const std::vector<std::string> &tokens,
                     const std::string &keyword) {
  if (keyword.find(' ') != std::string::npos) {
    return common::contains_phrase(normalized, keyword);
  }
  return std::any_of(tokens.begin(), tokens.end(), [&keyword](const auto &token) {
    return common::word_matches(token, keyword);
  });
}

ClassifierConfig default_classifier_config() {
  ClassifierConfig config;
  config.category_patterns = {
      {Category::Conversational,
       {"we talked", "we discussed", "we were talking", "our conversation", "our chat",
        "our discussion", "remember when", "recall when", "remember our", "you mentioned",
        "you said", "you told me", "earlier you", "what did we", "what have we", "what were we",
        "when we spoke", "you and i", "we were discussing", "what did you tell",
        "remind me about our", "remind me what we", "talk", "discuss", "mention", "conversation"}},
      {Category::Emotional,
       {"feel", "feeling", "felt", "emotion", "emotional", "mood", "happy", "sad", "angry",
        "excited", "anxious", "worried", "scared", "upset", "lonely", "how are you",
        "how're you", "how do you feel", "are you okay", "fear", "passion", "joy", "sorrow"}},
      {Category::Factual,
       {"what is", "what are", "what was", "what were", "define", "definition of", "explain",
        "how to", "how does", "calculate", "formula", "meaning of", "tell me about",
        "information about", "description of", "do i like", "do i love", "do i enjoy",
        "do i hate", "my favorite", "favorite", "what do i", "about me", "do you know about",
        "prefer"}},
      {Category::Temporal,
       {"over time", "changed", "evolved", "history", "timeline", "progression", "development",
        "how have", "used to", "anymore"}},
  };
  config.entity_types = {
      {"food", {"food", "eat", "meal", "restaurant", "cuisine", "dish", "cook", "recipe"}},
      {"hobby", {"hobby", "hobbies", "activity", "activities", "interest", "passion", "pastime"}},
      {"place",
       {"place", "location", "city", "country", "visit", "travel", "destination", "live"}},
      {"person", {"person", "people", "friend", "family", "colleague"}},
      {"book", {"book", "read", "author", "novel", "library"}},
      {"music", {"music", "song", "album", "band", "listen"}},
      {"movie", {"movie", "film", "cinema", "watch", "series"}},
      {"art", {"art", "artwork", "draw", "paint", "painting", "sketch", "sculpture"}},
      {"equipment", {"equipment", "tool", "device", "gear", "hardware", "machine"}},
      {"work", {"work", "job", "career", "profession", "office", "company"}},
      {"study", {"study", "studies", "learn", "education", "school", "course", "class"}},
  };
  config.affinity = {
      {memory::NamedVector::Content,
       AffinitySet{.weight = 1.0,
                   .keywords = {"what", "how", "when", "where", "why", "fact", "information",
                                "data", "detail", "specific", "exactly", "precisely", "step",
                                "process", "method", "describe", "explain", "define", "clarify",
                                "technical", "code", "configuration"}}},
      {memory::NamedVector::Emotion,
       AffinitySet{.weight = 1.5,
                   .keywords = {"feel", "feeling", "felt", "emotion", "emotional", "mood",
                                "sentiment", "happy", "joy", "excited", "love", "sad", "angry",
                                "frustrated", "upset", "worried", "anxious", "disappointed",
                                "hurt", "calm", "relaxed", "lonely", "scared"}}},
      {memory::NamedVector::Semantic,
       AffinitySet{.weight = 1.2,
                   .keywords = {"similar", "relate", "related", "concept", "idea", "theory",
                                "principle", "philosophy", "belief", "meaning", "connection",
                                "relationship", "pattern", "association", "link", "abstract",
                                "metaphor", "symbol", "understand", "insight", "personality",
                                "character", "trait", "behavior", "tendency"}}},
  };
  return config;
}

ClassifierConfig classifier_config_from(const config::ClassifierConfig &config) {
  ClassifierConfig out = default_classifier_config();
  out.primary_threshold = config.primary_threshold;
  out.weighted_threshold = config.weighted_threshold;
  out.secondary_ratio = config.secondary_ratio;
  out.min_category_score = config.min_category_score;
  out.emotion_hint_confidence = config.emotion_hint_confidence;
  out.emotion_hint_scale = config.emotion_hint_scale;
  out.exact_match_weight = config.exact_match_weight;
  out.partial_match_weight = config.partial_match_weight;
  out.entity_match_weight = config.entity_match_weight;

  for (const auto &[name, keywords] : config.extra_patterns) {
    if (const auto category = category_from_string(name); category.has_value()) {
      append_unique(out.category_patterns[*category], keywords);
    } else if (const auto vector = memory::named_vector_from_string(name); vector.has_value()) {
      append_unique(out.affinity[*vector].keywords, keywords);
    }
  }
  return out;
}

QueryClassifier::QueryClassifier(ClassifierConfig config, TemporalQueryDetector detector)
    : config_(std::move(config)), detector_(std::move(detector)) {}

std::vector<CategoryScore>
QueryClassifier::score_categories(const std::string &normalized,
                                  const std::vector<std::string> &tokens) const {
  std::vector<CategoryScore> scores;
  for (const auto &[category, patterns] : config_.category_patterns) {
    double score = 0.0;
    for (const auto &keyword : patterns) {
      if (keyword_matches(normalized, tokens, keyword)) {
        score += config_.exact_match_weight;
      } else if (keyword.size() >= kMinPartialLength &&
                 keyword.find(' ') == std::string::npos &&
                 normalized.find(keyword) != std::string::npos) {
        score += config_.partial_match_weight;
      }
    }
    if (category == Category::Factual) {
      for (const auto &entry : config_.entity_types) {
        const auto &words = entry.second;
        const bool hit = std::any_of(words.begin(), words.end(), [&](const auto &word) {
          return keyword_matches(normalized, tokens, word);
        });
        if (hit) {
          score += config_.entity_match_weight;
        }
      }
    }
    scores.push_back(CategoryScore{.category = category, .score = score});
  }
  std::stable_sort(scores.begin(), scores.end(),
                   [](const auto &a, const auto &b) { return a.score > b.score; });
  return scores;
}

std::map<memory::NamedVector, double>
QueryClassifier::score_affinity(const std::string &normalized,
                                const std::vector<std::string> &tokens,
                                const std::optional<EmotionHint> &hint) const {
  std::map<memory::NamedVector, double> raw;
  for (const auto vector : memory::kAllNamedVectors) {
    raw[vector] = 0.0;
    const auto it = config_.affinity.find(vector);
    if (it == config_.affinity.end()) {
      continue;
    }
    for (const auto &keyword : it->second.keywords) {
      if (keyword_matches(normalized, tokens, keyword)) {
        raw[vector] += it->second.weight;
      }
    }
  }

  // A confident upstream emotion reading replaces the keyword heuristic.
  if (hint.has_value() && hint->confidence > config_.emotion_hint_confidence) {
    const std::string label = common::to_lower(common::trim(hint->label));
    raw[memory::NamedVector::Emotion] =
        label == "neutral" || label.empty() ? 0.0 : hint->confidence * config_.emotion_hint_scale;
  }

  const double total = std::accumulate(raw.begin(), raw.end(), 0.0,
                                       [](double sum, const auto &entry) { return sum + entry.second; });
  if (total <= 0.0) {
    return raw;
  }
  for (auto &[vector, score] : raw) {
    score /= total;
  }
  return raw;
}

VectorStrategy
QueryClassifier::choose_strategy(const std::map<memory::NamedVector, double> &affinity) const {
  memory::NamedVector best = memory::NamedVector::Content;
  double best_score = 0.0;
  double total = 0.0;
  for (const auto vector : memory::kAllNamedVectors) {
    const auto it = affinity.find(vector);
    const double score = it == affinity.end() ? 0.0 : it->second;
    total += score;
    if (score > best_score) {
      best = vector;
      best_score = score;
    }
  }
  if (total <= 0.0) {
    return VectorStrategy::balanced();
  }
  if (best_score > config_.primary_threshold) {
    return VectorStrategy::primary(best);
  }
  if (best_score > config_.weighted_threshold) {
    return VectorStrategy::weighted(affinity);
  }
  return VectorStrategy::balanced();
}

Classification QueryClassifier::classify(const Query &query, const common::UnixSeconds now) const {
  const std::string normalized = common::normalize_text(query.text);
  const auto tokens = common::tokenize(query.text);

  Classification result;
  result.scores = score_categories(normalized, tokens);
  result.affinity = score_affinity(normalized, tokens, query.emotion_hint);
  result.strategy = choose_strategy(result.affinity);

  const double total = std::accumulate(
      result.scores.begin(), result.scores.end(), 0.0,
      [](double sum, const CategoryScore &entry) { return sum + entry.score; });

  const auto temporal = detector_.detect(query.text, now);
  if (temporal.is_temporal) {
    result.category = Category::Temporal;
    result.confidence = 1.0;
    result.temporal = temporal;
    for (const auto &entry : result.scores) {
      if (entry.category != Category::Temporal && entry.score >= config_.min_category_score) {
        result.secondary.push_back(entry.category);
      }
    }
    return result;
  }

  if (result.scores.empty() || result.scores.front().score < config_.min_category_score) {
    result.category = Category::General;
    result.confidence = 0.0;
    return result;
  }

  const CategoryScore &primary = result.scores.front();
  result.category = primary.category;
  result.confidence = total > 0.0 ? primary.score / total : 0.0;
  for (std::size_t i = 1; i < result.scores.size(); ++i) {
    const auto &entry = result.scores[i];
    if (entry.score >= config_.min_category_score &&
        entry.score >= primary.score * config_.secondary_ratio) {
      result.secondary.push_back(entry.category);
    }
  }
  return result;
}

Classification QueryClassifier::classify(const Query &query) const {
  return classify(query, query.turn_timestamp.value_or(common::now_unix()));
}

} // namespace memroute::query
