#include "memroute/ports/emotion_lexicon.hpp"

#include "memroute/common/text.hpp"

#include <algorithm>
#include <vector>

namespace memroute::ports {

namespace {

struct LexiconEntry {
  std::string_view label;
  std::vector<std::string> words;
};

const std::vector<LexiconEntry> &lexicon() {
  static const std::vector<LexiconEntry> entries = {
      {"joy",
       {"happy", "joy", "excited", "glad", "great", "wonderful", "amazing", "fantastic",
        "awesome", "delighted", "thrilled", "cheerful"}},
      {"sadness",
       {"sad", "down", "depressed", "lonely", "unhappy", "miserable", "hurt", "disappointed",
        "heartbroken", "cry", "grief"}},
      {"anger",
       {"angry", "mad", "furious", "annoyed", "frustrated", "irritated", "upset", "rage",
        "hate"}},
      {"fear",
       {"scared", "afraid", "anxious", "worried", "nervous", "terrified", "fear", "panic",
        "stressed"}},
      {"love", {"love", "adore", "cherish", "affection", "caring", "fond"}},
      {"surprise", {"surprised", "shocked", "unexpected", "wow", "astonished"}},
      {"calm", {"calm", "peaceful", "relaxed", "content", "serene", "satisfied"}},
  };
  return entries;
}

} // namespace

common::Result<EmotionResult> LexiconEmotionClassifier::classify(const std::string_view text) {
  const auto tokens = common::tokenize(std::string(text));

  EmotionResult best;
  std::size_t best_hits = 0;
  std::size_t total_hits = 0;
  for (const auto &entry : lexicon()) {
    std::size_t hits = 0;
    for (const auto &token : tokens) {
      hits += static_cast<std::size_t>(std::any_of(
          entry.words.begin(), entry.words.end(),
          [&token](const std::string &word) { return common::word_matches(token, word); }));
    }
    total_hits += hits;
    if (hits > best_hits) {
      best_hits = hits;
      best.label = std::string(entry.label);
    }
  }

  if (best_hits == 0) {
    best.confidence = 0.5;
    return common::Result<EmotionResult>::success(best);
  }
  const double share = static_cast<double>(best_hits) / static_cast<double>(total_hits);
  best.confidence = std::min(0.95, 0.45 + 0.2 * static_cast<double>(best_hits) * share);
  return common::Result<EmotionResult>::success(best);
}

} // namespace memroute::ports
