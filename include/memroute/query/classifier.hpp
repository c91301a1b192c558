#pragma once

#include "memroute/config/schema.hpp"
#include "memroute/query/temporal_detector.hpp"
#include "memroute/query/types.hpp"

#include <map>
#include <string>
#include <utility>
#include <vector>

namespace memroute::query {

struct AffinitySet {
  double weight = 1.0;
  std::vector<std::string> keywords;
};

/// Immutable tables and thresholds for one classifier instance.
struct ClassifierConfig {
  double primary_threshold = 0.45;
  double weighted_threshold = 0.35;
  double secondary_ratio = 0.7;
  double min_category_score = 1.0;
  double emotion_hint_confidence = 0.6;
  double emotion_hint_scale = 3.0;
  double exact_match_weight = 2.0;
  double partial_match_weight = 1.0;
  double entity_match_weight = 1.5;

  std::map<Category, std::vector<std::string>> category_patterns;
  // Entity type -> trigger words. Ordered; the first matching type wins for fact filters.
  std::vector<std::pair<std::string, std::vector<std::string>>> entity_types;
  std::map<memory::NamedVector, AffinitySet> affinity;
};

[[nodiscard]] ClassifierConfig default_classifier_config();

/// Default tables with the thresholds and extra patterns from the configuration file.
/// Extra pattern keys are category names or named-vector names.
[[nodiscard]] ClassifierConfig classifier_config_from(const config::ClassifierConfig &config);

/// One pass over the query produces both the category and the vector strategy.
class QueryClassifier {
public:
  QueryClassifier(ClassifierConfig config, TemporalQueryDetector detector);

  /// Temporal windows are absolute timestamps anchored at `now`.
  [[nodiscard]] Classification classify(const Query &query, common::UnixSeconds now) const;
  /// Anchors at `query.turn_timestamp`, or the wall clock when it is unset. Without a turn
  /// timestamp two calls may return different temporal windows for the same query.
  [[nodiscard]] Classification classify(const Query &query) const;

  [[nodiscard]] const ClassifierConfig &config() const { return config_; }
  [[nodiscard]] const TemporalQueryDetector &detector() const { return detector_; }

private:
  [[nodiscard]] std::vector<CategoryScore> score_categories(const std::string &normalized,
                                                            const std::vector<std::string> &tokens) const;
  [[nodiscard]] std::map<memory::NamedVector, double>
  score_affinity(const std::string &normalized, const std::vector<std::string> &tokens,
                 const std::optional<EmotionHint> &hint) const;
  [[nodiscard]] VectorStrategy choose_strategy(const std::map<memory::NamedVector, double> &affinity) const;

  ClassifierConfig config_;
  TemporalQueryDetector detector_;
};

/// True when a single keyword (or multi-word phrase) occurs in the tokens on word boundaries.
[[nodiscard]] bool keyword_matches(const std::string &normalized,
                                   const std::vector<std::string> &tokens,
                                   const std::string &keyword);

} // namespace memroute::query
