#include "test_framework.hpp"

#include "memroute/query/classifier.hpp"
#include "memroute/query/fact_intent.hpp"

#include <algorithm>
#include <cmath>

namespace {

namespace q = memroute::query;
using memroute::memory::NamedVector;

constexpr memroute::common::UnixSeconds kNow = 1700000000;

q::QueryClassifier make_classifier() {
  return q::QueryClassifier(q::default_classifier_config(), q::TemporalQueryDetector{});
}

q::Classification classify(const std::string &text,
                           std::optional<q::EmotionHint> hint = std::nullopt) {
  const auto classifier = make_classifier();
  return classifier.classify(
      q::Query{.text = text, .user_id = "alice", .emotion_hint = std::move(hint)}, kNow);
}

bool contains(const std::vector<std::string> &values, const std::string &value) {
  return std::find(values.begin(), values.end(), value) != values.end();
}

} // namespace

void register_classifier_tests(std::vector<memroute::tests::TestCase> &tests) {
  using memroute::tests::require;
  using memroute::tests::require_near;

  tests.push_back({"classifier_preference_question_is_factual", [] {
                     const auto result = classify("What foods do I like?");
                     require(result.category == q::Category::Factual, "expected factual");
                     require(result.confidence == 1.0, "only factual patterns should match");
                     require(result.secondary.empty(), "no secondary categories expected");
                     require(result.strategy.kind == q::StrategyKind::ContentOnly,
                             "factual lookups search the content vector");
                     require(!result.temporal.has_value(), "not temporal");
                   }});

  tests.push_back({"classifier_feelings_are_emotional", [] {
                     const auto result = classify("I feel so sad and lonely");
                     require(result.category == q::Category::Emotional, "expected emotional");
                     require(result.strategy.kind == q::StrategyKind::EmotionPrimary,
                             "expected emotion primary");
                     require(result.strategy.primary_vector() == NamedVector::Emotion,
                             "primary vector should be emotion");
                     require(result.affinity.at(NamedVector::Emotion) == 1.0,
                             "emotion affinity should dominate");
                   }});

  tests.push_back({"classifier_shared_history_is_conversational", [] {
                     const auto result = classify("What did we discuss about the project?");
                     require(result.category == q::Category::Conversational,
                             "expected conversational");
                     require(result.confidence > 0.5, "conversational should be confident");
                   }});

  tests.push_back({"classifier_temporal_takes_priority", [] {
                     const auto result = classify("What was the first thing we talked about?");
                     require(result.category == q::Category::Temporal, "expected temporal");
                     require(result.confidence == 1.0, "temporal detection is certain");
                     require(result.temporal.has_value() && result.temporal->is_temporal,
                             "detection should be attached");
                     require(result.temporal->window.direction == q::TemporalDirection::Oldest,
                             "expected oldest window");
                     require(result.includes(q::Category::Conversational),
                             "conversational should be secondary");
                     require(std::find(result.secondary.begin(), result.secondary.end(),
                                       q::Category::Temporal) == result.secondary.end(),
                             "temporal must not repeat as secondary");
                   }});

  tests.push_back({"classifier_unmatched_query_is_general", [] {
                     const auto result = classify("hello there");
                     require(result.category == q::Category::General, "expected general");
                     require(result.confidence == 0.0, "general has no confidence");
                     require(result.secondary.empty(), "no secondary categories");
                     require(result.strategy.kind == q::StrategyKind::BalancedFusion,
                             "no affinity means balanced fusion");
                     require(result.strategy.weights.size() == 3, "balanced uses all vectors");
                   }});

  tests.push_back({"classifier_mixed_affinity_weights_vectors", [] {
                     const auto result = classify("how do I feel about this idea");
                     require(result.strategy.kind == q::StrategyKind::WeightedCombination,
                             "expected weighted combination");
                     const auto &weights = result.strategy.weights;
                     require_near(weights.at(NamedVector::Emotion), 1.5 / 3.7,
                                  "emotion weight mismatch");
                     require_near(weights.at(NamedVector::Semantic), 1.2 / 3.7,
                                  "semantic weight mismatch");
                     double total = 0.0;
                     for (const auto &[vector, weight] : weights) {
                       total += weight;
                     }
                     require_near(total, 1.0, "weights should sum to one");
                   }});

  tests.push_back({"classifier_confident_emotion_hint_overrides_keywords", [] {
                     const auto joyful =
                         classify("hello there", q::EmotionHint{.label = "joy", .confidence = 0.9});
                     require(joyful.strategy.kind == q::StrategyKind::EmotionPrimary,
                             "confident hint should select emotion primary");

                     const auto neutral = classify(
                         "how do I feel about this idea",
                         q::EmotionHint{.label = "Neutral", .confidence = 0.9});
                     require(neutral.affinity.at(NamedVector::Emotion) == 0.0,
                             "neutral hint should switch emotion affinity off");
                     require(neutral.strategy.kind == q::StrategyKind::SemanticPrimary,
                             "semantic should take over");

                     const auto weak =
                         classify("hello there", q::EmotionHint{.label = "joy", .confidence = 0.4});
                     require(weak.strategy.kind == q::StrategyKind::BalancedFusion,
                             "weak hint should be ignored");
                   }});

  tests.push_back({"classifier_is_deterministic", [] {
                     const auto classifier = make_classifier();
                     const q::Query query{.text = "Do you remember what we talked about my job?",
                                          .user_id = "alice"};
                     const auto first = classifier.classify(query, kNow);
                     for (int i = 0; i < 50; ++i) {
                       const auto again = classifier.classify(query, kNow);
                       require(again.category == first.category, "category changed");
                       require(again.confidence == first.confidence, "confidence changed");
                       require(again.secondary == first.secondary, "secondary changed");
                       require(again.strategy.kind == first.strategy.kind, "strategy changed");
                     }
                   }});

  tests.push_back({"classifier_temporal_window_anchors_at_turn_timestamp", [] {
                     const auto classifier = make_classifier();
                     const q::Query query{.text = "What was the first thing we talked about?",
                                          .user_id = "alice",
                                          .turn_timestamp = kNow};
                     const auto anchored = classifier.classify(query, kNow);
                     require(anchored.temporal.has_value(), "temporal query expected");
                     for (int i = 0; i < 3; ++i) {
                       const auto again = classifier.classify(query);
                       require(again.temporal.has_value(), "temporal detection lost");
                       require(again.temporal->window.since == anchored.temporal->window.since &&
                                   again.temporal->window.until ==
                                       anchored.temporal->window.until,
                               "turn timestamp should pin the window");
                     }
                   }});

  tests.push_back({"classifier_partial_keyword_matches", [] {
                     const auto result = classify("so much anxiousness lately");
                     require(result.category == q::Category::Emotional,
                             "partial keyword should still count");
                     require(result.scores.front().score == 1.0, "partial match weight mismatch");
                   }});

  tests.push_back({"classifier_weighted_strategy_normalizes", [] {
                     const auto strategy = q::VectorStrategy::weighted(
                         {{NamedVector::Content, 2.0}, {NamedVector::Emotion, 2.0},
                          {NamedVector::Semantic, -1.0}});
                     require(strategy.kind == q::StrategyKind::WeightedCombination,
                             "expected weighted kind");
                     require(strategy.weights.at(NamedVector::Content) == 0.5, "content weight");
                     require(strategy.weights.at(NamedVector::Semantic) == 0.0,
                             "negative weights clamp to zero");
                     require(q::VectorStrategy::weighted({}).kind == q::StrategyKind::BalancedFusion,
                             "empty weights fall back to balanced");
                     require(q::strategy_kind_to_string(strategy.kind) == "weighted_combination",
                             "strategy name mismatch");
                     require(q::category_from_string("emotional") == q::Category::Emotional,
                             "category lookup failed");
                   }});

  tests.push_back({"classifier_infers_fact_filters", [] {
                     const auto config = q::default_classifier_config();

                     const auto food = q::infer_fact_filter("What foods do I like?", config);
                     require(food.entity_type == std::optional<std::string>("food"),
                             "food type expected");
                     require(contains(food.relationship_types, "likes") &&
                                 contains(food.relationship_types, "prefers"),
                             "positive preferences expected");

                     const auto negated = q::infer_fact_filter("I don't like mushrooms", config);
                     require(!negated.entity_type.has_value(), "no entity type expected");
                     require(contains(negated.relationship_types, "dislikes"),
                             "negated preference should read as dislikes");

                     const auto travel = q::infer_fact_filter("where have I traveled", config);
                     require(travel.entity_type == std::optional<std::string>("place"),
                             "place type expected");
                     require(contains(travel.relationship_types, "visited"),
                             "travel relationships expected");

                     const auto plain = q::infer_fact_filter("hello there", config);
                     require(!plain.entity_type.has_value() && plain.relationship_types.empty(),
                             "unrelated text should not filter");
                   }});

  tests.push_back({"classifier_related_entity_seed", [] {
                     require(q::related_entity_seed("anything similar to the pepperoni pizza?") ==
                                 std::optional<std::string>("pepperoni pizza"),
                             "seed mismatch");
                     require(q::related_entity_seed("things related to jazz") ==
                                 std::optional<std::string>("jazz"),
                             "related seed mismatch");
                     require(!q::related_entity_seed("similar mood today").has_value(),
                             "no seed without 'to'");
                   }});
}
