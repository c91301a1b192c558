#pragma once

#include "memroute/common/time.hpp"
#include "memroute/memory/record.hpp"

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace memroute::query {

struct EmotionHint {
  std::string label;
  double confidence = 0.0;
};

struct Query {
  std::string text;
  std::string user_id;
  std::optional<EmotionHint> emotion_hint;
  std::optional<common::UnixSeconds> turn_timestamp;
};

enum class Category {
  Factual,
  Emotional,
  Conversational,
  Temporal,
  General,
};

[[nodiscard]] std::string_view category_to_string(Category category);
[[nodiscard]] std::optional<Category> category_from_string(std::string_view value);

enum class StrategyKind {
  ContentOnly,
  EmotionPrimary,
  SemanticPrimary,
  WeightedCombination,
  BalancedFusion,
};

[[nodiscard]] std::string_view strategy_kind_to_string(StrategyKind kind);

/// Which named vectors to search and how to weigh them. Weights, when present, sum to 1.
struct VectorStrategy {
  StrategyKind kind = StrategyKind::BalancedFusion;
  std::map<memory::NamedVector, double> weights;

  [[nodiscard]] static VectorStrategy content_only();
  [[nodiscard]] static VectorStrategy primary(memory::NamedVector vector);
  [[nodiscard]] static VectorStrategy weighted(std::map<memory::NamedVector, double> weights);
  [[nodiscard]] static VectorStrategy balanced();

  /// The vector searched by single-vector strategies.
  [[nodiscard]] memory::NamedVector primary_vector() const;
  [[nodiscard]] bool is_multi_vector() const;
};

enum class TemporalDirection {
  Oldest,
  Newest,
};

enum class TemporalScope {
  Session,
  AllTime,
  // An explicit range taken from the query ("yesterday", "3 hours ago").
  Range,
};

[[nodiscard]] std::string_view temporal_direction_to_string(TemporalDirection direction);
[[nodiscard]] std::string_view temporal_scope_to_string(TemporalScope scope);

struct TemporalWindow {
  TemporalDirection direction = TemporalDirection::Newest;
  TemporalScope scope = TemporalScope::AllTime;
  std::size_t limit = 5;
  std::optional<common::UnixSeconds> since;
  std::optional<common::UnixSeconds> until;
};

struct TemporalDetection {
  bool is_temporal = false;
  TemporalWindow window;
  // The pattern that triggered detection, empty when none did.
  std::string matched;
};

struct CategoryScore {
  Category category = Category::General;
  double score = 0.0;
};

struct Classification {
  Category category = Category::General;
  double confidence = 0.0;
  std::vector<Category> secondary;
  VectorStrategy strategy;
  // Raw per-category scores, highest first.
  std::vector<CategoryScore> scores;
  // Normalized vector-affinity scores.
  std::map<memory::NamedVector, double> affinity;
  std::optional<TemporalDetection> temporal;

  [[nodiscard]] bool includes(Category other) const;
};

} // namespace memroute::query
