#include "memroute/query/types.hpp"

#include <algorithm>

namespace memroute::query {

std::string_view category_to_string(const Category category) {
  switch (category) {
  case Category::Factual:
    return "factual";
  case Category::Emotional:
    return "emotional";
  case Category::Conversational:
    return "conversational";
  case Category::Temporal:
    return "temporal";
  case Category::General:
    return "general";
  }
  return "general";
}

std::optional<Category> category_from_string(const std::string_view value) {
  for (const auto category : {Category::Factual, Category::Emotional, Category::Conversational,
                              Category::Temporal, Category::General}) {
    if (category_to_string(category) == value) {
      return category;
    }
  }
  return std::nullopt;
}

std::string_view strategy_kind_to_string(const StrategyKind kind) {
  switch (kind) {
  case StrategyKind::ContentOnly:
    return "content_only";
  case StrategyKind::EmotionPrimary:
    return "emotion_primary";
  case StrategyKind::SemanticPrimary:
    return "semantic_primary";
  case StrategyKind::WeightedCombination:
    return "weighted_combination";
  case StrategyKind::BalancedFusion:
    return "balanced_fusion";
  }
  return "balanced_fusion";
}

VectorStrategy VectorStrategy::content_only() {
  return VectorStrategy{.kind = StrategyKind::ContentOnly, .weights = {}};
}

VectorStrategy VectorStrategy::primary(const memory::NamedVector vector) {
  switch (vector) {
  case memory::NamedVector::Emotion:
    return VectorStrategy{.kind = StrategyKind::EmotionPrimary, .weights = {}};
  case memory::NamedVector::Semantic:
    return VectorStrategy{.kind = StrategyKind::SemanticPrimary, .weights = {}};
  case memory::NamedVector::Content:
    break;
  }
  return content_only();
}

VectorStrategy VectorStrategy::weighted(std::map<memory::NamedVector, double> weights) {
  double total = 0.0;
  for (const auto &[vector, weight] : weights) {
    total += std::max(weight, 0.0);
  }
  if (total <= 0.0) {
    return balanced();
  }
  for (auto &[vector, weight] : weights) {
    weight = std::max(weight, 0.0) / total;
  }
  return VectorStrategy{.kind = StrategyKind::WeightedCombination, .weights = std::move(weights)};
}

VectorStrategy VectorStrategy::balanced() {
  std::map<memory::NamedVector, double> weights;
  for (const auto vector : memory::kAllNamedVectors) {
    weights[vector] = 1.0 / static_cast<double>(memory::kAllNamedVectors.size());
  }
  return VectorStrategy{.kind = StrategyKind::BalancedFusion, .weights = std::move(weights)};
}

memory::NamedVector VectorStrategy::primary_vector() const {
  switch (kind) {
  case StrategyKind::EmotionPrimary:
    return memory::NamedVector::Emotion;
  case StrategyKind::SemanticPrimary:
    return memory::NamedVector::Semantic;
  default:
    return memory::NamedVector::Content;
  }
}

bool VectorStrategy::is_multi_vector() const {
  return kind == StrategyKind::WeightedCombination || kind == StrategyKind::BalancedFusion;
}

std::string_view temporal_direction_to_string(const TemporalDirection direction) {
  return direction == TemporalDirection::Oldest ? "oldest" : "newest";
}

std::string_view temporal_scope_to_string(const TemporalScope scope) {
  switch (scope) {
  case TemporalScope::Session:
    return "session";
  case TemporalScope::AllTime:
    return "all_time";
  case TemporalScope::Range:
    return "range";
  }
  return "all_time";
}

bool Classification::includes(const Category other) const {
  return category == other || std::find(secondary.begin(), secondary.end(), other) != secondary.end();
}

} // namespace memroute::query
