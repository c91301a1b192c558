#include "memroute/retrieval/fusion_engine.hpp"

#include "memroute/observability/global.hpp"

#include <algorithm>
#include <unordered_map>

namespace memroute::retrieval {

namespace {

bool ranks_before(const RankedMemory &a, const RankedMemory &b) {
  if (a.score != b.score) {
    return a.score > b.score;
  }
  if (a.record.timestamp != b.record.timestamp) {
    return a.record.timestamp > b.record.timestamp;
  }
  return a.record.id < b.record.id;
}

std::vector<RankedMemory> to_ranked(memory::NamedVector vector,
                                    std::vector<memory::ScoredRecord> hits) {
  std::vector<RankedMemory> out;
  out.reserve(hits.size());
  for (auto &hit : hits) {
    RankedMemory ranked;
    ranked.score = hit.score;
    ranked.vector_scores[vector] = hit.score;
    ranked.record = std::move(hit.record);
    out.push_back(std::move(ranked));
  }
  std::stable_sort(out.begin(), out.end(), ranks_before);
  return out;
}

} // namespace

std::vector<RankedMemory> merge_weighted(
    const std::vector<std::pair<memory::NamedVector, std::vector<memory::ScoredRecord>>> &lists,
    const std::map<memory::NamedVector, double> &weights, const std::size_t limit) {
  std::unordered_map<std::string, RankedMemory> merged;
  for (const auto &[vector, hits] : lists) {
    const auto weight_it = weights.find(vector);
    const double weight = weight_it == weights.end() ? 0.0 : weight_it->second;
    for (const auto &hit : hits) {
      auto [it, inserted] = merged.try_emplace(hit.record.id);
      if (inserted) {
        it->second.record = hit.record;
      }
      it->second.score += weight * hit.score;
      it->second.vector_scores[vector] = hit.score;
    }
  }

  std::vector<RankedMemory> ranked;
  ranked.reserve(merged.size());
  for (auto &[id, entry] : merged) {
    ranked.push_back(std::move(entry));
  }
  std::sort(ranked.begin(), ranked.end(), ranks_before);
  if (ranked.size() > limit) {
    ranked.resize(limit);
  }
  return ranked;
}

VectorFusionEngine::VectorFusionEngine(std::shared_ptr<ports::IEmbedder> embedder,
                                       std::shared_ptr<ports::IEmotionClassifier> emotion,
                                       std::shared_ptr<memory::IMemoryStore> store,
                                       config::FusionConfig config)
    : embedder_(std::move(embedder)), emotion_(std::move(emotion)), store_(std::move(store)),
      config_(config) {}

std::string VectorFusionEngine::query_emotion_label(const query::Query &query) {
  if (query.emotion_hint.has_value() && !query.emotion_hint->label.empty()) {
    return query.emotion_hint->label;
  }
  if (emotion_ == nullptr) {
    return "neutral";
  }
  auto classified = emotion_->classify(query.text);
  if (!classified.ok()) {
    observability::record_degraded("emotion_port", classified.error());
    return "neutral";
  }
  return classified.value().label;
}

common::Result<std::vector<memory::ScoredRecord>>
VectorFusionEngine::search_vector(const memory::NamedVector vector, const query::Query &query,
                                  const std::string &emotion_label, const std::size_t limit) {
  using ResultT = common::Result<std::vector<memory::ScoredRecord>>;
  auto embedded = embedder_->embed(memory::embedding_text(vector, query.text, emotion_label));
  if (!embedded.ok()) {
    return ResultT::failure("embedding " + std::string(memory::named_vector_to_string(vector)) +
                            " query: " + embedded.error());
  }
  auto hits = store_->search(vector, embedded.value(), query.user_id, limit);
  if (!hits.ok()) {
    return ResultT::failure(std::string(memory::named_vector_to_string(vector)) +
                            " search: " + hits.error());
  }
  return hits;
}

common::Result<std::vector<RankedMemory>>
VectorFusionEngine::search(const query::Query &query, const query::VectorStrategy &strategy,
                           const std::size_t limit) {
  using ResultT = common::Result<std::vector<RankedMemory>>;
  if (embedder_ == nullptr || store_ == nullptr) {
    return ResultT::failure("vector backend not configured");
  }
  if (limit == 0) {
    return ResultT::success({});
  }

  if (!strategy.is_multi_vector()) {
    const memory::NamedVector primary = strategy.primary_vector();
    const std::string label =
        primary == memory::NamedVector::Emotion ? query_emotion_label(query) : "neutral";
    auto hits = search_vector(primary, query, label, limit);
    if (!hits.ok()) {
      return ResultT::propagate(hits);
    }
    if (!hits.value().empty() || primary == memory::NamedVector::Content) {
      count_search(strategy.kind, 1, false);
      return ResultT::success(to_ranked(primary, std::move(hits.value())));
    }
    // Records written without this vector are still reachable by content.
    auto backup = search_vector(memory::NamedVector::Content, query, label, limit);
    if (!backup.ok()) {
      return ResultT::propagate(backup);
    }
    count_search(strategy.kind, 2, true);
    return ResultT::success(to_ranked(memory::NamedVector::Content, std::move(backup.value())));
  }

  const auto per_vector = limit * std::max<std::size_t>(config_.overfetch_factor, 1);
  const bool needs_emotion = strategy.weights.contains(memory::NamedVector::Emotion) &&
                             strategy.weights.at(memory::NamedVector::Emotion) > 0.0;
  const std::string label = needs_emotion ? query_emotion_label(query) : "neutral";

  std::vector<std::pair<memory::NamedVector, std::vector<memory::ScoredRecord>>> lists;
  for (const auto &[vector, weight] : strategy.weights) {
    if (weight <= 0.0) {
      continue;
    }
    auto hits = search_vector(vector, query, label, per_vector);
    if (!hits.ok()) {
      return ResultT::propagate(hits);
    }
    lists.emplace_back(vector, std::move(hits.value()));
  }
  count_search(strategy.kind, lists.size(), false);
  return ResultT::success(merge_weighted(lists, strategy.weights, limit));
}

void VectorFusionEngine::count_search(const query::StrategyKind kind, const std::size_t vectors,
                                      const bool backup) {
  std::lock_guard<std::mutex> lock(stats_mutex_);
  ++stats_.searches[kind];
  stats_.vector_queries += vectors;
  if (backup) {
    ++stats_.backup_searches;
  }
}

FusionStats VectorFusionEngine::stats() const {
  std::lock_guard<std::mutex> lock(stats_mutex_);
  return stats_;
}

} // namespace memroute::retrieval
