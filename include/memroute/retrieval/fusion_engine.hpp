#pragma once

#include "memroute/common/result.hpp"
#include "memroute/config/schema.hpp"
#include "memroute/memory/memory_store.hpp"
#include "memroute/ports/embedder.hpp"
#include "memroute/ports/emotion.hpp"
#include "memroute/query/types.hpp"

#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

namespace memroute::retrieval {

struct RankedMemory {
  memory::MemoryRecord record;
  double score = 0.0;
  // Cosine score per searched vector, before weighting.
  std::map<memory::NamedVector, double> vector_scores;
  // 1-based position in a chronological read.
  std::optional<std::size_t> temporal_rank;
};

struct FusionStats {
  std::map<query::StrategyKind, std::size_t> searches;
  std::size_t backup_searches = 0;
  std::size_t vector_queries = 0;
};

/// Runs single- or multi-vector similarity search and merges the per-vector lists.
class VectorFusionEngine {
public:
  VectorFusionEngine(std::shared_ptr<ports::IEmbedder> embedder,
                     std::shared_ptr<ports::IEmotionClassifier> emotion,
                     std::shared_ptr<memory::IMemoryStore> store, config::FusionConfig config);

  [[nodiscard]] common::Result<std::vector<RankedMemory>>
  search(const query::Query &query, const query::VectorStrategy &strategy, std::size_t limit);

  [[nodiscard]] FusionStats stats() const;

private:
  [[nodiscard]] common::Result<std::vector<memory::ScoredRecord>>
  search_vector(memory::NamedVector vector, const query::Query &query,
                const std::string &emotion_label, std::size_t limit);
  [[nodiscard]] std::string query_emotion_label(const query::Query &query);
  void count_search(query::StrategyKind kind, std::size_t vectors, bool backup);

  std::shared_ptr<ports::IEmbedder> embedder_;
  std::shared_ptr<ports::IEmotionClassifier> emotion_;
  std::shared_ptr<memory::IMemoryStore> store_;
  config::FusionConfig config_;
  mutable std::mutex stats_mutex_;
  FusionStats stats_;
};

/// Sums `weight * score` per record across lists, best first; ties go to the newer record.
[[nodiscard]] std::vector<RankedMemory>
merge_weighted(const std::vector<std::pair<memory::NamedVector, std::vector<memory::ScoredRecord>>> &lists,
               const std::map<memory::NamedVector, double> &weights, std::size_t limit);

} // namespace memroute::retrieval
