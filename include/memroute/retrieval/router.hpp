#pragma once

#include "memroute/common/result.hpp"
#include "memroute/config/schema.hpp"
#include "memroute/knowledge/graph_store.hpp"
#include "memroute/memory/memory_store.hpp"
#include "memroute/query/classifier.hpp"
#include "memroute/retrieval/fusion_engine.hpp"

#include <chrono>
#include <memory>
#include <string>
#include <vector>

namespace memroute::retrieval {

class WorkerLimit;

enum class ErrorKind {
  BackendUnavailable,
  BackendTimeout,
  ContradictionUnresolved,
  InvalidInput,
  Internal,
};

[[nodiscard]] const char *error_kind_to_string(ErrorKind kind);

struct ComponentFailure {
  std::string component;
  ErrorKind kind = ErrorKind::Internal;
  std::string message;
};

/// Memories, facts and related entities stay in separate lists, each ranked by its own source.
struct UnifiedResult {
  query::Classification classification;
  // "temporal" or "fusion".
  std::string path;
  query::StrategyKind strategy_used = query::StrategyKind::BalancedFusion;
  std::vector<RankedMemory> memories;
  std::vector<knowledge::Fact> facts;
  std::vector<knowledge::RelatedEntity> related;
  std::vector<ComponentFailure> degraded;
  bool used_fallback = false;
  std::chrono::milliseconds elapsed{0};
};

struct RouterOptions {
  config::RouterConfig router;
  config::KnowledgeConfig knowledge;
  config::TemporalConfig temporal;
};

class QueryRouter {
public:
  QueryRouter(std::shared_ptr<const query::QueryClassifier> classifier,
              std::shared_ptr<VectorFusionEngine> fusion,
              std::shared_ptr<memory::IMemoryStore> memories,
              std::shared_ptr<knowledge::IKnowledgeGraphStore> knowledge, RouterOptions options);

  /// Same clock rule as `QueryClassifier::classify(query)`.
  [[nodiscard]] query::Classification classify(const query::Query &query) const;

  /// Fails only when every launched component failed; otherwise degraded components
  /// come back empty and are listed in `degraded`.
  [[nodiscard]] common::Result<UnifiedResult> retrieve(const query::Query &query,
                                                       std::size_t limit);
  [[nodiscard]] common::Result<UnifiedResult> retrieve(const query::Query &query,
                                                       std::size_t limit,
                                                       common::UnixSeconds now);

  [[nodiscard]] common::Result<knowledge::StoreFactResult>
  store_fact(const knowledge::FactInput &input);

  /// Worker threads still running, including ones whose caller already timed out.
  [[nodiscard]] std::size_t workers_in_flight() const;

private:
  [[nodiscard]] common::Result<UnifiedResult> retrieve_temporal(const query::Query &query,
                                                                UnifiedResult result,
                                                                std::size_t limit);
  [[nodiscard]] common::Result<UnifiedResult> retrieve_fused(const query::Query &query,
                                                             UnifiedResult result,
                                                             std::size_t limit);

  std::shared_ptr<const query::QueryClassifier> classifier_;
  std::shared_ptr<VectorFusionEngine> fusion_;
  std::shared_ptr<memory::IMemoryStore> memories_;
  std::shared_ptr<knowledge::IKnowledgeGraphStore> knowledge_;
  RouterOptions options_;
  // Shared by every sub-operation; a stalled backend cannot pile up threads past the cap.
  std::shared_ptr<WorkerLimit> workers_;
};

} // namespace memroute::retrieval
