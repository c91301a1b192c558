#include "memroute/retrieval/router.hpp"

#include "memroute/common/fs.hpp"
#include "memroute/observability/global.hpp"
#include "memroute/query/fact_intent.hpp"
#include "memroute/query/temporal_detector.hpp"
#include "memroute/retrieval/pending_call.hpp"

#include <algorithm>

namespace memroute::retrieval {

namespace {

using Clock = std::chrono::steady_clock;

struct VectorOutcome {
  std::vector<RankedMemory> memories;
  query::StrategyKind strategy = query::StrategyKind::ContentOnly;
  bool fell_back = false;
};

std::chrono::milliseconds elapsed_since(const Clock::time_point start) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - start);
}

// Waits for one component and turns a timeout or failure into a degraded entry.
template <typename T>
std::optional<T> settle(PendingCall<T> &call, const std::string &component,
                        const Clock::time_point started, const std::chrono::milliseconds budget,
                        UnifiedResult &result) {
  auto outcome = call.wait_until(started + budget);
  observability::record_component_latency(component, elapsed_since(started));
  if (!outcome.has_value()) {
    const std::string message = "timed out after " + std::to_string(budget.count()) + "ms";
    result.degraded.push_back(ComponentFailure{
        .component = component, .kind = ErrorKind::BackendTimeout, .message = message});
    observability::record_degraded(component, message);
    return std::nullopt;
  }
  if (!outcome->ok()) {
    result.degraded.push_back(ComponentFailure{.component = component,
                                               .kind = ErrorKind::BackendUnavailable,
                                               .message = outcome->error()});
    observability::record_degraded(component, outcome->error());
    return std::nullopt;
  }
  return std::move(outcome->value());
}

void report(const UnifiedResult &result) {
  observability::record_event(observability::RetrievalEvent{
      .path = result.path,
      .memories = result.memories.size(),
      .facts = result.facts.size(),
      .related = result.related.size(),
      .degraded_components = result.degraded.size(),
      .duration = result.elapsed});
  observability::record_metric(observability::RequestLatencyMetric{.latency = result.elapsed});
}

std::string describe_failures(const std::vector<ComponentFailure> &failures) {
  std::string out;
  for (const auto &failure : failures) {
    if (!out.empty()) {
      out += "; ";
    }
    out += failure.component + " (" + error_kind_to_string(failure.kind) + "): " + failure.message;
  }
  return out;
}

} // namespace

const char *error_kind_to_string(const ErrorKind kind) {
  switch (kind) {
  case ErrorKind::BackendUnavailable:
    return "backend_unavailable";
  case ErrorKind::BackendTimeout:
    return "backend_timeout";
  case ErrorKind::ContradictionUnresolved:
    return "contradiction_unresolved";
  case ErrorKind::InvalidInput:
    return "invalid_input";
  case ErrorKind::Internal:
    return "internal";
  }
  return "internal";
}

QueryRouter::QueryRouter(std::shared_ptr<const query::QueryClassifier> classifier,
                         std::shared_ptr<VectorFusionEngine> fusion,
                         std::shared_ptr<memory::IMemoryStore> memories,
                         std::shared_ptr<knowledge::IKnowledgeGraphStore> knowledge,
                         RouterOptions options)
    : classifier_(std::move(classifier)), fusion_(std::move(fusion)),
      memories_(std::move(memories)), knowledge_(std::move(knowledge)),
      options_(std::move(options)),
      workers_(std::make_shared<WorkerLimit>(options_.router.max_inflight_workers)) {}

std::size_t QueryRouter::workers_in_flight() const { return workers_->active(); }

query::Classification QueryRouter::classify(const query::Query &query) const {
  return classifier_->classify(query);
}

common::Result<UnifiedResult> QueryRouter::retrieve(const query::Query &query,
                                                    const std::size_t limit) {
  return retrieve(query, limit, query.turn_timestamp.value_or(common::now_unix()));
}

common::Result<UnifiedResult> QueryRouter::retrieve(const query::Query &query,
                                                    const std::size_t limit,
                                                    const common::UnixSeconds now) {
  if (common::trim(query.user_id).empty()) {
    return common::Result<UnifiedResult>::failure(
        std::string(error_kind_to_string(ErrorKind::InvalidInput)) + ": user id is required");
  }
  const std::size_t effective_limit = limit == 0 ? options_.router.default_limit : limit;

  UnifiedResult result;
  result.classification = classifier_->classify(query, now);
  result.strategy_used = result.classification.strategy.kind;
  observability::record_event(observability::QueryClassifiedEvent{
      .category = std::string(query::category_to_string(result.classification.category)),
      .strategy = std::string(query::strategy_kind_to_string(result.classification.strategy.kind)),
      .confidence = result.classification.confidence,
      .temporal = result.classification.temporal.has_value()});

  if (common::trim(query.text).empty()) {
    result.path = "fusion";
    report(result);
    return common::Result<UnifiedResult>::success(std::move(result));
  }
  if (result.classification.temporal.has_value()) {
    return retrieve_temporal(query, std::move(result), effective_limit);
  }
  return retrieve_fused(query, std::move(result), effective_limit);
}

common::Result<UnifiedResult> QueryRouter::retrieve_temporal(const query::Query &query,
                                                             UnifiedResult result,
                                                             const std::size_t limit) {
  const auto started = Clock::now();
  const auto budget = std::chrono::milliseconds(options_.router.vector_timeout_ms);
  const query::TemporalWindow &window = result.classification.temporal->window;
  result.path = "temporal";

  auto store = memories_;
  const std::string user_id = query.user_id;
  const auto range = query::to_chronological_range(window);
  auto chronological = PendingCall<std::vector<memory::MemoryRecord>>::launch(
      [store, user_id, range]() { return store->chronological(user_id, range); },
      workers_);
  auto records = settle(chronological, "chronological", started, budget, result);

  if (records.has_value()) {
    std::size_t rank = 0;
    for (auto &record : *records) {
      RankedMemory ranked;
      ranked.record = std::move(record);
      ranked.score = 1.0;
      ranked.temporal_rank = ++rank;
      result.memories.push_back(std::move(ranked));
    }
  }

  const bool empty_session = records.has_value() && result.memories.empty() &&
                             window.scope == query::TemporalScope::Session;
  if (records.has_value() && !empty_session) {
    result.elapsed = elapsed_since(started);
    report(result);
    return common::Result<UnifiedResult>::success(std::move(result));
  }

  // Nothing in the session window (or no chronological read): fall back to content similarity.
  auto fusion = fusion_;
  const query::Query fallback_query = query;
  const double threshold = options_.temporal.fallback_score_threshold;
  const auto fallback_started = Clock::now();
  auto fallback = PendingCall<std::vector<RankedMemory>>::launch(
      [fusion, fallback_query, limit, threshold]() {
        auto found =
            fusion->search(fallback_query, query::VectorStrategy::content_only(), limit);
        if (!found.ok()) {
          return found;
        }
        auto &hits = found.value();
        hits.erase(std::remove_if(hits.begin(), hits.end(),
                                  [threshold](const RankedMemory &m) { return m.score < threshold; }),
                   hits.end());
        return found;
      },
      workers_);
  auto similar = settle(fallback, "content_fallback", fallback_started, budget, result);
  result.used_fallback = true;
  result.strategy_used = query::StrategyKind::ContentOnly;
  result.elapsed = elapsed_since(started);
  if (!records.has_value() && !similar.has_value()) {
    report(result);
    return common::Result<UnifiedResult>::failure("all retrieval components failed: " +
                                                  describe_failures(result.degraded));
  }
  if (similar.has_value()) {
    result.memories = std::move(*similar);
  }
  report(result);
  return common::Result<UnifiedResult>::success(std::move(result));
}

common::Result<UnifiedResult> QueryRouter::retrieve_fused(const query::Query &query,
                                                          UnifiedResult result,
                                                          const std::size_t limit) {
  const auto started = Clock::now();
  result.path = "fusion";
  const auto &classification = result.classification;

  auto fusion = fusion_;
  const query::Query vector_query = query;
  const query::VectorStrategy strategy = classification.strategy;
  auto vector_call = PendingCall<VectorOutcome>::launch([fusion, vector_query, strategy, limit]() {
    using ResultT = common::Result<VectorOutcome>;
    auto found = fusion->search(vector_query, strategy, limit);
    if (found.ok()) {
      return ResultT::success(VectorOutcome{
          .memories = std::move(found.value()), .strategy = strategy.kind, .fell_back = false});
    }
    if (strategy.kind == query::StrategyKind::ContentOnly) {
      return ResultT::propagate(found);
    }
    observability::record_degraded("vector_fusion",
                                   found.error() + "; retrying with content only");
    auto content = fusion->search(vector_query, query::VectorStrategy::content_only(), limit);
    if (!content.ok()) {
      return ResultT::failure(found.error() + "; content fallback: " + content.error());
    }
    return ResultT::success(VectorOutcome{.memories = std::move(content.value()),
                                          .strategy = query::StrategyKind::ContentOnly,
                                          .fell_back = true});
  }, workers_);

  std::optional<PendingCall<std::vector<knowledge::Fact>>> facts_call;
  if (classification.includes(query::Category::Factual) && knowledge_ != nullptr) {
    auto store = knowledge_;
    const std::string user_id = query.user_id;
    const auto filter = query::infer_fact_filter(query.text, classifier_->config());
    const std::size_t fact_limit = options_.knowledge.fact_limit;
    facts_call = PendingCall<std::vector<knowledge::Fact>>::launch(
        [store, user_id, filter, fact_limit]() {
          return store->get_user_facts(user_id, filter, fact_limit);
        },
        workers_);
  }

  std::optional<PendingCall<std::vector<knowledge::RelatedEntity>>> related_call;
  if (const auto seed = query::related_entity_seed(query.text);
      seed.has_value() && knowledge_ != nullptr) {
    auto store = knowledge_;
    const std::string entity = *seed;
    const std::uint32_t hops = options_.knowledge.max_hops;
    related_call = PendingCall<std::vector<knowledge::RelatedEntity>>::launch(
        [store, entity, hops]() { return store->get_related_entities(entity, hops); },
        workers_);
  }

  std::size_t launched = 1;
  std::size_t succeeded = 0;

  auto vectors = settle(vector_call, "vector_fusion", started,
                        std::chrono::milliseconds(options_.router.vector_timeout_ms), result);
  if (vectors.has_value()) {
    ++succeeded;
    result.memories = std::move(vectors->memories);
    result.strategy_used = vectors->strategy;
    result.used_fallback = vectors->fell_back;
  }
  if (facts_call.has_value()) {
    ++launched;
    auto facts = settle(*facts_call, "facts", started,
                        std::chrono::milliseconds(options_.router.facts_timeout_ms), result);
    if (facts.has_value()) {
      ++succeeded;
      result.facts = std::move(*facts);
    }
  }
  if (related_call.has_value()) {
    ++launched;
    auto related = settle(*related_call, "related_entities", started,
                          std::chrono::milliseconds(options_.router.related_timeout_ms), result);
    if (related.has_value()) {
      ++succeeded;
      result.related = std::move(*related);
    }
  }

  result.elapsed = elapsed_since(started);
  report(result);
  if (succeeded == 0) {
    observability::record_error("router", "all " + std::to_string(launched) +
                                              " retrieval components failed");
    return common::Result<UnifiedResult>::failure("all retrieval components failed: " +
                                                  describe_failures(result.degraded));
  }
  return common::Result<UnifiedResult>::success(std::move(result));
}

common::Result<knowledge::StoreFactResult>
QueryRouter::store_fact(const knowledge::FactInput &input) {
  if (knowledge_ == nullptr) {
    return common::Result<knowledge::StoreFactResult>::failure("knowledge store not configured");
  }
  return knowledge_->store_fact(input);
}

} // namespace memroute::retrieval
