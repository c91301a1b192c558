#include "test_framework.hpp"

#include "memroute/knowledge/sqlite_graph_store.hpp"
#include "memroute/memory/ingest.hpp"
#include "memroute/memory/sqlite_store.hpp"
#include "memroute/ports/embedder_local.hpp"
#include "memroute/retrieval/pending_call.hpp"
#include "memroute/retrieval/router.hpp"
#include "memroute/runtime/context.hpp"
#include "tests/helpers/test_helpers.hpp"

#include <chrono>
#include <memory>
#include <optional>
#include <stdexcept>
#include <thread>

namespace {

namespace kg = memroute::knowledge;
namespace mem = memroute::memory;
namespace q = memroute::query;
namespace rt = memroute::retrieval;
namespace mt = memroute::testing;
using memroute::common::kSecondsPerDay;
using memroute::common::kSecondsPerHour;

constexpr std::size_t kDims = 64;
constexpr memroute::common::UnixSeconds kNow = 1700000000;

rt::RouterOptions test_options() {
  rt::RouterOptions options;
  options.router.vector_timeout_ms = 2000;
  options.router.facts_timeout_ms = 2000;
  options.router.related_timeout_ms = 2000;
  options.temporal.fallback_score_threshold = 0.0;
  return options;
}

struct RouterFixture {
  mt::TempWorkspace workspace;
  std::shared_ptr<mt::FaultyMemoryStore> memories;
  std::shared_ptr<mt::FaultyKnowledgeStore> knowledge;
  std::shared_ptr<memroute::ports::IEmbedder> embedder =
      std::make_shared<memroute::ports::LocalEmbedder>(kDims);
  std::shared_ptr<mt::FixedEmotionClassifier> emotion =
      std::make_shared<mt::FixedEmotionClassifier>();
  std::shared_ptr<rt::QueryRouter> router;

  explicit RouterFixture(rt::RouterOptions options = test_options()) {
    auto memory_store = mem::SqliteMemoryStore::open(workspace.path() / "memories.db", kDims);
    if (!memory_store.ok()) {
      throw std::runtime_error(memory_store.error());
    }
    memories = std::make_shared<mt::FaultyMemoryStore>(std::move(memory_store.value()));

    auto graph = kg::SqliteKnowledgeGraphStore::open(workspace.path() / "knowledge.db",
                                                     options.knowledge);
    if (!graph.ok()) {
      throw std::runtime_error(graph.error());
    }
    knowledge = std::make_shared<mt::FaultyKnowledgeStore>(std::move(graph.value()));

    auto classifier = std::make_shared<q::QueryClassifier>(
        q::default_classifier_config(), q::TemporalQueryDetector(options.temporal));
    auto fusion = std::make_shared<rt::VectorFusionEngine>(embedder, emotion, memories,
                                                           memroute::config::FusionConfig{});
    router = std::make_shared<rt::QueryRouter>(classifier, fusion, memories, knowledge, options);
  }

  ~RouterFixture() {
    // Release any worker still parked on a stalled fake.
    memories->gate().open();
    knowledge->gate().open();
  }

  RouterFixture(const RouterFixture &) = delete;
  RouterFixture &operator=(const RouterFixture &) = delete;

  void remember(const std::string &content, const memroute::common::UnixSeconds timestamp) {
    mem::MemoryIngestor ingestor(embedder, emotion, memories);
    auto written = ingestor.ingest("alice", content, timestamp);
    if (!written.ok()) {
      throw std::runtime_error(written.error());
    }
  }

  void fact(const std::string &entity, const std::string &type, const std::string &relationship,
            const double confidence) {
    auto stored = router->store_fact(kg::FactInput{.user_id = "alice",
                                                   .entity_name = entity,
                                                   .entity_type = type,
                                                   .relationship = relationship,
                                                   .confidence = confidence,
                                                   .mentioned_at = kNow});
    if (!stored.ok()) {
      throw std::runtime_error(stored.error());
    }
  }

  memroute::common::Result<rt::UnifiedResult> ask(const std::string &text,
                                                  const std::string &user = "alice",
                                                  const std::size_t limit = 5) {
    return router->retrieve(q::Query{.text = text, .user_id = user}, limit, kNow);
  }
};

bool has_failure(const rt::UnifiedResult &result, const std::string &component,
                 const rt::ErrorKind kind) {
  for (const auto &failure : result.degraded) {
    if (failure.component == component && failure.kind == kind) {
      return true;
    }
  }
  return false;
}

} // namespace

void register_router_tests(std::vector<memroute::tests::TestCase> &tests) {
  using memroute::tests::require;
  namespace ob = memroute::observability;

  tests.push_back({"router_first_question_reads_session_oldest_first", [] {
                     RouterFixture fixture;
                     fixture.remember("last week we planned the garden", kNow - 8 * kSecondsPerDay);
                     fixture.remember("we started with the tomato seedlings", kNow - 3 * kSecondsPerHour);
                     fixture.remember("then we picked the raised bed wood", kNow - 2 * kSecondsPerHour);
                     fixture.remember("finally we chose the compost", kNow - 1 * kSecondsPerHour);
                     fixture.remember("and one more detail", kNow - 30 * 60);

                     auto result = fixture.ask("What was the first thing we talked about?");
                     require(result.ok(), result.error());
                     const auto &unified = result.value();
                     require(unified.path == "temporal", "temporal path expected");
                     require(!unified.used_fallback, "session has records");
                     require(unified.memories.size() == 3, "oldest limit should apply");
                     require(unified.memories[0].record.content.find("tomato") != std::string::npos,
                             "earliest session record should lead");
                     require(unified.memories[0].temporal_rank == std::optional<std::size_t>(1),
                             "temporal rank mismatch");
                     for (std::size_t i = 1; i < unified.memories.size(); ++i) {
                       require(unified.memories[i - 1].record.timestamp <
                                   unified.memories[i].record.timestamp,
                               "oldest-first reads must be ascending");
                     }
                     require(fixture.memories->search_calls == 0,
                             "temporal reads should not run similarity search");
                   }});

  tests.push_back({"router_recent_question_reads_newest_first", [] {
                     RouterFixture fixture;
                     fixture.remember("breakfast was pancakes", kNow - 5 * kSecondsPerHour);
                     fixture.remember("lunch was a salad", kNow - 2 * kSecondsPerHour);
                     fixture.remember("old news from last month", kNow - 30 * kSecondsPerDay);

                     auto result = fixture.ask("what did I mention most recently?");
                     require(result.ok(), result.error());
                     const auto &memories = result.value().memories;
                     require(memories.size() == 2, "only the last day should be read");
                     require(memories[0].record.content == "lunch was a salad",
                             "newest record should lead");
                     require(memories[0].record.timestamp > memories[1].record.timestamp,
                             "newest-first reads must be descending");
                   }});

  tests.push_back({"router_empty_session_falls_back_to_content", [] {
                     RouterFixture fixture;
                     fixture.remember("we first talked about sourdough bread", kNow - 10 * kSecondsPerDay);

                     auto result = fixture.ask("what was the first thing we said about sourdough");
                     require(result.ok(), result.error());
                     require(result.value().path == "temporal", "temporal path expected");
                     require(result.value().used_fallback, "empty session should fall back");
                     require(result.value().strategy_used == q::StrategyKind::ContentOnly,
                             "fallback uses content search");
                     require(result.value().memories.size() == 1, "fallback should find the record");
                     require(!result.value().memories[0].temporal_rank.has_value(),
                             "fallback results carry no temporal rank");
                   }});

  tests.push_back({"router_chronological_failure_uses_content_fallback", [] {
                     RouterFixture fixture;
                     fixture.remember("the latest plan is to repaint the kitchen", kNow - kSecondsPerHour);
                     fixture.memories->fail_chronological = true;

                     auto result = fixture.ask("what is the latest plan?");
                     require(result.ok(), result.error());
                     require(has_failure(result.value(), "chronological",
                                         rt::ErrorKind::BackendUnavailable),
                             "chronological failure should be listed");
                     require(result.value().used_fallback, "fallback expected");
                     require(!result.value().memories.empty(), "content fallback should answer");
                   }});

  tests.push_back({"router_factual_query_returns_memories_and_facts", [] {
                     RouterFixture fixture;
                     fixture.remember("we had pizza at the lake house", kNow - 3 * kSecondsPerDay);
                     fixture.fact("pizza", "food", "likes", 0.9);
                     fixture.fact("sushi", "food", "loves", 0.7);
                     fixture.fact("tennis", "hobby", "plays", 0.8);

                     auto result = fixture.ask("What foods do I like?");
                     require(result.ok(), result.error());
                     const auto &unified = result.value();
                     require(unified.path == "fusion", "fusion path expected");
                     require(unified.classification.category == q::Category::Factual,
                             "factual classification expected");
                     require(unified.degraded.empty(), "nothing should degrade");
                     require(unified.facts.size() == 2, "food preferences expected");
                     require(unified.facts[0].entity.name == "pizza", "best fact should lead");
                     require(unified.memories.size() == 1, "memory search should run alongside");
                   }});

  tests.push_back({"router_rejects_missing_user", [] {
                     RouterFixture fixture;
                     auto result = fixture.ask("What foods do I like?", "  ");
                     require(!result.ok(), "blank user should fail");
                     require(result.error().find("invalid_input") != std::string::npos,
                             "error kind should be reported");
                   }});

  tests.push_back({"router_empty_text_returns_empty_result", [] {
                     RouterFixture fixture;
                     fixture.remember("something", kNow - 60);
                     auto result = fixture.ask("   ");
                     require(result.ok(), result.error());
                     require(result.value().memories.empty() && result.value().facts.empty(),
                             "empty text should retrieve nothing");
                     require(result.value().classification.category == q::Category::General,
                             "empty text is general");
                   }});

  tests.push_back({"router_vector_failure_keeps_facts", [] {
                     RouterFixture fixture;
                     fixture.fact("ramen", "food", "likes", 0.8);
                     fixture.memories->fail_search = true;

                     auto result = fixture.ask("What foods do I like?");
                     require(result.ok(), result.error());
                     require(has_failure(result.value(), "vector_fusion",
                                         rt::ErrorKind::BackendUnavailable),
                             "vector failure should be listed");
                     require(result.value().memories.empty(), "no memories expected");
                     require(result.value().facts.size() == 1, "facts should still arrive");
                   }});

  tests.push_back({"router_vector_stall_times_out", [] {
                     auto options = test_options();
                     options.router.vector_timeout_ms = 50;
                     RouterFixture fixture(options);
                     fixture.fact("ramen", "food", "likes", 0.8);
                     fixture.memories->stall_search = true;

                     auto result = fixture.ask("What foods do I like?");
                     fixture.memories->gate().open();
                     require(result.ok(), result.error());
                     require(has_failure(result.value(), "vector_fusion", rt::ErrorKind::BackendTimeout),
                             "stall should be reported as a timeout");
                     require(result.value().facts.size() == 1, "facts should not wait on vectors");
                     require(result.value().elapsed < std::chrono::milliseconds(1500),
                             "router should not wait for the stalled search");
                   }});

  tests.push_back({"router_worker_limit_refuses_launches_while_backend_stalls", [] {
                     auto options = test_options();
                     options.router.vector_timeout_ms = 50;
                     options.router.max_inflight_workers = 1;
                     RouterFixture fixture(options);
                     fixture.memories->stall_search = true;

                     auto stalled = fixture.ask("hello there");
                     require(!stalled.ok(), "stalled search should leave nothing to return");
                     require(fixture.router->workers_in_flight() == 1,
                             "abandoned worker should still count");

                     auto refused = fixture.ask("hello there");
                     require(!refused.ok(), "launch past the cap should fail");
                     require(refused.error().find("worker limit reached") != std::string::npos,
                             "refusal should name the cap: " + refused.error());
                     require(fixture.memories->search_calls == 1,
                             "refused launch should not reach the store");

                     fixture.memories->stall_search = false;
                     fixture.memories->gate().open();
                     const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(2);
                     while (fixture.router->workers_in_flight() > 0 &&
                            std::chrono::steady_clock::now() < deadline) {
                       std::this_thread::sleep_for(std::chrono::milliseconds(1));
                     }
                     require(fixture.router->workers_in_flight() == 0,
                             "finished worker should release its slot");
                     auto recovered = fixture.ask("hello there");
                     require(recovered.ok(), recovered.error());
                   }});

  tests.push_back({"router_pending_call_releases_limit_after_completion", [] {
                     auto limit = std::make_shared<rt::WorkerLimit>(1);
                     auto gate = std::make_shared<mt::Gate>();
                     auto held = rt::PendingCall<int>::launch(
                         [gate]() {
                           gate->hold(std::chrono::milliseconds(2000));
                           return memroute::common::Result<int>::success(1);
                         },
                         limit);
                     auto refused = rt::PendingCall<int>::launch(
                         []() { return memroute::common::Result<int>::success(2); }, limit);
                     const auto soon = std::chrono::steady_clock::now() + std::chrono::seconds(1);
                     auto refusal = refused.wait_until(soon);
                     require(refusal.has_value() && !refusal->ok(), "second launch should fail");

                     gate->open();
                     auto first = held.wait_until(std::chrono::steady_clock::now() +
                                                  std::chrono::seconds(2));
                     require(first.has_value() && first->ok() && first->value() == 1,
                             "held call should finish");
                     const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(2);
                     while (limit->active() > 0 && std::chrono::steady_clock::now() < deadline) {
                       std::this_thread::sleep_for(std::chrono::milliseconds(1));
                     }
                     auto next = rt::PendingCall<int>::launch(
                         []() { return memroute::common::Result<int>::success(3); }, limit);
                     auto third = next.wait_until(std::chrono::steady_clock::now() +
                                                  std::chrono::seconds(2));
                     require(third.has_value() && third->ok() && third->value() == 3,
                             "slot should be reusable");
                   }});

  tests.push_back({"router_fails_when_every_component_fails", [] {
                     RouterFixture fixture;
                     fixture.memories->fail_search = true;
                     fixture.knowledge->fail_facts = true;
                     mt::ObserverScope scope;

                     auto result = fixture.ask("What foods do I like?");
                     require(!result.ok(), "total failure should be an error");
                     require(result.error().find("vector_fusion") != std::string::npos &&
                                 result.error().find("facts") != std::string::npos,
                             "error should name the failed components");
                     require(!scope.log().events_of<ob::ErrorEvent>().empty(),
                             "error event expected");
                   }});

  tests.push_back({"router_general_query_uses_balanced_fusion", [] {
                     RouterFixture fixture;
                     fixture.remember("a quiet evening reading", kNow - kSecondsPerDay);

                     auto result = fixture.router->retrieve(
                         q::Query{.text = "hello there", .user_id = "alice"}, 5, kNow);
                     require(result.ok(), result.error());
                     require(result.value().strategy_used == q::StrategyKind::BalancedFusion,
                             "general queries use balanced fusion");
                     require(!result.value().used_fallback, "no fallback when vectors work");
                     require(!result.value().memories.empty(), "balanced fusion should answer");
                   }});

  tests.push_back({"router_related_entities_from_similarity_query", [] {
                     RouterFixture fixture;
                     fixture.fact("pizza", "food", "likes", 0.8);
                     fixture.fact("pepperoni pizza", "food", "likes", 0.8);
                     fixture.fact("margherita pizza", "food", "likes", 0.7);

                     auto result = fixture.ask("anything similar to pepperoni pizza?");
                     require(result.ok(), result.error());
                     const auto &related = result.value().related;
                     require(related.size() == 2, "two related entities expected");
                     require(related[0].entity.name == "pizza" && related[0].hops == 1,
                             "direct neighbour should lead");
                   }});

  tests.push_back({"router_store_fact_resolves_contradictions", [] {
                     RouterFixture fixture;
                     fixture.fact("olives", "food", "likes", 0.6);
                     auto stored = fixture.router->store_fact(kg::FactInput{.user_id = "alice",
                                                                            .entity_name = "olives",
                                                                            .entity_type = "food",
                                                                            .relationship = "dislikes",
                                                                            .confidence = 0.9});
                     require(stored.ok(), stored.error());
                     require(stored.value().outcome == kg::StoreOutcome::ReplacedOpposite,
                             "stronger opposite should replace");
                   }});

  tests.push_back({"router_emits_classification_and_retrieval_events", [] {
                     RouterFixture fixture;
                     fixture.remember("we adopted a kitten", kNow - kSecondsPerDay);
                     mt::ObserverScope scope;

                     auto result = fixture.ask("I feel so happy about the kitten");
                     require(result.ok(), result.error());
                     const auto classified = scope.log().events_of<ob::QueryClassifiedEvent>();
                     require(classified.size() == 1 && classified[0].category == "emotional",
                             "classification event expected");
                     const auto retrievals = scope.log().events_of<ob::RetrievalEvent>();
                     require(retrievals.size() == 1 && retrievals[0].path == "fusion",
                             "retrieval event expected");
                     require(retrievals[0].memories == result.value().memories.size(),
                             "event should count memories");
                   }});

  tests.push_back({"router_context_wires_configured_components", [] {
                     mt::TempWorkspace workspace;
                     auto config = mt::temp_config(workspace);
                     config.router.vector_timeout_ms = 2000;
                     config.router.facts_timeout_ms = 2000;
                     auto context = memroute::runtime::create_context(config);
                     require(context.ok(), context.error());
                     auto &ctx = *context.value();
                     require(ctx.embedder->dimensions() == 64, "configured dimensions expected");
                     require(ctx.emotion->name() == "lexicon", "lexicon emotion expected");

                     auto written = ctx.ingestor->ingest("alice", "I love hiking in the mountains",
                                                         kNow - kSecondsPerHour);
                     require(written.ok(), written.error());
                     auto result = ctx.router->retrieve(
                         q::Query{.text = "hiking", .user_id = "alice"}, 3, kNow);
                     require(result.ok(), result.error());
                     require(result.value().memories.size() == 1, "ingested memory expected");
                     require(ctx.memories->health_check() && ctx.knowledge->health_check(),
                             "stores should be healthy");
                   }});
}
