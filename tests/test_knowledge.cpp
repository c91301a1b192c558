#include "test_framework.hpp"

#include "memroute/knowledge/relationships.hpp"
#include "memroute/knowledge/sqlite_graph_store.hpp"
#include "tests/helpers/test_helpers.hpp"

#include <algorithm>
#include <cmath>
#include <memory>
#include <optional>
#include <stdexcept>

namespace {

namespace kg = memroute::knowledge;

constexpr memroute::common::UnixSeconds kNow = 1700000000;

memroute::common::UnixSeconds days_ago(const int days) {
  return kNow - static_cast<memroute::common::UnixSeconds>(days) * memroute::common::kSecondsPerDay;
}

std::unique_ptr<kg::SqliteKnowledgeGraphStore>
open_graph(const memroute::testing::TempWorkspace &ws,
           const memroute::config::KnowledgeConfig &config = {}) {
  auto store = kg::SqliteKnowledgeGraphStore::open(ws.path() / "knowledge.db", config);
  if (!store.ok()) {
    throw std::runtime_error(store.error());
  }
  return std::move(store.value());
}

kg::StoreOutcome store(kg::IKnowledgeGraphStore &graph, const std::string &entity,
                       const std::string &relationship, const double confidence,
                       const std::string &type = "food",
                       const std::optional<memroute::common::UnixSeconds> at = kNow) {
  auto result = graph.store_fact(kg::FactInput{.user_id = "alice",
                                               .entity_name = entity,
                                               .entity_type = type,
                                               .relationship = relationship,
                                               .confidence = confidence,
                                               .mentioned_at = at});
  if (!result.ok()) {
    throw std::runtime_error(result.error());
  }
  return result.value().outcome;
}

std::vector<kg::Fact> facts_for(kg::IKnowledgeGraphStore &graph,
                                const kg::FactFilter &filter = {}) {
  auto facts = graph.get_user_facts("alice", filter, 20);
  if (!facts.ok()) {
    throw std::runtime_error(facts.error());
  }
  return facts.value();
}

} // namespace

void register_knowledge_tests(std::vector<memroute::tests::TestCase> &tests) {
  using memroute::tests::require;
  using memroute::tests::require_near;
  namespace mt = memroute::testing;
  namespace ob = memroute::observability;

  tests.push_back({"knowledge_relationship_tables", [] {
                     const auto &opposites = kg::opposing_relationships("likes");
                     require(std::find(opposites.begin(), opposites.end(), "dislikes") !=
                                 opposites.end(),
                             "likes should oppose dislikes");
                     require(kg::opposing_relationships("mentions").empty(),
                             "mentions has no opposite");
                     require(kg::similar_relationships("enjoys").size() == 4,
                             "positive group should have four members");
                     require(kg::similar_relationships("visited") ==
                                 std::vector<std::string>{"visited"},
                             "ungrouped relationship should map to itself");
                     require(kg::staleness_limit_days("wants") == 90, "wants limit mismatch");
                     require(!kg::staleness_limit_days("likes").has_value(),
                             "likes never goes stale");
                     require(kg::outdated_after_days("works_at") == 180, "works_at mismatch");
                     require(kg::normalize_entity_name("  Pepperoni Pizza ") == "pepperoni pizza",
                             "entity names should be normalized");
                     require(std::abs(kg::trigram_similarity("pizza", "pepperoni pizza") - 0.4) <
                                 1e-9,
                             "trigram similarity mismatch");
                   }});

  tests.push_back({"knowledge_store_validates_input", [] {
                     mt::TempWorkspace workspace;
                     auto graph = open_graph(workspace);
                     require(!graph->store_fact(kg::FactInput{.user_id = " ", .entity_name = "x"})
                                  .ok(),
                             "blank user accepted");
                     require(!graph->store_fact(kg::FactInput{.user_id = "alice", .entity_name = ""})
                                  .ok(),
                             "blank entity accepted");
                     require(!graph->store_fact(kg::FactInput{.user_id = "alice",
                                                              .entity_name = "x",
                                                              .confidence = 1.5})
                                  .ok(),
                             "confidence above one accepted");
                     auto defaults = graph->store_fact(
                         kg::FactInput{.user_id = "alice", .entity_name = "Weekend"});
                     require(defaults.ok(), defaults.error());
                     const auto facts = facts_for(*graph);
                     require(facts.size() == 1 && facts[0].relationship == "mentions" &&
                                 facts[0].entity.type == "general",
                             "defaults should fill relationship and type");
                   }});

  tests.push_back({"knowledge_repeat_mention_reinforces", [] {
                     mt::TempWorkspace workspace;
                     auto graph = open_graph(workspace);
                     require(store(*graph, "Pizza", "likes", 0.6) == kg::StoreOutcome::Inserted,
                             "first store should insert");
                     require(store(*graph, "pizza", "likes", 0.8) == kg::StoreOutcome::Reinforced,
                             "second store should reinforce");
                     const auto facts = facts_for(*graph);
                     require(facts.size() == 1, "reinforcement should not duplicate");
                     require(facts[0].mention_count == 2, "mention count mismatch");
                     require(std::abs(facts[0].confidence - 0.8) < 1e-9,
                             "confidence should keep the maximum");
                   }});

  tests.push_back({"knowledge_identical_mention_is_idempotent", [] {
                     mt::TempWorkspace workspace;
                     auto graph = open_graph(workspace);
                     store(*graph, "ramen", "likes", 0.7);
                     require(store(*graph, "ramen", "likes", 0.7) == kg::StoreOutcome::Reinforced,
                             "identical store should reinforce");
                     const auto facts = facts_for(*graph);
                     require(facts.size() == 1, "identical store should not duplicate");
                     require(facts[0].mention_count == 2, "mention count mismatch");
                     require_near(facts[0].confidence, 0.7, "confidence should be unchanged");
                     require(facts[0].last_mentioned == kNow, "mention time should be unchanged");
                   }});

  tests.push_back({"knowledge_stronger_opposite_replaces_old_fact", [] {
                     mt::TempWorkspace workspace;
                     mt::ObserverScope scope;
                     auto graph = open_graph(workspace);
                     store(*graph, "olives", "likes", 0.6);
                     require(store(*graph, "olives", "dislikes", 0.9) ==
                                 kg::StoreOutcome::ReplacedOpposite,
                             "stronger opposite should replace");
                     const auto facts = facts_for(*graph);
                     require(facts.size() == 1 && facts[0].relationship == "dislikes",
                             "only the new fact should remain");
                     const auto resolved =
                         scope.log().events_of<ob::ContradictionResolvedEvent>();
                     require(resolved.size() == 1 && !resolved[0].near_tie &&
                                 resolved[0].dropped_relationship == "likes",
                             "contradiction event mismatch");
                     const auto stored = scope.log().events_of<ob::FactStoredEvent>();
                     require(stored.size() == 2 && stored[1].outcome == "replaced_opposite",
                             "fact stored events mismatch");
                   }});

  tests.push_back({"knowledge_weaker_opposite_is_rejected", [] {
                     mt::TempWorkspace workspace;
                     auto graph = open_graph(workspace);
                     store(*graph, "olives", "likes", 0.9);
                     require(store(*graph, "olives", "dislikes", 0.6) ==
                                 kg::StoreOutcome::RejectedByOpposite,
                             "weaker opposite should be rejected");
                     const auto facts = facts_for(*graph);
                     require(facts.size() == 1 && facts[0].relationship == "likes",
                             "existing fact should stand");
                   }});

  tests.push_back({"knowledge_near_tie_supersedes_opposite", [] {
                     mt::TempWorkspace workspace;
                     auto graph = open_graph(workspace);
                     store(*graph, "olives", "likes", 0.7);
                     require(store(*graph, "olives", "dislikes", 0.72) ==
                                 kg::StoreOutcome::SupersededOpposite,
                             "near tie should supersede");
                     const auto facts = facts_for(*graph);
                     require(facts.size() == 1 && facts[0].relationship == "dislikes",
                             "superseded fact should be hidden");

                     // Mentioning the old fact again brings it back over the newer one.
                     require(store(*graph, "olives", "likes", 0.75) ==
                                 kg::StoreOutcome::SupersededOpposite,
                             "re-mention should supersede in turn");
                     const auto after = facts_for(*graph);
                     require(after.size() == 1 && after[0].relationship == "likes",
                             "re-mentioned fact should be visible again");
                   }});

  tests.push_back({"knowledge_near_tie_keeps_more_recent_mention", [] {
                     mt::TempWorkspace workspace;
                     mt::ObserverScope scope;
                     auto graph = open_graph(workspace);
                     store(*graph, "olives", "likes", 0.80, "food", kNow);
                     require(store(*graph, "olives", "dislikes", 0.78, "food", days_ago(3)) ==
                                 kg::StoreOutcome::SupersededByOpposite,
                             "older near-tied mention should be flagged");
                     const auto facts = facts_for(*graph);
                     require(facts.size() == 1 && facts[0].relationship == "likes",
                             "newer mention should stay visible");
                     require(facts[0].last_mentioned == kNow, "newer fact should be untouched");
                     const auto resolved =
                         scope.log().events_of<ob::ContradictionResolvedEvent>();
                     require(resolved.size() == 1 && resolved[0].near_tie &&
                                 resolved[0].kept_relationship == "likes" &&
                                 resolved[0].dropped_relationship == "dislikes",
                             "contradiction event mismatch");

                     // The flagged fact is retained; a fresh mention brings it back.
                     require(store(*graph, "olives", "dislikes", 0.78, "food", kNow + 60) ==
                                 kg::StoreOutcome::SupersededOpposite,
                             "newer mention should supersede in turn");
                     const auto after = facts_for(*graph);
                     require(after.size() == 1 && after[0].relationship == "dislikes",
                             "re-mentioned fact should be visible");
                     require(after[0].mention_count == 2, "flagged row should have been kept");
                   }});

  tests.push_back({"knowledge_newer_weak_opposite_still_loses_on_confidence", [] {
                     mt::TempWorkspace workspace;
                     auto graph = open_graph(workspace);
                     store(*graph, "olives", "likes", 0.5, "food", kNow);
                     require(store(*graph, "olives", "dislikes", 0.9, "food", days_ago(10)) ==
                                 kg::StoreOutcome::ReplacedOpposite,
                             "clearly stronger fact should win regardless of age");
                     const auto facts = facts_for(*graph);
                     require(facts.size() == 1 && facts[0].relationship == "dislikes",
                             "stronger fact should remain");
                   }});

  tests.push_back({"knowledge_similar_relationships_keep_strongest", [] {
                     mt::TempWorkspace workspace;
                     auto graph = open_graph(workspace);
                     store(*graph, "pizza", "likes", 0.9);
                     require(store(*graph, "pizza", "enjoys", 0.6) ==
                                 kg::StoreOutcome::RejectedBySimilar,
                             "weaker similar fact should be skipped");
                     auto facts = facts_for(*graph);
                     require(facts.size() == 1 && facts[0].relationship == "likes",
                             "only the stronger preference should remain");

                     require(store(*graph, "pizza", "loves", 0.95) ==
                                 kg::StoreOutcome::ReplacedSimilar,
                             "stronger similar fact should replace");
                     facts = facts_for(*graph);
                     require(facts.size() == 1 && facts[0].relationship == "loves",
                             "weaker preference should be removed");

                     require(store(*graph, "pizza", "loves", 0.95) == kg::StoreOutcome::Reinforced,
                             "re-mention of the same fact should reinforce");
                     facts = facts_for(*graph);
                     require(facts.size() == 1 && facts[0].mention_count == 2,
                             "re-mention should keep a single row");

                     store(*graph, "pizza", "plays", 0.9, "food");
                     require(facts_for(*graph).size() == 2,
                             "other groups should not be consolidated");
                   }});

  tests.push_back({"knowledge_facts_respect_floor_and_filters", [] {
                     mt::TempWorkspace workspace;
                     auto graph = open_graph(workspace);
                     store(*graph, "sushi", "likes", 0.9);
                     store(*graph, "tennis", "plays", 0.7, "hobby");
                     store(*graph, "rumour", "mentions", 0.3, "general");
                     store(*graph, "kale", "loves", 0.5);

                     const auto all = facts_for(*graph);
                     require(all.size() == 3, "fact below the floor should be hidden");
                     require(all.front().entity.name == "sushi", "best fact should lead");
                     require(all.back().entity.name == "kale",
                             "facts at exactly the floor are kept");

                     const auto hobbies =
                         facts_for(*graph, kg::FactFilter{.entity_type = std::string("HOBBY")});
                     require(hobbies.size() == 1 && hobbies[0].entity.name == "tennis",
                             "type filter mismatch");
                     const auto positive = facts_for(
                         *graph, kg::FactFilter{.relationship_types =
                                                    kg::similar_relationships("likes")});
                     require(positive.size() == 2, "relationship group filter mismatch");

                     auto other_user = graph->get_user_facts("bob", {}, 10);
                     require(other_user.ok() && other_user.value().empty(),
                             "facts should be per user");
                   }});

  tests.push_back({"knowledge_internal_rows_are_hidden", [] {
                     mt::TempWorkspace workspace;
                     auto graph = open_graph(workspace);
                     store(*graph, "sushi", "likes", 0.9);
                     store(*graph, "batch 12", "mentions", 0.9,
                           std::string(kg::kInternalEntityType));
                     store(*graph, "sushi", std::string(kg::kInternalRelationshipPrefix) + "_done",
                           0.9);
                     require(kg::is_internal_fact(kg::kInternalEntityType, "mentions"),
                             "marker type should be internal");
                     require(kg::is_internal_fact("food", "_enrichment_done"),
                             "enrichment prefix should be internal");
                     const auto facts = facts_for(*graph);
                     require(facts.size() == 1 && facts[0].relationship == "likes",
                             "internal rows should not be returned");
                     for (const auto &fact : facts) {
                       require(!kg::is_internal_fact(fact.entity.type, fact.relationship),
                               "query and predicate should agree");
                     }
                   }});

  tests.push_back({"knowledge_similar_entities_are_linked", [] {
                     mt::TempWorkspace workspace;
                     auto graph = open_graph(workspace);
                     store(*graph, "pizza", "likes", 0.8);
                     auto pepperoni = graph->store_fact(kg::FactInput{.user_id = "alice",
                                                                      .entity_name =
                                                                          "pepperoni pizza",
                                                                      .entity_type = "food",
                                                                      .relationship = "likes",
                                                                      .confidence = 0.8,
                                                                      .mentioned_at = kNow});
                     require(pepperoni.ok(), pepperoni.error());
                     require(pepperoni.value().similar_links == 1, "pizza link expected");
                     store(*graph, "margherita pizza", "likes", 0.7);
                     store(*graph, "pizza oven", "owns", 0.9, "appliance");

                     auto from_pepperoni = graph->get_related_entities("Pepperoni Pizza", 2);
                     require(from_pepperoni.ok(), from_pepperoni.error());
                     const auto &related = from_pepperoni.value();
                     require(related.size() == 2, "two related entities expected");
                     require(related[0].entity.name == "pizza" && related[0].hops == 1,
                             "direct neighbour should lead");
                     require(related[1].entity.name == "margherita pizza" && related[1].hops == 2,
                             "second hop expected");
                     require(related[0].score > related[1].score, "closer hops score higher");

                     auto one_hop = graph->get_related_entities("pepperoni pizza", 1);
                     require(one_hop.ok() && one_hop.value().size() == 1,
                             "hop limit not applied");

                     auto from_pizza = graph->get_related_entities("pizza", 2);
                     require(from_pizza.ok(), from_pizza.error());
                     require(from_pizza.value().size() == 2, "pizza should have two neighbours");
                     require(from_pizza.value()[0].entity.name == "pepperoni pizza",
                             "stronger link should break the tie");

                     auto unknown = graph->get_related_entities("tofu", 3);
                     require(unknown.ok() && unknown.value().empty(),
                             "unknown entity should have no neighbours");
                   }});

  tests.push_back({"knowledge_temporal_weighting", [] {
                     mt::TempWorkspace workspace;
                     auto graph = open_graph(workspace);
                     store(*graph, "ramen", "likes", 0.9, "food", days_ago(2));
                     store(*graph, "curry", "likes", 0.9, "food", days_ago(45));
                     store(*graph, "new bike", "wants", 0.8, "item", days_ago(70));

                     auto weighted = graph->get_temporally_weighted_facts("alice", {}, 10, kNow);
                     require(weighted.ok(), weighted.error());
                     const auto &items = weighted.value();
                     require(items.size() == 3, "all facts expected");
                     require(items[0].fact.entity.name == "ramen" && items[0].relevance == 1.0,
                             "recent fact should lead");
                     require(items[1].fact.entity.name == "curry" && items[1].relevance == 0.8,
                             "45-day fact should weigh 0.8");
                     require_near(items[1].weighted_confidence, 0.72, "weighted confidence mismatch");
                     require(items[2].relevance == 0.6 && items[2].potentially_outdated,
                             "old want should be flagged");
                     require(!items[1].potentially_outdated, "likes is never outdated");

                     auto limited = graph->get_temporally_weighted_facts("alice", {}, 1, kNow);
                     require(limited.ok() && limited.value().size() == 1, "limit not applied");
                   }});

  tests.push_back({"knowledge_deprecation_and_restore", [] {
                     mt::TempWorkspace workspace;
                     mt::ObserverScope scope;
                     auto graph = open_graph(workspace);
                     store(*graph, "sailboat", "wants", 0.8, "item", days_ago(200));
                     store(*graph, "acme corp", "works_at", 0.9, "organization", days_ago(400));
                     store(*graph, "jazz", "likes", 0.9, "music", days_ago(900));

                     auto preview = graph->deprecate_outdated_facts(std::nullopt, true, kNow);
                     require(preview.ok(), preview.error());
                     require(preview.value().dry_run, "dry run flag lost");
                     require(preview.value().examined == 3, "examined count mismatch");
                     require(preview.value().deprecated == 1 && preview.value().degraded == 1,
                             "dry run counts mismatch");
                     require(facts_for(*graph).size() == 3, "dry run should not change facts");

                     auto applied = graph->deprecate_outdated_facts("alice", false, kNow);
                     require(applied.ok(), applied.error());
                     require(applied.value().changes.size() == 2, "two changes expected");
                     const auto visible = facts_for(*graph);
                     require(visible.size() == 2, "deprecated want should drop below the floor");
                     bool saw_job = false;
                     for (const auto &fact : visible) {
                       if (fact.relationship == "works_at") {
                         saw_job = true;
                         require_near(fact.confidence, 0.8425,
                                      "stale job should be degraded proportionally", 0.001);
                       }
                     }
                     require(saw_job, "degraded job fact should stay visible");

                     auto again = graph->deprecate_outdated_facts("alice", false, kNow);
                     require(again.ok() && again.value().changes.empty(),
                             "second run should be idempotent");

                     auto restored = graph->restore_deprecated_facts("alice");
                     require(restored.ok(), restored.error());
                     require(restored.value() == 2, "two facts should be restored");
                     const auto back = facts_for(*graph);
                     require(back.size() == 3, "restored want should be visible");
                     require(scope.log().events_of<ob::FactsDeprecatedEvent>().size() == 3,
                             "deprecation events expected per run");
                   }});
}
