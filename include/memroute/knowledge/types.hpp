#pragma once

#include "memroute/common/time.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace memroute::knowledge {

struct Entity {
  std::int64_t id = 0;
  std::string name;
  std::string type;
  std::string category;
};

/// A user-scoped relationship to an entity ("user likes pizza").
struct Fact {
  std::string user_id;
  Entity entity;
  std::string relationship;
  double confidence = 0.0;
  std::string emotional_context;
  common::UnixSeconds last_mentioned = 0;
  std::uint32_t mention_count = 0;
};

struct FactFilter {
  std::optional<std::string> entity_type;
  // Empty means every relationship type.
  std::vector<std::string> relationship_types;
};

struct FactInput {
  std::string user_id;
  std::string entity_name;
  std::string entity_type;
  std::string relationship;
  double confidence = 0.5;
  std::string emotional_context;
  std::optional<common::UnixSeconds> mentioned_at;
};

enum class StoreOutcome {
  Inserted,
  Reinforced,
  // Stored; an opposing fact with lower confidence was removed.
  ReplacedOpposite,
  // Stored; a near-tied opposing fact was kept but flagged superseded.
  SupersededOpposite,
  // Not stored; an opposing fact with higher confidence already exists.
  RejectedByOpposite,
  // Stored but flagged superseded; a near-tied opposing fact was mentioned more recently.
  SupersededByOpposite,
  // Stored; weaker facts of the same similarity group were removed.
  ReplacedSimilar,
  // Not stored; a fact of the same similarity group is at least as confident.
  RejectedBySimilar,
};

[[nodiscard]] const char *store_outcome_to_string(StoreOutcome outcome);

struct StoreFactResult {
  StoreOutcome outcome = StoreOutcome::Inserted;
  std::int64_t entity_id = 0;
  std::size_t similar_links = 0;
};

struct RelatedEntity {
  Entity entity;
  std::uint32_t hops = 0;
  double path_weight = 0.0;
  double score = 0.0;
};

struct TemporalFact {
  Fact fact;
  double days_since_mention = 0.0;
  double relevance = 1.0;
  double weighted_confidence = 0.0;
  bool potentially_outdated = false;
};

struct DeprecationReport {
  std::size_t examined = 0;
  std::size_t degraded = 0;
  std::size_t deprecated = 0;
  bool dry_run = false;
  // "<user>/<entity>/<relationship>: old -> new" lines.
  std::vector<std::string> changes;
};

} // namespace memroute::knowledge
