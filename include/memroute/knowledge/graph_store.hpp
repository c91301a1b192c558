#pragma once

#include "memroute/common/result.hpp"
#include "memroute/knowledge/types.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace memroute::knowledge {

/// Entities, user facts about them, and advisory entity-to-entity links.
class IKnowledgeGraphStore {
public:
  virtual ~IKnowledgeGraphStore() = default;

  [[nodiscard]] virtual std::string_view name() const = 0;

  /// Upserts the entity and the fact in one transaction, resolving opposing facts and
  /// refreshing `similar_to` links for the entity.
  [[nodiscard]] virtual common::Result<StoreFactResult> store_fact(const FactInput &input) = 0;

  /// Facts above the confidence floor, best first: (confidence DESC, last_mentioned DESC).
  [[nodiscard]] virtual common::Result<std::vector<Fact>>
  get_user_facts(const std::string &user_id, const FactFilter &filter, std::size_t limit) = 0;

  /// Entities reachable from `entity_name` over `similar_to` links within `max_hops`.
  [[nodiscard]] virtual common::Result<std::vector<RelatedEntity>>
  get_related_entities(const std::string &entity_name, std::uint32_t max_hops) = 0;

  [[nodiscard]] virtual common::Result<std::vector<TemporalFact>>
  get_temporally_weighted_facts(const std::string &user_id, const FactFilter &filter,
                                std::size_t limit, common::UnixSeconds now) = 0;

  /// Degrades facts older than their relationship's staleness limit. All users when
  /// `user_id` is empty.
  [[nodiscard]] virtual common::Result<DeprecationReport>
  deprecate_outdated_facts(const std::optional<std::string> &user_id, bool dry_run,
                           common::UnixSeconds now) = 0;

  /// Puts back the confidences saved by deprecation. Returns the number of facts restored.
  [[nodiscard]] virtual common::Result<std::size_t>
  restore_deprecated_facts(const std::optional<std::string> &user_id) = 0;

  [[nodiscard]] virtual bool health_check() = 0;
};

} // namespace memroute::knowledge
