#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace memroute::knowledge {

inline constexpr std::string_view kDefaultRelationship = "mentions";
inline constexpr std::string_view kDefaultEntityType = "general";
inline constexpr std::string_view kSimilarTo = "similar_to";
// Bookkeeping rows written by the enrichment worker.
inline constexpr std::string_view kInternalEntityType = "_processing_marker";
inline constexpr std::string_view kInternalRelationshipPrefix = "_enrichment";

/// Relationship types that cannot hold at the same time as `relationship`.
[[nodiscard]] const std::vector<std::string> &opposing_relationships(std::string_view relationship);

/// The similarity group containing `relationship`, or just `relationship` itself.
[[nodiscard]] std::vector<std::string> similar_relationships(std::string_view relationship);

/// Days after which a fact of this relationship type is considered stale.
[[nodiscard]] std::optional<int> staleness_limit_days(std::string_view relationship);

/// Age in days past which a fact should be flagged as possibly outdated.
[[nodiscard]] std::optional<int> outdated_after_days(std::string_view relationship);

/// Entity names are compared trimmed and lower-cased.
[[nodiscard]] std::string normalize_entity_name(const std::string &name);

/// Trigram similarity in [0,1]: shared trigrams over the union, words padded as "  w ".
[[nodiscard]] double trigram_similarity(const std::string &a, const std::string &b);

/// Internal rows are never returned as facts; `get_user_facts` applies the same rule in SQL.
[[nodiscard]] bool is_internal_fact(std::string_view entity_type, std::string_view relationship);

} // namespace memroute::knowledge
