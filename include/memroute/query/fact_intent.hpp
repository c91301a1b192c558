#pragma once

#include "memroute/knowledge/types.hpp"
#include "memroute/query/classifier.hpp"

#include <optional>
#include <string>

namespace memroute::query {

/// Entity type and relationship group implied by the query ("what foods do I like"
/// -> food, likes/favorite/loves/enjoys/prefers). Empty parts mean no restriction.
[[nodiscard]] knowledge::FactFilter infer_fact_filter(const std::string &text,
                                                      const ClassifierConfig &config);

/// The entity named after "similar to" / "related to", if the query asks for one.
[[nodiscard]] std::optional<std::string> related_entity_seed(const std::string &text);

} // namespace memroute::query
