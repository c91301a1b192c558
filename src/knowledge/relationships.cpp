#include "memroute/knowledge/relationships.hpp"

#include "memroute/common/fs.hpp"

#include <cctype>
#include <set>
#include <unordered_map>

namespace memroute::knowledge {

namespace {

const std::unordered_map<std::string, std::vector<std::string>> &opposites_table() {
  static const std::unordered_map<std::string, std::vector<std::string>> table = {
      {"likes", {"dislikes", "hates", "avoids"}},
      {"loves", {"dislikes", "hates", "avoids"}},
      {"enjoys", {"dislikes", "hates", "avoids"}},
      {"prefers", {"dislikes", "avoids", "rejects"}},
      {"wants", {"rejects", "avoids", "dislikes"}},
      {"needs", {"rejects", "avoids"}},
      {"supports", {"opposes", "rejects"}},
      {"trusts", {"distrusts", "suspects"}},
      {"believes", {"doubts", "rejects"}},
      {"dislikes", {"likes", "loves", "enjoys", "prefers", "wants"}},
      {"hates", {"likes", "loves", "enjoys"}},
      {"avoids", {"likes", "loves", "enjoys", "prefers", "wants", "needs"}},
      {"rejects", {"wants", "needs", "prefers", "supports", "believes"}},
      {"opposes", {"supports"}},
      {"distrusts", {"trusts"}},
      {"doubts", {"believes"}},
      {"suspects", {"trusts"}},
  };
  return table;
}

const std::vector<std::vector<std::string>> &similar_groups() {
  static const std::vector<std::vector<std::string>> groups = {
      {"likes", "loves", "enjoys", "prefers"},
      {"dislikes", "hates", "avoids"},
      {"does", "plays", "practices"},
      {"owns", "has"},
  };
  return groups;
}

std::set<std::string> trigrams(const std::string &text) {
  std::set<std::string> out;
  std::string word;
  auto flush = [&out, &word]() {
    if (word.empty()) {
      return;
    }
    const std::string padded = "  " + word + " ";
    for (std::size_t i = 0; i + 3 <= padded.size(); ++i) {
      out.insert(padded.substr(i, 3));
    }
    word.clear();
  };
  for (const char c : text) {
    if (std::isalnum(static_cast<unsigned char>(c)) != 0) {
      word.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    } else {
      flush();
    }
  }
  flush();
  return out;
}

} // namespace

const std::vector<std::string> &opposing_relationships(const std::string_view relationship) {
  static const std::vector<std::string> none;
  const auto &table = opposites_table();
  const auto it = table.find(std::string(relationship));
  return it == table.end() ? none : it->second;
}

std::vector<std::string> similar_relationships(const std::string_view relationship) {
  for (const auto &group : similar_groups()) {
    for (const auto &member : group) {
      if (member == relationship) {
        return group;
      }
    }
  }
  return {std::string(relationship)};
}

std::optional<int> staleness_limit_days(const std::string_view relationship) {
  static const std::unordered_map<std::string, int> limits = {
      {"works_at", 365},      {"employed_by", 365},     {"job_title", 365},
      {"lives_in", 730},      {"resides_in", 730},      {"located_in", 730},
      {"studies_at", 1460},   {"enrolled_in", 1460},    {"attends", 1460},
      {"wants", 90},          {"plans", 30},            {"intends", 60},
      {"thinking_about", 14}, {"considering", 30},      {"dating", 180},
      {"in_relationship_with", 180},                    {"married_to", 1095},
      {"feels", 7},           {"feeling", 7},           {"currently_feeling", 3},
      {"mood", 1},            {"owns", 1095},           {"has", 365},
      {"visited", 1095},      {"been_to", 1095},        {"traveled_to", 1095},
  };
  const auto it = limits.find(std::string(relationship));
  if (it == limits.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::optional<int> outdated_after_days(const std::string_view relationship) {
  if (relationship == "works_at" || relationship == "lives_in" || relationship == "studies_at") {
    return 180;
  }
  if (relationship == "wants" || relationship == "plans" || relationship == "intends" ||
      relationship == "dreams_of") {
    return 60;
  }
  if (relationship == "dating" || relationship == "in_relationship_with") {
    return 120;
  }
  if (relationship == "feels" || relationship == "currently_feeling") {
    return 7;
  }
  return std::nullopt;
}

std::string normalize_entity_name(const std::string &name) {
  return common::to_lower(common::trim(name));
}

double trigram_similarity(const std::string &a, const std::string &b) {
  const auto left = trigrams(a);
  const auto right = trigrams(b);
  if (left.empty() || right.empty()) {
    return 0.0;
  }
  std::size_t shared = 0;
  for (const auto &gram : left) {
    shared += right.count(gram);
  }
  const std::size_t total = left.size() + right.size() - shared;
  return static_cast<double>(shared) / static_cast<double>(total);
}

bool is_internal_fact(const std::string_view entity_type, const std::string_view relationship) {
  return entity_type == kInternalEntityType ||
         relationship.starts_with(kInternalRelationshipPrefix);
}

} // namespace memroute::knowledge
