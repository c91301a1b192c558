#include "memroute/knowledge/sqlite_graph_store.hpp"

#include "memroute/common/fs.hpp"
#include "memroute/common/sqlite_util.hpp"
#include "memroute/knowledge/relationships.hpp"
#include "memroute/observability/global.hpp"

#include <algorithm>
#include <cmath>
#include <deque>
#include <iomanip>
#include <sstream>
#include <unordered_map>
#include <unordered_set>

namespace memroute::knowledge {

namespace {

// Finalizes on scope exit so early returns cannot leak a statement.
struct Statement {
  sqlite3_stmt *stmt = nullptr;
  ~Statement() {
    if (stmt != nullptr) {
      sqlite3_finalize(stmt);
    }
  }
};

common::Status prepare(sqlite3 *db, const std::string &sql, Statement &out) {
  if (sqlite3_prepare_v2(db, sql.c_str(), -1, &out.stmt, nullptr) != SQLITE_OK) {
    return common::Status::error(sqlite3_errmsg(db));
  }
  return common::Status::success();
}

void bind_text(sqlite3_stmt *stmt, const int index, const std::string &value) {
  sqlite3_bind_text(stmt, index, value.c_str(), -1, SQLITE_TRANSIENT);
}

// A visible fact on the same (user, entity) that competes with the incoming one.
struct CompetingRow {
  std::string relationship;
  double confidence = 0.0;
  common::UnixSeconds last_mentioned = 0;
};

common::Result<std::vector<CompetingRow>>
competing_facts(sqlite3 *db, const std::string &user_id, const std::int64_t entity_id,
                const std::vector<std::string> &relationships) {
  using ResultT = common::Result<std::vector<CompetingRow>>;
  std::vector<CompetingRow> rows;
  if (relationships.empty()) {
    return ResultT::success(std::move(rows));
  }
  std::string sql = "SELECT relationship_type, confidence, last_mentioned "
                    "FROM user_fact_relationships "
                    "WHERE user_id = ?1 AND entity_id = ?2 AND superseded = 0 "
                    "AND relationship_type IN (";
  for (std::size_t i = 0; i < relationships.size(); ++i) {
    sql += (i == 0 ? "?" : ", ?") + std::to_string(i + 3);
  }
  sql += ")";
  Statement select;
  if (auto status = prepare(db, sql, select); !status.ok()) {
    return ResultT::propagate(status);
  }
  bind_text(select.stmt, 1, user_id);
  sqlite3_bind_int64(select.stmt, 2, entity_id);
  for (std::size_t i = 0; i < relationships.size(); ++i) {
    bind_text(select.stmt, static_cast<int>(i + 3), relationships[i]);
  }
  int rc = SQLITE_ROW;
  while ((rc = sqlite3_step(select.stmt)) == SQLITE_ROW) {
    rows.push_back(CompetingRow{.relationship = common::column_text(select.stmt, 0),
                                .confidence = sqlite3_column_double(select.stmt, 1),
                                .last_mentioned = sqlite3_column_int64(select.stmt, 2)});
  }
  if (rc != SQLITE_DONE) {
    return ResultT::failure(sqlite3_errmsg(db));
  }
  return ResultT::success(std::move(rows));
}

common::Status delete_fact(sqlite3 *db, const std::string &user_id, const std::int64_t entity_id,
                           const std::string &relationship) {
  Statement remove;
  if (auto status = prepare(db,
                            "DELETE FROM user_fact_relationships "
                            "WHERE user_id = ?1 AND entity_id = ?2 AND relationship_type = ?3",
                            remove);
      !status.ok()) {
    return status;
  }
  bind_text(remove.stmt, 1, user_id);
  sqlite3_bind_int64(remove.stmt, 2, entity_id);
  bind_text(remove.stmt, 3, relationship);
  if (sqlite3_step(remove.stmt) != SQLITE_DONE) {
    return common::Status::error(sqlite3_errmsg(db));
  }
  return common::Status::success();
}

std::string format_confidence(const double value) {
  std::ostringstream out;
  out << std::fixed << std::setprecision(2) << value;
  return out.str();
}

double days_between(const common::UnixSeconds earlier, const common::UnixSeconds later) {
  return static_cast<double>(later - earlier) / static_cast<double>(common::kSecondsPerDay);
}

} // namespace

const char *store_outcome_to_string(const StoreOutcome outcome) {
  switch (outcome) {
  case StoreOutcome::Inserted:
    return "inserted";
  case StoreOutcome::Reinforced:
    return "reinforced";
  case StoreOutcome::ReplacedOpposite:
    return "replaced_opposite";
  case StoreOutcome::SupersededOpposite:
    return "superseded_opposite";
  case StoreOutcome::SupersededByOpposite:
    return "superseded_by_opposite";
  case StoreOutcome::ReplacedSimilar:
    return "replaced_similar";
  case StoreOutcome::RejectedBySimilar:
    return "rejected_by_similar";
  case StoreOutcome::RejectedByOpposite:
    return "rejected_by_opposite";
  }
  return "unknown";
}

common::Result<std::unique_ptr<SqliteKnowledgeGraphStore>>
SqliteKnowledgeGraphStore::open(const std::filesystem::path &db_path,
                                const config::KnowledgeConfig &config) {
  using ResultT = common::Result<std::unique_ptr<SqliteKnowledgeGraphStore>>;
  auto db = common::open_sqlite(db_path);
  if (!db.ok()) {
    return ResultT::propagate(db);
  }
  std::unique_ptr<SqliteKnowledgeGraphStore> store(
      new SqliteKnowledgeGraphStore(db.value(), config));
  if (auto status = store->init_schema(); !status.ok()) {
    return ResultT::failure("knowledge schema: " + status.error());
  }
  return ResultT::success(std::move(store));
}

SqliteKnowledgeGraphStore::SqliteKnowledgeGraphStore(sqlite3 *db,
                                                     const config::KnowledgeConfig &config)
    : db_(db), config_(config) {}

SqliteKnowledgeGraphStore::~SqliteKnowledgeGraphStore() {
  if (db_ != nullptr) {
    sqlite3_close(db_);
  }
}

common::Status SqliteKnowledgeGraphStore::init_schema() {
  return common::exec_sql(db_, R"(
PRAGMA foreign_keys = ON;
CREATE TABLE IF NOT EXISTS fact_entities (
  id INTEGER PRIMARY KEY AUTOINCREMENT,
  entity_name TEXT NOT NULL,
  entity_type TEXT NOT NULL,
  category TEXT NOT NULL DEFAULT 'general',
  created_at TEXT NOT NULL,
  UNIQUE(entity_name, entity_type)
);
CREATE TABLE IF NOT EXISTS user_fact_relationships (
  user_id TEXT NOT NULL,
  entity_id INTEGER NOT NULL REFERENCES fact_entities(id) ON DELETE CASCADE,
  relationship_type TEXT NOT NULL,
  confidence REAL NOT NULL,
  emotional_context TEXT NOT NULL DEFAULT '',
  last_mentioned INTEGER NOT NULL,
  mention_count INTEGER NOT NULL DEFAULT 1,
  superseded INTEGER NOT NULL DEFAULT 0,
  original_confidence REAL,
  PRIMARY KEY(user_id, entity_id, relationship_type)
);
CREATE INDEX IF NOT EXISTS idx_user_facts_rank
  ON user_fact_relationships(user_id, confidence DESC, last_mentioned DESC);
CREATE TABLE IF NOT EXISTS entity_relationships (
  entity_a_id INTEGER NOT NULL REFERENCES fact_entities(id) ON DELETE CASCADE,
  entity_b_id INTEGER NOT NULL REFERENCES fact_entities(id) ON DELETE CASCADE,
  relationship_type TEXT NOT NULL,
  weight REAL NOT NULL,
  PRIMARY KEY(entity_a_id, entity_b_id, relationship_type)
);
CREATE INDEX IF NOT EXISTS idx_entity_relationships_b ON entity_relationships(entity_b_id);
)");
}

common::Result<std::int64_t> SqliteKnowledgeGraphStore::upsert_entity(const std::string &name,
                                                                      const std::string &type) {
  using ResultT = common::Result<std::int64_t>;
  {
    Statement insert;
    if (auto status = prepare(db_,
                              "INSERT INTO fact_entities(entity_name, entity_type, category, "
                              "created_at) VALUES(?1, ?2, ?2, ?3) "
                              "ON CONFLICT(entity_name, entity_type) DO NOTHING",
                              insert);
        !status.ok()) {
      return ResultT::propagate(status);
    }
    bind_text(insert.stmt, 1, name);
    bind_text(insert.stmt, 2, type);
    bind_text(insert.stmt, 3, common::now_rfc3339());
    if (sqlite3_step(insert.stmt) != SQLITE_DONE) {
      return ResultT::failure(sqlite3_errmsg(db_));
    }
  }

  Statement select;
  if (auto status = prepare(
          db_, "SELECT id FROM fact_entities WHERE entity_name = ?1 AND entity_type = ?2", select);
      !status.ok()) {
    return ResultT::propagate(status);
  }
  bind_text(select.stmt, 1, name);
  bind_text(select.stmt, 2, type);
  if (sqlite3_step(select.stmt) != SQLITE_ROW) {
    return ResultT::failure("entity row missing after upsert");
  }
  return ResultT::success(sqlite3_column_int64(select.stmt, 0));
}

common::Result<std::size_t> SqliteKnowledgeGraphStore::discover_similar(
    const std::int64_t entity_id, const std::string &name, const std::string &type) {
  using ResultT = common::Result<std::size_t>;
  std::vector<std::pair<std::int64_t, double>> candidates;
  {
    Statement select;
    if (auto status = prepare(db_,
                              "SELECT id, entity_name FROM fact_entities "
                              "WHERE entity_type = ?1 AND id <> ?2",
                              select);
        !status.ok()) {
      return ResultT::propagate(status);
    }
    bind_text(select.stmt, 1, type);
    sqlite3_bind_int64(select.stmt, 2, entity_id);
    int rc = SQLITE_ROW;
    while ((rc = sqlite3_step(select.stmt)) == SQLITE_ROW) {
      const double similarity = trigram_similarity(name, common::column_text(select.stmt, 1));
      if (similarity > config_.similarity_floor) {
        candidates.emplace_back(sqlite3_column_int64(select.stmt, 0), similarity);
      }
    }
    if (rc != SQLITE_DONE) {
      return ResultT::failure(sqlite3_errmsg(db_));
    }
  }

  std::sort(candidates.begin(), candidates.end(), [](const auto &a, const auto &b) {
    if (a.second != b.second) {
      return a.second > b.second;
    }
    return a.first < b.first;
  });
  if (candidates.size() > config_.max_similar) {
    candidates.resize(config_.max_similar);
  }

  Statement upsert;
  if (auto status = prepare(db_,
                            "INSERT INTO entity_relationships(entity_a_id, entity_b_id, "
                            "relationship_type, weight) VALUES(?1, ?2, ?3, ?4) "
                            "ON CONFLICT(entity_a_id, entity_b_id, relationship_type) "
                            "DO UPDATE SET weight = MAX(weight, excluded.weight)",
                            upsert);
      !status.ok()) {
    return ResultT::propagate(status);
  }
  const std::string link_type(kSimilarTo);
  for (const auto &[other_id, similarity] : candidates) {
    // Links are undirected; the smaller id is always stored first.
    sqlite3_reset(upsert.stmt);
    sqlite3_bind_int64(upsert.stmt, 1, std::min(entity_id, other_id));
    sqlite3_bind_int64(upsert.stmt, 2, std::max(entity_id, other_id));
    bind_text(upsert.stmt, 3, link_type);
    sqlite3_bind_double(upsert.stmt, 4, std::min(similarity, config_.max_edge_weight));
    if (sqlite3_step(upsert.stmt) != SQLITE_DONE) {
      return ResultT::failure(sqlite3_errmsg(db_));
    }
  }
  return ResultT::success(candidates.size());
}

common::Result<StoreFactResult> SqliteKnowledgeGraphStore::store_fact(const FactInput &input) {
  using ResultT = common::Result<StoreFactResult>;
  const std::string user_id = common::trim(input.user_id);
  const std::string entity_name = normalize_entity_name(input.entity_name);
  std::string entity_type = common::to_lower(common::trim(input.entity_type));
  std::string relationship = common::to_lower(common::trim(input.relationship));
  if (user_id.empty()) {
    return ResultT::failure("user id is required");
  }
  if (entity_name.empty()) {
    return ResultT::failure("entity name is required");
  }
  if (!(input.confidence >= 0.0 && input.confidence <= 1.0)) {
    return ResultT::failure("confidence must be within [0, 1]");
  }
  if (entity_type.empty()) {
    entity_type = std::string(kDefaultEntityType);
  }
  if (relationship.empty()) {
    relationship = std::string(kDefaultRelationship);
  }
  const common::UnixSeconds mentioned_at = input.mentioned_at.value_or(common::now_unix());

  std::lock_guard<std::mutex> lock(mutex_);
  common::SqliteTransaction tx(db_);
  if (!tx.begin_status().ok()) {
    return ResultT::propagate(tx.begin_status());
  }

  StoreFactResult result;
  auto entity_id = upsert_entity(entity_name, entity_type);
  if (!entity_id.ok()) {
    return ResultT::propagate(entity_id);
  }
  result.entity_id = entity_id.value();

  auto opposing =
      competing_facts(db_, user_id, result.entity_id, opposing_relationships(relationship));
  if (!opposing.ok()) {
    return ResultT::propagate(opposing);
  }

  // A clearly stronger opposite wins outright; the new fact is not recorded.
  for (const auto &row : opposing.value()) {
    if (row.confidence > input.confidence + config_.tie_epsilon) {
      if (auto status = tx.commit(); !status.ok()) {
        return ResultT::propagate(status);
      }
      result.outcome = StoreOutcome::RejectedByOpposite;
      observability::record_event(observability::ContradictionResolvedEvent{
          .user_id = user_id,
          .entity = entity_name,
          .kept_relationship = row.relationship,
          .dropped_relationship = relationship,
          .near_tie = false});
      observability::record_event(observability::FactStoredEvent{
          .user_id = user_id,
          .entity = entity_name,
          .relationship = relationship,
          .outcome = store_outcome_to_string(result.outcome)});
      return ResultT::success(result);
    }
  }

  // Near ties go to the more recent mention. An older mention is stored flagged so both survive.
  const CompetingRow *newer_opposite = nullptr;
  for (const auto &row : opposing.value()) {
    const bool near_tie = std::fabs(row.confidence - input.confidence) <= config_.tie_epsilon;
    if (near_tie && row.last_mentioned > mentioned_at) {
      newer_opposite = &row;
      break;
    }
  }

  bool replaced = false;
  bool superseded = false;
  if (newer_opposite != nullptr) {
    observability::record_event(observability::ContradictionResolvedEvent{
        .user_id = user_id,
        .entity = entity_name,
        .kept_relationship = newer_opposite->relationship,
        .dropped_relationship = relationship,
        .near_tie = true});
  } else {
    for (const auto &row : opposing.value()) {
      const bool near_tie = std::fabs(row.confidence - input.confidence) <= config_.tie_epsilon;
      if (near_tie) {
        Statement flag;
        const char *sql = "UPDATE user_fact_relationships SET superseded = 1 "
                          "WHERE user_id = ?1 AND entity_id = ?2 AND relationship_type = ?3";
        if (auto status = prepare(db_, sql, flag); !status.ok()) {
          return ResultT::propagate(status);
        }
        bind_text(flag.stmt, 1, user_id);
        sqlite3_bind_int64(flag.stmt, 2, result.entity_id);
        bind_text(flag.stmt, 3, row.relationship);
        if (sqlite3_step(flag.stmt) != SQLITE_DONE) {
          return ResultT::failure(sqlite3_errmsg(db_));
        }
      } else if (auto status = delete_fact(db_, user_id, result.entity_id, row.relationship);
                 !status.ok()) {
        return ResultT::propagate(status);
      }
      superseded = superseded || near_tie;
      replaced = replaced || !near_tie;
      observability::record_event(observability::ContradictionResolvedEvent{
          .user_id = user_id,
          .entity = entity_name,
          .kept_relationship = relationship,
          .dropped_relationship = row.relationship,
          .near_tie = near_tie});
    }
  }

  // Only the strongest member of a similarity group ("likes", "enjoys", ...) is kept per entity.
  bool replaced_similar = false;
  if (newer_opposite == nullptr) {
    std::vector<std::string> siblings;
    for (auto &member : similar_relationships(relationship)) {
      if (member != relationship) {
        siblings.push_back(std::move(member));
      }
    }
    auto similar = competing_facts(db_, user_id, result.entity_id, siblings);
    if (!similar.ok()) {
      return ResultT::propagate(similar);
    }
    auto rows = std::move(similar.value());
    std::sort(rows.begin(), rows.end(), [](const CompetingRow &a, const CompetingRow &b) {
      if (a.confidence != b.confidence) {
        return a.confidence > b.confidence;
      }
      return a.last_mentioned > b.last_mentioned;
    });
    const bool keep_existing = !rows.empty() && input.confidence <= rows.front().confidence;
    for (std::size_t i = keep_existing ? 1 : 0; i < rows.size(); ++i) {
      if (auto status = delete_fact(db_, user_id, result.entity_id, rows[i].relationship);
          !status.ok()) {
        return ResultT::propagate(status);
      }
    }
    if (keep_existing) {
      if (auto status = tx.commit(); !status.ok()) {
        return ResultT::propagate(status);
      }
      result.outcome = StoreOutcome::RejectedBySimilar;
      observability::record_event(observability::FactStoredEvent{
          .user_id = user_id,
          .entity = entity_name,
          .relationship = relationship,
          .outcome = store_outcome_to_string(result.outcome)});
      return ResultT::success(result);
    }
    replaced_similar = !rows.empty();
  }

  bool existed = false;
  {
    Statement exists;
    if (auto status = prepare(db_,
                              "SELECT 1 FROM user_fact_relationships WHERE user_id = ?1 "
                              "AND entity_id = ?2 AND relationship_type = ?3",
                              exists);
        !status.ok()) {
      return ResultT::propagate(status);
    }
    bind_text(exists.stmt, 1, user_id);
    sqlite3_bind_int64(exists.stmt, 2, result.entity_id);
    bind_text(exists.stmt, 3, relationship);
    existed = sqlite3_step(exists.stmt) == SQLITE_ROW;
  }

  {
    Statement upsert;
    const char *sql = R"(
INSERT INTO user_fact_relationships(user_id, entity_id, relationship_type, confidence,
                                    emotional_context, last_mentioned, mention_count,
                                    superseded)
VALUES(?1, ?2, ?3, ?4, ?5, ?6, 1, ?7)
ON CONFLICT(user_id, entity_id, relationship_type) DO UPDATE SET
  confidence = MAX(confidence, excluded.confidence),
  mention_count = mention_count + 1,
  last_mentioned = MAX(last_mentioned, excluded.last_mentioned),
  emotional_context = CASE WHEN excluded.emotional_context <> ''
                           THEN excluded.emotional_context ELSE emotional_context END,
  superseded = excluded.superseded,
  original_confidence = NULL
)";
    if (auto status = prepare(db_, sql, upsert); !status.ok()) {
      return ResultT::propagate(status);
    }
    bind_text(upsert.stmt, 1, user_id);
    sqlite3_bind_int64(upsert.stmt, 2, result.entity_id);
    bind_text(upsert.stmt, 3, relationship);
    sqlite3_bind_double(upsert.stmt, 4, input.confidence);
    bind_text(upsert.stmt, 5, input.emotional_context);
    sqlite3_bind_int64(upsert.stmt, 6, mentioned_at);
    sqlite3_bind_int(upsert.stmt, 7, newer_opposite != nullptr ? 1 : 0);
    if (sqlite3_step(upsert.stmt) != SQLITE_DONE) {
      return ResultT::failure(sqlite3_errmsg(db_));
    }
  }

  auto links = discover_similar(result.entity_id, entity_name, entity_type);
  if (links.ok()) {
    result.similar_links = links.value();
  } else {
    observability::record_degraded("relationship_discovery", links.error());
  }

  if (auto status = tx.commit(); !status.ok()) {
    return ResultT::propagate(status);
  }

  if (newer_opposite != nullptr) {
    result.outcome = StoreOutcome::SupersededByOpposite;
  } else if (superseded) {
    result.outcome = StoreOutcome::SupersededOpposite;
  } else if (replaced) {
    result.outcome = StoreOutcome::ReplacedOpposite;
  } else if (replaced_similar) {
    result.outcome = StoreOutcome::ReplacedSimilar;
  } else {
    result.outcome = existed ? StoreOutcome::Reinforced : StoreOutcome::Inserted;
  }
  observability::record_event(observability::FactStoredEvent{
      .user_id = user_id,
      .entity = entity_name,
      .relationship = relationship,
      .outcome = store_outcome_to_string(result.outcome)});
  return ResultT::success(result);
}

common::Result<std::vector<Fact>>
SqliteKnowledgeGraphStore::query_facts(const std::string &user_id, const FactFilter &filter,
                                       const double min_confidence,
                                       const std::optional<std::size_t> limit) {
  using ResultT = common::Result<std::vector<Fact>>;
  std::string sql = R"(
SELECT e.id, e.entity_name, e.entity_type, e.category, r.relationship_type, r.confidence,
       r.emotional_context, r.last_mentioned, r.mention_count
FROM user_fact_relationships r
JOIN fact_entities e ON e.id = r.entity_id
WHERE r.user_id = ?1 AND r.confidence >= ?2 AND r.superseded = 0
  AND e.entity_type <> ?3
  AND substr(r.relationship_type, 1, length(?4)) <> ?4
)";
  int next = 5;
  const int type_index = next;
  if (filter.entity_type.has_value()) {
    sql += "  AND e.entity_type = ?" + std::to_string(next++) + "\n";
  }
  const int relationship_index = next;
  if (!filter.relationship_types.empty()) {
    sql += "  AND r.relationship_type IN (";
    for (std::size_t i = 0; i < filter.relationship_types.size(); ++i) {
      sql += (i == 0 ? "?" : ", ?") + std::to_string(next++);
    }
    sql += ")\n";
  }
  sql += "ORDER BY r.confidence DESC, r.last_mentioned DESC, e.entity_name ASC LIMIT ?" +
         std::to_string(next);

  Statement select;
  if (auto status = prepare(db_, sql, select); !status.ok()) {
    return ResultT::propagate(status);
  }
  bind_text(select.stmt, 1, user_id);
  sqlite3_bind_double(select.stmt, 2, min_confidence);
  bind_text(select.stmt, 3, std::string(kInternalEntityType));
  bind_text(select.stmt, 4, std::string(kInternalRelationshipPrefix));
  if (filter.entity_type.has_value()) {
    bind_text(select.stmt, type_index, common::to_lower(*filter.entity_type));
  }
  for (std::size_t i = 0; i < filter.relationship_types.size(); ++i) {
    bind_text(select.stmt, relationship_index + static_cast<int>(i),
              filter.relationship_types[i]);
  }
  sqlite3_bind_int64(select.stmt, next,
                     limit.has_value() ? static_cast<sqlite3_int64>(*limit) : -1);

  std::vector<Fact> facts;
  int rc = SQLITE_ROW;
  while ((rc = sqlite3_step(select.stmt)) == SQLITE_ROW) {
    Fact fact;
    fact.user_id = user_id;
    fact.entity.id = sqlite3_column_int64(select.stmt, 0);
    fact.entity.name = common::column_text(select.stmt, 1);
    fact.entity.type = common::column_text(select.stmt, 2);
    fact.entity.category = common::column_text(select.stmt, 3);
    fact.relationship = common::column_text(select.stmt, 4);
    fact.confidence = sqlite3_column_double(select.stmt, 5);
    fact.emotional_context = common::column_text(select.stmt, 6);
    fact.last_mentioned = sqlite3_column_int64(select.stmt, 7);
    fact.mention_count = static_cast<std::uint32_t>(sqlite3_column_int64(select.stmt, 8));
    facts.push_back(std::move(fact));
  }
  if (rc != SQLITE_DONE) {
    return ResultT::failure(sqlite3_errmsg(db_));
  }
  return ResultT::success(std::move(facts));
}

common::Result<std::vector<Fact>>
SqliteKnowledgeGraphStore::get_user_facts(const std::string &user_id, const FactFilter &filter,
                                          const std::size_t limit) {
  std::lock_guard<std::mutex> lock(mutex_);
  return query_facts(user_id, filter, config_.min_confidence, limit);
}

common::Result<std::vector<RelatedEntity>>
SqliteKnowledgeGraphStore::get_related_entities(const std::string &entity_name,
                                                const std::uint32_t max_hops) {
  using ResultT = common::Result<std::vector<RelatedEntity>>;
  const std::uint32_t hops_cap = std::clamp<std::uint32_t>(max_hops, 1, 3);
  const std::string seed_name = normalize_entity_name(entity_name);

  std::lock_guard<std::mutex> lock(mutex_);
  std::unordered_map<std::int64_t, Entity> entities;
  auto load_entity = [this, &entities](const std::int64_t id) -> common::Status {
    if (entities.contains(id)) {
      return common::Status::success();
    }
    Statement select;
    if (auto status = prepare(db_,
                              "SELECT id, entity_name, entity_type, category FROM fact_entities "
                              "WHERE id = ?1",
                              select);
        !status.ok()) {
      return status;
    }
    sqlite3_bind_int64(select.stmt, 1, id);
    if (sqlite3_step(select.stmt) != SQLITE_ROW) {
      return common::Status::error("entity " + std::to_string(id) + " missing");
    }
    entities.emplace(id, Entity{.id = id,
                                .name = common::column_text(select.stmt, 1),
                                .type = common::column_text(select.stmt, 2),
                                .category = common::column_text(select.stmt, 3)});
    return common::Status::success();
  };

  struct Frontier {
    std::int64_t id = 0;
    std::uint32_t hops = 0;
    double path_weight = 1.0;
  };
  std::deque<Frontier> queue;
  std::unordered_set<std::int64_t> visited;
  {
    Statement seeds;
    if (auto status = prepare(db_, "SELECT id FROM fact_entities WHERE entity_name = ?1", seeds);
        !status.ok()) {
      return ResultT::propagate(status);
    }
    bind_text(seeds.stmt, 1, seed_name);
    while (sqlite3_step(seeds.stmt) == SQLITE_ROW) {
      const std::int64_t id = sqlite3_column_int64(seeds.stmt, 0);
      visited.insert(id);
      queue.push_back(Frontier{.id = id, .hops = 0, .path_weight = 1.0});
    }
  }

  Statement neighbours;
  if (auto status = prepare(db_, R"(
SELECT CASE WHEN entity_a_id = ?1 THEN entity_b_id ELSE entity_a_id END, weight
FROM entity_relationships
WHERE (entity_a_id = ?1 OR entity_b_id = ?1) AND relationship_type = ?2 AND weight >= ?3
ORDER BY weight DESC
)",
                            neighbours);
      !status.ok()) {
    return ResultT::propagate(status);
  }

  const std::string link_type(kSimilarTo);
  std::vector<RelatedEntity> related;
  while (!queue.empty()) {
    const Frontier current = queue.front();
    queue.pop_front();
    if (current.hops >= hops_cap) {
      continue;
    }
    sqlite3_reset(neighbours.stmt);
    sqlite3_bind_int64(neighbours.stmt, 1, current.id);
    bind_text(neighbours.stmt, 2, link_type);
    sqlite3_bind_double(neighbours.stmt, 3, config_.related_min_weight);
    std::vector<std::pair<std::int64_t, double>> edges;
    int rc = SQLITE_ROW;
    while ((rc = sqlite3_step(neighbours.stmt)) == SQLITE_ROW) {
      edges.emplace_back(sqlite3_column_int64(neighbours.stmt, 0),
                         sqlite3_column_double(neighbours.stmt, 1));
    }
    if (rc != SQLITE_DONE) {
      return ResultT::failure(sqlite3_errmsg(db_));
    }
    for (const auto &[next_id, weight] : edges) {
      if (!visited.insert(next_id).second) {
        continue;
      }
      if (auto status = load_entity(next_id); !status.ok()) {
        return ResultT::propagate(status);
      }
      const Frontier next{.id = next_id,
                          .hops = current.hops + 1,
                          .path_weight = current.path_weight * weight};
      related.push_back(RelatedEntity{.entity = entities.at(next_id),
                                      .hops = next.hops,
                                      .path_weight = next.path_weight,
                                      .score = 1.0 / static_cast<double>(next.hops)});
      queue.push_back(next);
    }
  }

  std::stable_sort(related.begin(), related.end(), [](const auto &a, const auto &b) {
    if (a.score != b.score) {
      return a.score > b.score;
    }
    return a.path_weight > b.path_weight;
  });
  if (related.size() > config_.related_limit) {
    related.resize(config_.related_limit);
  }
  return ResultT::success(std::move(related));
}

common::Result<std::vector<TemporalFact>> SqliteKnowledgeGraphStore::get_temporally_weighted_facts(
    const std::string &user_id, const FactFilter &filter, const std::size_t limit,
    const common::UnixSeconds now) {
  using ResultT = common::Result<std::vector<TemporalFact>>;
  std::lock_guard<std::mutex> lock(mutex_);
  auto facts = query_facts(user_id, filter, config_.min_confidence, std::nullopt);
  if (!facts.ok()) {
    return ResultT::propagate(facts);
  }

  std::vector<TemporalFact> weighted;
  weighted.reserve(facts.value().size());
  for (auto &fact : facts.value()) {
    TemporalFact item;
    item.days_since_mention = std::max(0.0, days_between(fact.last_mentioned, now));
    if (item.days_since_mention < 30.0) {
      item.relevance = 1.0;
    } else if (item.days_since_mention < 60.0) {
      item.relevance = 0.8;
    } else if (item.days_since_mention < 90.0) {
      item.relevance = 0.6;
    } else {
      item.relevance = 0.4;
    }
    if (const auto outdated = outdated_after_days(fact.relationship); outdated.has_value()) {
      item.potentially_outdated = item.days_since_mention > static_cast<double>(*outdated);
    }
    item.weighted_confidence = fact.confidence * item.relevance;
    item.fact = std::move(fact);
    weighted.push_back(std::move(item));
  }

  std::stable_sort(weighted.begin(), weighted.end(), [](const auto &a, const auto &b) {
    return a.weighted_confidence > b.weighted_confidence;
  });
  if (weighted.size() > limit) {
    weighted.resize(limit);
  }
  return ResultT::success(std::move(weighted));
}

common::Result<DeprecationReport>
SqliteKnowledgeGraphStore::deprecate_outdated_facts(const std::optional<std::string> &user_id,
                                                    const bool dry_run,
                                                    const common::UnixSeconds now) {
  using ResultT = common::Result<DeprecationReport>;
  struct Candidate {
    std::string user_id;
    std::int64_t entity_id = 0;
    std::string entity_name;
    std::string relationship;
    double current = 0.0;
    double base = 0.0;
    common::UnixSeconds last_mentioned = 0;
  };

  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<Candidate> candidates;
  {
    std::string sql = R"(
SELECT r.user_id, r.entity_id, e.entity_name, r.relationship_type, r.confidence,
       COALESCE(r.original_confidence, r.confidence), r.last_mentioned
FROM user_fact_relationships r
JOIN fact_entities e ON e.id = r.entity_id
WHERE r.superseded = 0
)";
    if (user_id.has_value()) {
      sql += "  AND r.user_id = ?1";
    }
    Statement select;
    if (auto status = prepare(db_, sql, select); !status.ok()) {
      return ResultT::propagate(status);
    }
    if (user_id.has_value()) {
      bind_text(select.stmt, 1, *user_id);
    }
    int rc = SQLITE_ROW;
    while ((rc = sqlite3_step(select.stmt)) == SQLITE_ROW) {
      candidates.push_back(Candidate{.user_id = common::column_text(select.stmt, 0),
                                     .entity_id = sqlite3_column_int64(select.stmt, 1),
                                     .entity_name = common::column_text(select.stmt, 2),
                                     .relationship = common::column_text(select.stmt, 3),
                                     .current = sqlite3_column_double(select.stmt, 4),
                                     .base = sqlite3_column_double(select.stmt, 5),
                                     .last_mentioned = sqlite3_column_int64(select.stmt, 6)});
    }
    if (rc != SQLITE_DONE) {
      return ResultT::failure(sqlite3_errmsg(db_));
    }
  }

  DeprecationReport report;
  report.dry_run = dry_run;
  report.examined = candidates.size();

  common::SqliteTransaction tx(db_);
  if (!tx.begin_status().ok()) {
    return ResultT::propagate(tx.begin_status());
  }
  Statement update;
  if (auto status = prepare(db_,
                            "UPDATE user_fact_relationships SET confidence = ?1, "
                            "original_confidence = ?2 WHERE user_id = ?3 AND entity_id = ?4 "
                            "AND relationship_type = ?5",
                            update);
      !status.ok()) {
    return ResultT::propagate(status);
  }

  for (const auto &candidate : candidates) {
    const auto limit_days = staleness_limit_days(candidate.relationship);
    if (!limit_days.has_value()) {
      continue;
    }
    const double max_days = static_cast<double>(*limit_days);
    const double age = days_between(candidate.last_mentioned, now);
    if (age <= max_days) {
      continue;
    }
    const double overdue = age - max_days;
    const double degradation = std::max(0.2, 1.0 - overdue / (max_days * 1.5));
    double updated = candidate.base * degradation;
    const bool deprecated = updated < config_.deprecation_floor;
    if (deprecated) {
      updated = config_.deprecated_confidence;
    }
    if (std::fabs(updated - candidate.current) < 1e-9) {
      continue;
    }
    if (deprecated) {
      ++report.deprecated;
    } else {
      ++report.degraded;
    }
    report.changes.push_back(candidate.user_id + "/" + candidate.entity_name + "/" +
                             candidate.relationship + ": " + format_confidence(candidate.current) +
                             " -> " + format_confidence(updated));
    if (dry_run) {
      continue;
    }
    sqlite3_reset(update.stmt);
    sqlite3_bind_double(update.stmt, 1, updated);
    sqlite3_bind_double(update.stmt, 2, candidate.base);
    bind_text(update.stmt, 3, candidate.user_id);
    sqlite3_bind_int64(update.stmt, 4, candidate.entity_id);
    bind_text(update.stmt, 5, candidate.relationship);
    if (sqlite3_step(update.stmt) != SQLITE_DONE) {
      return ResultT::failure(sqlite3_errmsg(db_));
    }
  }

  if (auto status = tx.commit(); !status.ok()) {
    return ResultT::propagate(status);
  }
  observability::record_event(observability::FactsDeprecatedEvent{.examined = report.examined,
                                                                   .degraded = report.degraded,
                                                                   .deprecated = report.deprecated,
                                                                   .dry_run = dry_run});
  return ResultT::success(std::move(report));
}

common::Result<std::size_t>
SqliteKnowledgeGraphStore::restore_deprecated_facts(const std::optional<std::string> &user_id) {
  using ResultT = common::Result<std::size_t>;
  std::string sql = "UPDATE user_fact_relationships SET confidence = original_confidence, "
                    "original_confidence = NULL WHERE original_confidence IS NOT NULL";
  if (user_id.has_value()) {
    sql += " AND user_id = ?1";
  }

  std::lock_guard<std::mutex> lock(mutex_);
  Statement update;
  if (auto status = prepare(db_, sql, update); !status.ok()) {
    return ResultT::propagate(status);
  }
  if (user_id.has_value()) {
    bind_text(update.stmt, 1, *user_id);
  }
  if (sqlite3_step(update.stmt) != SQLITE_DONE) {
    return ResultT::failure(sqlite3_errmsg(db_));
  }
  return ResultT::success(static_cast<std::size_t>(sqlite3_changes(db_)));
}

bool SqliteKnowledgeGraphStore::health_check() {
  std::lock_guard<std::mutex> lock(mutex_);
  return common::exec_sql(db_, "SELECT 1").ok();
}

} // namespace memroute::knowledge
