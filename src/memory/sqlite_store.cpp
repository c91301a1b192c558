#include "memroute/memory/sqlite_store.hpp"

#include "memroute/common/sqlite_util.hpp"

#include <sstream>

namespace memroute::memory {

namespace {

constexpr const char *kRecordColumns =
    "id, user_id, content, timestamp, emotion_label, emotion_intensity, status";

std::size_t slot(const NamedVector vector) { return static_cast<std::size_t>(vector); }

MemoryRecord row_to_record(sqlite3_stmt *stmt) {
  MemoryRecord record;
  record.id = common::column_text(stmt, 0);
  record.user_id = common::column_text(stmt, 1);
  record.content = common::column_text(stmt, 2);
  record.timestamp = sqlite3_column_int64(stmt, 3);
  record.emotion_label = common::column_text(stmt, 4);
  record.emotion_intensity = sqlite3_column_double(stmt, 5);
  if (sqlite3_column_type(stmt, 6) != SQLITE_NULL) {
    record.status = common::column_text(stmt, 6);
  }
  return record;
}

void bind_vector(sqlite3_stmt *stmt, const int index, const std::vector<float> &values) {
  if (values.empty()) {
    sqlite3_bind_null(stmt, index);
    return;
  }
  const auto blob = common::vector_to_blob(values);
  sqlite3_bind_blob(stmt, index, blob.data(), static_cast<int>(blob.size()), SQLITE_TRANSIENT);
}

} // namespace

common::Result<std::unique_ptr<SqliteMemoryStore>>
SqliteMemoryStore::open(const std::filesystem::path &db_path, const std::size_t dimensions) {
  using ResultT = common::Result<std::unique_ptr<SqliteMemoryStore>>;
  auto db = common::open_sqlite(db_path);
  if (!db.ok()) {
    return ResultT::propagate(db);
  }
  std::unique_ptr<SqliteMemoryStore> store(new SqliteMemoryStore(db.value(), dimensions));
  if (auto status = store->init_schema(); !status.ok()) {
    return ResultT::failure("memory schema: " + status.error());
  }
  if (auto status = store->load_indexes(); !status.ok()) {
    return ResultT::failure("memory index rebuild: " + status.error());
  }
  return ResultT::success(std::move(store));
}

SqliteMemoryStore::SqliteMemoryStore(sqlite3 *db, const std::size_t dimensions)
    : db_(db), dimensions_(dimensions) {}

SqliteMemoryStore::~SqliteMemoryStore() {
  if (db_ != nullptr) {
    sqlite3_close(db_);
  }
}

common::Status SqliteMemoryStore::init_schema() {
  return common::exec_sql(db_, R"(
CREATE TABLE IF NOT EXISTS memories (
  id TEXT PRIMARY KEY,
  user_id TEXT NOT NULL,
  content TEXT NOT NULL,
  timestamp INTEGER NOT NULL,
  emotion_label TEXT NOT NULL DEFAULT 'neutral',
  emotion_intensity REAL NOT NULL DEFAULT 0,
  status TEXT,
  content_vector BLOB,
  emotion_vector BLOB,
  semantic_vector BLOB
);
CREATE INDEX IF NOT EXISTS idx_memories_user_time ON memories(user_id, timestamp);
)");
}

common::Status SqliteMemoryStore::index_record(const std::string &user_id, const std::string &id,
                                               const NamedEmbeddings &embeddings) {
  auto [it, inserted] = indexes_.try_emplace(
      user_id, UserIndexes{VectorIndex(dimensions_), VectorIndex(dimensions_),
                           VectorIndex(dimensions_)});
  for (const auto vector : kAllNamedVectors) {
    const auto &values = embeddings.get(vector);
    if (values.empty()) {
      continue;
    }
    if (auto status = it->second[slot(vector)].add(id, values); !status.ok()) {
      return common::Status::error(std::string(named_vector_to_string(vector)) + " vector of " +
                                   id + ": " + status.error());
    }
  }
  return common::Status::success();
}

common::Status SqliteMemoryStore::load_indexes() {
  sqlite3_stmt *stmt = nullptr;
  const char *sql =
      "SELECT id, user_id, content_vector, emotion_vector, semantic_vector FROM memories";
  if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
    return common::Status::error(sqlite3_errmsg(db_));
  }

  common::Status status = common::Status::success();
  int rc = SQLITE_ROW;
  while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
    NamedEmbeddings embeddings;
    for (const auto vector : kAllNamedVectors) {
      const int column = 2 + static_cast<int>(slot(vector));
      embeddings.get(vector) = common::blob_to_vector(sqlite3_column_blob(stmt, column),
                                                      sqlite3_column_bytes(stmt, column));
    }
    status = index_record(common::column_text(stmt, 1), common::column_text(stmt, 0), embeddings);
    if (!status.ok()) {
      break;
    }
  }
  if (status.ok() && rc != SQLITE_DONE) {
    status = common::Status::error(sqlite3_errmsg(db_));
  }
  sqlite3_finalize(stmt);
  return status;
}

common::Status SqliteMemoryStore::put(const MemoryRecord &record) {
  if (record.id.empty() || record.user_id.empty()) {
    return common::Status::error("memory record needs an id and a user_id");
  }
  for (const auto vector : kAllNamedVectors) {
    const auto &values = record.embeddings.get(vector);
    if (!values.empty() && values.size() != dimensions_) {
      return common::Status::error(std::string(named_vector_to_string(vector)) +
                                   " vector has wrong dimensions");
    }
  }

  std::lock_guard<std::mutex> lock(mutex_);
  sqlite3_stmt *stmt = nullptr;
  // Records are immutable: a repeated id is rejected by the primary key.
  const char *sql = R"(
INSERT INTO memories(id, user_id, content, timestamp, emotion_label, emotion_intensity, status,
                     content_vector, emotion_vector, semantic_vector)
VALUES(?1, ?2, ?3, ?4, ?5, ?6, ?7, ?8, ?9, ?10)
)";
  if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
    return common::Status::error(sqlite3_errmsg(db_));
  }
  sqlite3_bind_text(stmt, 1, record.id.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt, 2, record.user_id.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt, 3, record.content.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_int64(stmt, 4, record.timestamp);
  sqlite3_bind_text(stmt, 5, record.emotion_label.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_double(stmt, 6, record.emotion_intensity);
  if (record.status.has_value()) {
    sqlite3_bind_text(stmt, 7, record.status->c_str(), -1, SQLITE_TRANSIENT);
  } else {
    sqlite3_bind_null(stmt, 7);
  }
  bind_vector(stmt, 8, record.embeddings.content);
  bind_vector(stmt, 9, record.embeddings.emotion);
  bind_vector(stmt, 10, record.embeddings.semantic);

  const int rc = sqlite3_step(stmt);
  sqlite3_finalize(stmt);
  if (rc != SQLITE_DONE) {
    return common::Status::error(sqlite3_errmsg(db_));
  }
  return index_record(record.user_id, record.id, record.embeddings);
}

common::Result<std::unordered_map<std::string, MemoryRecord>>
SqliteMemoryStore::load_records(const std::vector<std::string> &ids) {
  using ResultT = common::Result<std::unordered_map<std::string, MemoryRecord>>;
  std::unordered_map<std::string, MemoryRecord> records;

  sqlite3_stmt *stmt = nullptr;
  const std::string sql = std::string("SELECT ") + kRecordColumns + " FROM memories WHERE id = ?1";
  if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
    return ResultT::failure(sqlite3_errmsg(db_));
  }
  for (const auto &id : ids) {
    sqlite3_reset(stmt);
    sqlite3_clear_bindings(stmt);
    sqlite3_bind_text(stmt, 1, id.c_str(), -1, SQLITE_TRANSIENT);
    if (sqlite3_step(stmt) == SQLITE_ROW) {
      records.emplace(id, row_to_record(stmt));
    }
  }
  sqlite3_finalize(stmt);
  return ResultT::success(std::move(records));
}

common::Result<std::vector<ScoredRecord>>
SqliteMemoryStore::search(const NamedVector vector, const std::vector<float> &query,
                          const std::string &user_id, const std::size_t limit) {
  using ResultT = common::Result<std::vector<ScoredRecord>>;
  std::lock_guard<std::mutex> lock(mutex_);
  const auto user = indexes_.find(user_id);
  if (user == indexes_.end() || limit == 0) {
    return ResultT::success({});
  }

  auto hits = user->second[slot(vector)].search(query, limit);
  if (!hits.ok()) {
    return ResultT::propagate(hits);
  }
  std::vector<std::string> ids;
  ids.reserve(hits.value().size());
  for (const auto &hit : hits.value()) {
    ids.push_back(hit.key);
  }
  auto records = load_records(ids);
  if (!records.ok()) {
    return ResultT::propagate(records);
  }

  std::vector<ScoredRecord> out;
  out.reserve(ids.size());
  for (const auto &hit : hits.value()) {
    auto it = records.value().find(hit.key);
    if (it != records.value().end()) {
      out.push_back(ScoredRecord{.record = std::move(it->second), .score = hit.score});
    }
  }
  return ResultT::success(std::move(out));
}

common::Result<std::vector<MemoryRecord>>
SqliteMemoryStore::chronological(const std::string &user_id, const ChronologicalRange &range) {
  using ResultT = common::Result<std::vector<MemoryRecord>>;
  std::ostringstream sql;
  sql << "SELECT " << kRecordColumns << " FROM memories WHERE user_id = ?1";
  if (range.since.has_value()) {
    sql << " AND timestamp >= ?2";
  }
  if (range.until.has_value()) {
    sql << " AND timestamp <= ?3";
  }
  sql << " ORDER BY timestamp " << (range.ascending ? "ASC" : "DESC") << ", rowid "
      << (range.ascending ? "ASC" : "DESC") << " LIMIT ?4";

  std::lock_guard<std::mutex> lock(mutex_);
  sqlite3_stmt *stmt = nullptr;
  if (sqlite3_prepare_v2(db_, sql.str().c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
    return ResultT::failure(sqlite3_errmsg(db_));
  }
  sqlite3_bind_text(stmt, 1, user_id.c_str(), -1, SQLITE_TRANSIENT);
  if (range.since.has_value()) {
    sqlite3_bind_int64(stmt, 2, *range.since);
  }
  if (range.until.has_value()) {
    sqlite3_bind_int64(stmt, 3, *range.until);
  }
  sqlite3_bind_int64(stmt, 4, static_cast<sqlite3_int64>(range.limit));

  std::vector<MemoryRecord> out;
  int rc = SQLITE_ROW;
  while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
    out.push_back(row_to_record(stmt));
  }
  sqlite3_finalize(stmt);
  if (rc != SQLITE_DONE) {
    return ResultT::failure(sqlite3_errmsg(db_));
  }
  return ResultT::success(std::move(out));
}

common::Status SqliteMemoryStore::set_status(const std::string &id, const std::string &status) {
  std::lock_guard<std::mutex> lock(mutex_);
  sqlite3_stmt *stmt = nullptr;
  if (sqlite3_prepare_v2(db_, "UPDATE memories SET status = ?1 WHERE id = ?2", -1, &stmt,
                         nullptr) != SQLITE_OK) {
    return common::Status::error(sqlite3_errmsg(db_));
  }
  sqlite3_bind_text(stmt, 1, status.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_text(stmt, 2, id.c_str(), -1, SQLITE_TRANSIENT);
  const int rc = sqlite3_step(stmt);
  sqlite3_finalize(stmt);
  if (rc != SQLITE_DONE) {
    return common::Status::error(sqlite3_errmsg(db_));
  }
  if (sqlite3_changes(db_) == 0) {
    return common::Status::error("no memory with id " + id);
  }
  return common::Status::success();
}

common::Result<std::size_t> SqliteMemoryStore::count(const std::string &user_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  sqlite3_stmt *stmt = nullptr;
  if (sqlite3_prepare_v2(db_, "SELECT COUNT(*) FROM memories WHERE user_id = ?1", -1, &stmt,
                         nullptr) != SQLITE_OK) {
    return common::Result<std::size_t>::failure(sqlite3_errmsg(db_));
  }
  sqlite3_bind_text(stmt, 1, user_id.c_str(), -1, SQLITE_TRANSIENT);
  std::size_t total = 0;
  if (sqlite3_step(stmt) == SQLITE_ROW) {
    total = static_cast<std::size_t>(sqlite3_column_int64(stmt, 0));
  }
  sqlite3_finalize(stmt);
  return common::Result<std::size_t>::success(total);
}

bool SqliteMemoryStore::health_check() {
  std::lock_guard<std::mutex> lock(mutex_);
  return common::exec_sql(db_, "SELECT 1").ok();
}

} // namespace memroute::memory
