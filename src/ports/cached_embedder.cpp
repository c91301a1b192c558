#include "memroute/ports/cached_embedder.hpp"

#include "memroute/common/sqlite_util.hpp"
#include "memroute/common/time.hpp"
#include "memroute/observability/global.hpp"

#include <openssl/sha.h>

#include <iomanip>
#include <sstream>

namespace memroute::ports {

std::string sha256_hex(const std::string_view text) {
  unsigned char digest[SHA256_DIGEST_LENGTH];
  SHA256(reinterpret_cast<const unsigned char *>(text.data()), text.size(), digest);

  std::ostringstream stream;
  stream << std::hex << std::setfill('0');
  for (const unsigned char c : digest) {
    stream << std::setw(2) << static_cast<int>(c);
  }
  return stream.str();
}

common::Result<std::unique_ptr<CachedEmbedder>>
CachedEmbedder::open(std::unique_ptr<IEmbedder> inner, const std::filesystem::path &db_path,
                     const std::size_t max_entries) {
  using ResultT = common::Result<std::unique_ptr<CachedEmbedder>>;
  if (inner == nullptr) {
    return ResultT::failure("cached embedder needs an inner embedder");
  }
  auto db = common::open_sqlite(db_path);
  if (!db.ok()) {
    return ResultT::propagate(db);
  }
  auto status = common::exec_sql(db.value(), R"(
CREATE TABLE IF NOT EXISTS embedding_cache (
  text_hash TEXT PRIMARY KEY,
  embedding BLOB NOT NULL,
  created_at INTEGER NOT NULL
);
CREATE INDEX IF NOT EXISTS idx_embedding_cache_created ON embedding_cache(created_at);
)");
  if (!status.ok()) {
    sqlite3_close(db.value());
    return ResultT::failure(status.error());
  }
  return ResultT::success(std::unique_ptr<CachedEmbedder>(
      new CachedEmbedder(std::move(inner), db.value(), max_entries)));
}

CachedEmbedder::CachedEmbedder(std::unique_ptr<IEmbedder> inner, sqlite3 *db,
                               const std::size_t max_entries)
    : inner_(std::move(inner)), db_(db), max_entries_(max_entries) {
  sqlite3_stmt *stmt = nullptr;
  if (sqlite3_prepare_v2(db_, "SELECT COUNT(*) FROM embedding_cache", -1, &stmt, nullptr) ==
      SQLITE_OK) {
    if (sqlite3_step(stmt) == SQLITE_ROW) {
      stats_.size = static_cast<std::size_t>(sqlite3_column_int64(stmt, 0));
    }
    sqlite3_finalize(stmt);
  }
}

CachedEmbedder::~CachedEmbedder() {
  if (db_ != nullptr) {
    sqlite3_close(db_);
  }
}

common::Result<std::optional<std::vector<float>>> CachedEmbedder::lookup(const std::string &hash) {
  using ResultT = common::Result<std::optional<std::vector<float>>>;
  sqlite3_stmt *stmt = nullptr;
  if (sqlite3_prepare_v2(db_, "SELECT embedding FROM embedding_cache WHERE text_hash = ?1", -1,
                         &stmt, nullptr) != SQLITE_OK) {
    return ResultT::failure(sqlite3_errmsg(db_));
  }
  sqlite3_bind_text(stmt, 1, hash.c_str(), -1, SQLITE_TRANSIENT);

  std::optional<std::vector<float>> found;
  if (sqlite3_step(stmt) == SQLITE_ROW) {
    found = common::blob_to_vector(sqlite3_column_blob(stmt, 0), sqlite3_column_bytes(stmt, 0));
  }
  sqlite3_finalize(stmt);
  return ResultT::success(std::move(found));
}

common::Status CachedEmbedder::insert(const std::string &hash,
                                      const std::vector<float> &embedding) {
  sqlite3_stmt *stmt = nullptr;
  const char *sql = "INSERT OR REPLACE INTO embedding_cache(text_hash, embedding, created_at) "
                    "VALUES(?1, ?2, ?3)";
  if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
    return common::Status::error(sqlite3_errmsg(db_));
  }
  const auto blob = common::vector_to_blob(embedding);
  sqlite3_bind_text(stmt, 1, hash.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_blob(stmt, 2, blob.data(), static_cast<int>(blob.size()), SQLITE_TRANSIENT);
  sqlite3_bind_int64(stmt, 3, common::now_unix());
  const int rc = sqlite3_step(stmt);
  sqlite3_finalize(stmt);
  if (rc != SQLITE_DONE) {
    return common::Status::error(sqlite3_errmsg(db_));
  }

  ++stats_.size;
  if (stats_.size <= max_entries_) {
    return common::Status::success();
  }

  sqlite3_stmt *count_stmt = nullptr;
  if (sqlite3_prepare_v2(db_, "SELECT COUNT(*) FROM embedding_cache", -1, &count_stmt, nullptr) !=
      SQLITE_OK) {
    return common::Status::error(sqlite3_errmsg(db_));
  }
  if (sqlite3_step(count_stmt) == SQLITE_ROW) {
    stats_.size = static_cast<std::size_t>(sqlite3_column_int64(count_stmt, 0));
  }
  sqlite3_finalize(count_stmt);

  if (stats_.size > max_entries_) {
    const std::size_t overflow = stats_.size - max_entries_;
    auto trim = common::exec_sql(
        db_, "DELETE FROM embedding_cache WHERE text_hash IN (SELECT text_hash FROM "
             "embedding_cache ORDER BY created_at ASC, rowid ASC LIMIT " +
                 std::to_string(overflow) + ")");
    if (!trim.ok()) {
      return trim;
    }
    stats_.size = max_entries_;
  }
  return common::Status::success();
}

common::Result<std::vector<float>> CachedEmbedder::embed(const std::string_view text) {
  const std::string hash = sha256_hex(std::string(inner_->name()) + ":" + std::string(text));
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto cached = lookup(hash);
    if (!cached.ok()) {
      return common::Result<std::vector<float>>::propagate(cached);
    }
    if (cached.value().has_value() && cached.value()->size() == inner_->dimensions()) {
      ++stats_.hits;
      return common::Result<std::vector<float>>::success(std::move(*cached.value()));
    }
    ++stats_.misses;
  }

  auto embedded = inner_->embed(text);
  if (!embedded.ok()) {
    return embedded;
  }

  std::lock_guard<std::mutex> lock(mutex_);
  if (auto status = insert(hash, embedded.value()); !status.ok()) {
    observability::record_degraded("embedding_cache", "write failed: " + status.error());
  }
  return embedded;
}

EmbeddingCacheStats CachedEmbedder::stats() {
  std::lock_guard<std::mutex> lock(mutex_);
  return stats_;
}

} // namespace memroute::ports
