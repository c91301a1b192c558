#include "memroute/common/sqlite_util.hpp"

#include <cstring>

namespace memroute::common {

Result<sqlite3 *> open_sqlite(const std::filesystem::path &path) {
  if (!path.parent_path().empty()) {
    std::error_code ec;
    std::filesystem::create_directories(path.parent_path(), ec);
    if (ec) {
      return Result<sqlite3 *>::failure("cannot create " + path.parent_path().string() + ": " +
                                        ec.message());
    }
  }

  sqlite3 *db = nullptr;
  const int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX;
  if (sqlite3_open_v2(path.string().c_str(), &db, flags, nullptr) != SQLITE_OK) {
    const std::string message = db == nullptr ? "out of memory" : sqlite3_errmsg(db);
    sqlite3_close(db);
    return Result<sqlite3 *>::failure("cannot open " + path.string() + ": " + message);
  }
  sqlite3_busy_timeout(db, 2000);

  if (auto status = exec_sql(db, "PRAGMA journal_mode=WAL;"); !status.ok()) {
    sqlite3_close(db);
    return Result<sqlite3 *>::failure(status.error());
  }
  return Result<sqlite3 *>::success(db);
}

Status exec_sql(sqlite3 *db, const std::string &sql) {
  char *err = nullptr;
  const int rc = sqlite3_exec(db, sql.c_str(), nullptr, nullptr, &err);
  if (rc != SQLITE_OK) {
    const std::string msg = err == nullptr ? "sqlite error" : err;
    if (err != nullptr) {
      sqlite3_free(err);
    }
    return Status::error(msg);
  }
  return Status::success();
}

std::string column_text(sqlite3_stmt *stmt, const int column) {
  const auto *text = sqlite3_column_text(stmt, column);
  return text == nullptr ? std::string() : std::string(reinterpret_cast<const char *>(text));
}

std::vector<unsigned char> vector_to_blob(const std::vector<float> &values) {
  std::vector<unsigned char> blob(values.size() * sizeof(float));
  if (!blob.empty()) {
    std::memcpy(blob.data(), values.data(), blob.size());
  }
  return blob;
}

std::vector<float> blob_to_vector(const void *blob, const int bytes) {
  if (blob == nullptr || bytes <= 0 || (bytes % static_cast<int>(sizeof(float)) != 0)) {
    return {};
  }
  std::vector<float> values(static_cast<std::size_t>(bytes) / sizeof(float));
  std::memcpy(values.data(), blob, static_cast<std::size_t>(bytes));
  return values;
}

SqliteTransaction::SqliteTransaction(sqlite3 *db)
    : db_(db), begin_status_(exec_sql(db, "BEGIN IMMEDIATE")) {}

SqliteTransaction::~SqliteTransaction() {
  if (!finished_ && begin_status_.ok()) {
    (void)exec_sql(db_, "ROLLBACK");
  }
}

Status SqliteTransaction::commit() {
  if (!begin_status_.ok()) {
    return begin_status_;
  }
  auto status = exec_sql(db_, "COMMIT");
  finished_ = status.ok();
  return status;
}

} // namespace memroute::common
