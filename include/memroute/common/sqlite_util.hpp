#pragma once

#include "memroute/common/result.hpp"

#include <sqlite3.h>

#include <filesystem>
#include <string>
#include <vector>

namespace memroute::common {

/// Opens (creating parent directories) a database in WAL mode with a busy timeout.
[[nodiscard]] Result<sqlite3 *> open_sqlite(const std::filesystem::path &path);

[[nodiscard]] Status exec_sql(sqlite3 *db, const std::string &sql);

/// Column text, or an empty string for NULL.
[[nodiscard]] std::string column_text(sqlite3_stmt *stmt, int column);

[[nodiscard]] std::vector<unsigned char> vector_to_blob(const std::vector<float> &values);
[[nodiscard]] std::vector<float> blob_to_vector(const void *blob, int bytes);

/// Rolls back on destruction unless commit() succeeded.
class SqliteTransaction {
public:
  explicit SqliteTransaction(sqlite3 *db);
  ~SqliteTransaction();

  SqliteTransaction(const SqliteTransaction &) = delete;
  SqliteTransaction &operator=(const SqliteTransaction &) = delete;

  [[nodiscard]] const Status &begin_status() const { return begin_status_; }
  [[nodiscard]] Status commit();

private:
  sqlite3 *db_;
  Status begin_status_;
  bool finished_ = false;
};

} // namespace memroute::common
