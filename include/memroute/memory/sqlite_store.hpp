#pragma once

#include "memroute/memory/memory_store.hpp"
#include "memroute/memory/vector_index.hpp"

#include <sqlite3.h>

#include <array>
#include <filesystem>
#include <memory>
#include <mutex>
#include <unordered_map>

namespace memroute::memory {

/// Records live in SQLite; each user gets one in-memory index per named vector,
/// rebuilt from the table on open.
class SqliteMemoryStore final : public IMemoryStore {
public:
  [[nodiscard]] static common::Result<std::unique_ptr<SqliteMemoryStore>>
  open(const std::filesystem::path &db_path, std::size_t dimensions);
  ~SqliteMemoryStore() override;

  SqliteMemoryStore(const SqliteMemoryStore &) = delete;
  SqliteMemoryStore &operator=(const SqliteMemoryStore &) = delete;

  [[nodiscard]] std::string_view name() const override { return "sqlite"; }
  [[nodiscard]] common::Status put(const MemoryRecord &record) override;
  [[nodiscard]] common::Result<std::vector<ScoredRecord>>
  search(NamedVector vector, const std::vector<float> &query, const std::string &user_id,
         std::size_t limit) override;
  [[nodiscard]] common::Result<std::vector<MemoryRecord>>
  chronological(const std::string &user_id, const ChronologicalRange &range) override;
  [[nodiscard]] common::Status set_status(const std::string &id,
                                          const std::string &status) override;
  [[nodiscard]] common::Result<std::size_t> count(const std::string &user_id) override;
  [[nodiscard]] bool health_check() override;

private:
  using UserIndexes = std::array<VectorIndex, 3>;

  SqliteMemoryStore(sqlite3 *db, std::size_t dimensions);

  [[nodiscard]] common::Status init_schema();
  [[nodiscard]] common::Status load_indexes();
  [[nodiscard]] common::Status index_record(const std::string &user_id, const std::string &id,
                                            const NamedEmbeddings &embeddings);
  [[nodiscard]] common::Result<std::unordered_map<std::string, MemoryRecord>>
  load_records(const std::vector<std::string> &ids);

  sqlite3 *db_;
  std::size_t dimensions_;
  std::mutex mutex_;
  std::unordered_map<std::string, UserIndexes> indexes_;
};

} // namespace memroute::memory
