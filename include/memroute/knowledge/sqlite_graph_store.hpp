#pragma once

#include "memroute/config/schema.hpp"
#include "memroute/knowledge/graph_store.hpp"

#include <sqlite3.h>

#include <filesystem>
#include <memory>
#include <mutex>

namespace memroute::knowledge {

class SqliteKnowledgeGraphStore final : public IKnowledgeGraphStore {
public:
  [[nodiscard]] static common::Result<std::unique_ptr<SqliteKnowledgeGraphStore>>
  open(const std::filesystem::path &db_path, const config::KnowledgeConfig &config);
  ~SqliteKnowledgeGraphStore() override;

  SqliteKnowledgeGraphStore(const SqliteKnowledgeGraphStore &) = delete;
  SqliteKnowledgeGraphStore &operator=(const SqliteKnowledgeGraphStore &) = delete;

  [[nodiscard]] std::string_view name() const override { return "sqlite"; }
  [[nodiscard]] common::Result<StoreFactResult> store_fact(const FactInput &input) override;
  [[nodiscard]] common::Result<std::vector<Fact>>
  get_user_facts(const std::string &user_id, const FactFilter &filter,
                 std::size_t limit) override;
  [[nodiscard]] common::Result<std::vector<RelatedEntity>>
  get_related_entities(const std::string &entity_name, std::uint32_t max_hops) override;
  [[nodiscard]] common::Result<std::vector<TemporalFact>>
  get_temporally_weighted_facts(const std::string &user_id, const FactFilter &filter,
                                std::size_t limit, common::UnixSeconds now) override;
  [[nodiscard]] common::Result<DeprecationReport>
  deprecate_outdated_facts(const std::optional<std::string> &user_id, bool dry_run,
                           common::UnixSeconds now) override;
  [[nodiscard]] common::Result<std::size_t>
  restore_deprecated_facts(const std::optional<std::string> &user_id) override;
  [[nodiscard]] bool health_check() override;

private:
  SqliteKnowledgeGraphStore(sqlite3 *db, const config::KnowledgeConfig &config);

  [[nodiscard]] common::Status init_schema();
  [[nodiscard]] common::Result<std::int64_t> upsert_entity(const std::string &name,
                                                           const std::string &type);
  [[nodiscard]] common::Result<std::size_t> discover_similar(std::int64_t entity_id,
                                                             const std::string &name,
                                                             const std::string &type);
  [[nodiscard]] common::Result<std::vector<Fact>> query_facts(const std::string &user_id,
                                                              const FactFilter &filter,
                                                              double min_confidence,
                                                              std::optional<std::size_t> limit);

  sqlite3 *db_;
  config::KnowledgeConfig config_;
  std::mutex mutex_;
};

} // namespace memroute::knowledge
