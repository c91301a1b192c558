#pragma once

#include "memroute/ports/embedder.hpp"

#include <sqlite3.h>

#include <mutex>
#include <optional>

namespace memroute::ports {

struct EmbeddingCacheStats {
  std::size_t hits = 0;
  std::size_t misses = 0;
  std::size_t size = 0;
};

/// Decorates an embedder with a SQLite table keyed by the SHA-256 of
/// `<embedder name>:<text>`. Oldest rows are trimmed past `max_entries`.
/// A failed cache write is reported as degraded; the fresh embedding is still returned.
class CachedEmbedder final : public IEmbedder {
public:
  [[nodiscard]] static common::Result<std::unique_ptr<CachedEmbedder>>
  open(std::unique_ptr<IEmbedder> inner, const std::filesystem::path &db_path,
       std::size_t max_entries);
  ~CachedEmbedder() override;

  CachedEmbedder(const CachedEmbedder &) = delete;
  CachedEmbedder &operator=(const CachedEmbedder &) = delete;

  [[nodiscard]] std::string_view name() const override { return inner_->name(); }
  [[nodiscard]] common::Result<std::vector<float>> embed(std::string_view text) override;
  [[nodiscard]] std::size_t dimensions() const override { return inner_->dimensions(); }

  [[nodiscard]] EmbeddingCacheStats stats();

private:
  CachedEmbedder(std::unique_ptr<IEmbedder> inner, sqlite3 *db, std::size_t max_entries);

  [[nodiscard]] common::Result<std::optional<std::vector<float>>> lookup(const std::string &hash);
  [[nodiscard]] common::Status insert(const std::string &hash, const std::vector<float> &embedding);

  std::unique_ptr<IEmbedder> inner_;
  sqlite3 *db_;
  std::size_t max_entries_;
  std::mutex mutex_;
  EmbeddingCacheStats stats_;
};

[[nodiscard]] std::string sha256_hex(std::string_view text);

} // namespace memroute::ports
