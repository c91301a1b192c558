#pragma once

#include "memroute/common/result.hpp"
#include "memroute/memory/memory_store.hpp"
#include "memroute/ports/embedder.hpp"
#include "memroute/ports/emotion.hpp"

#include <memory>
#include <optional>
#include <string>

namespace memroute::memory {

/// Write path for conversation turns: emotion label, three named embeddings, one record.
class MemoryIngestor {
public:
  MemoryIngestor(std::shared_ptr<ports::IEmbedder> embedder,
                 std::shared_ptr<ports::IEmotionClassifier> emotion,
                 std::shared_ptr<IMemoryStore> store);

  [[nodiscard]] common::Result<MemoryRecord>
  ingest(const std::string &user_id, const std::string &content,
         std::optional<common::UnixSeconds> timestamp = std::nullopt);

private:
  std::shared_ptr<ports::IEmbedder> embedder_;
  std::shared_ptr<ports::IEmotionClassifier> emotion_;
  std::shared_ptr<IMemoryStore> store_;
};

} // namespace memroute::memory
