#pragma once

#include "memroute/common/result.hpp"
#include "memroute/config/schema.hpp"
#include "memroute/knowledge/graph_store.hpp"
#include "memroute/memory/ingest.hpp"
#include "memroute/memory/memory_store.hpp"
#include "memroute/ports/embedder.hpp"
#include "memroute/ports/emotion.hpp"
#include "memroute/query/classifier.hpp"
#include "memroute/retrieval/fusion_engine.hpp"
#include "memroute/retrieval/router.hpp"

#include <filesystem>
#include <memory>

namespace memroute::runtime {

/// Every long-lived component, wired from one configuration.
struct RouterContext {
  config::Config config;
  std::filesystem::path data_dir;
  std::shared_ptr<ports::IEmbedder> embedder;
  std::shared_ptr<ports::IEmotionClassifier> emotion;
  std::shared_ptr<memory::IMemoryStore> memories;
  std::shared_ptr<knowledge::IKnowledgeGraphStore> knowledge;
  std::shared_ptr<const query::QueryClassifier> classifier;
  std::shared_ptr<retrieval::VectorFusionEngine> fusion;
  std::shared_ptr<retrieval::QueryRouter> router;
  std::shared_ptr<memory::MemoryIngestor> ingestor;
};

[[nodiscard]] common::Result<std::unique_ptr<RouterContext>>
create_context(const config::Config &config);

/// Classifier built from the configuration alone; needs no storage.
[[nodiscard]] std::shared_ptr<const query::QueryClassifier>
create_classifier(const config::Config &config);

} // namespace memroute::runtime
