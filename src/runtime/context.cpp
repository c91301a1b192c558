#include "memroute/runtime/context.hpp"

#include "memroute/config/config.hpp"
#include "memroute/knowledge/sqlite_graph_store.hpp"
#include "memroute/memory/sqlite_store.hpp"

namespace memroute::runtime {

std::shared_ptr<const query::QueryClassifier> create_classifier(const config::Config &config) {
  return std::make_shared<query::QueryClassifier>(
      query::classifier_config_from(config.classifier),
      query::TemporalQueryDetector(config.temporal));
}

common::Result<std::unique_ptr<RouterContext>> create_context(const config::Config &config) {
  using ResultT = common::Result<std::unique_ptr<RouterContext>>;
  auto context = std::make_unique<RouterContext>();
  context->config = config;

  auto dir = config::data_dir(config);
  if (!dir.ok()) {
    return ResultT::propagate(dir);
  }
  context->data_dir = dir.value();

  auto embedder = ports::create_embedder(config, context->data_dir);
  if (!embedder.ok()) {
    return ResultT::failure("embedder: " + embedder.error());
  }
  context->embedder = std::move(embedder.value());

  auto emotion = ports::create_emotion_classifier(config);
  if (!emotion.ok()) {
    return ResultT::failure("emotion classifier: " + emotion.error());
  }
  context->emotion = std::move(emotion.value());

  auto memories = memory::SqliteMemoryStore::open(context->data_dir / config.storage.memory_db,
                                                  context->embedder->dimensions());
  if (!memories.ok()) {
    return ResultT::failure("memory store: " + memories.error());
  }
  context->memories = std::move(memories.value());

  auto knowledge = knowledge::SqliteKnowledgeGraphStore::open(
      context->data_dir / config.storage.knowledge_db, config.knowledge);
  if (!knowledge.ok()) {
    return ResultT::failure("knowledge store: " + knowledge.error());
  }
  context->knowledge = std::move(knowledge.value());

  context->classifier = create_classifier(config);
  context->fusion = std::make_shared<retrieval::VectorFusionEngine>(
      context->embedder, context->emotion, context->memories, config.fusion);
  context->router = std::make_shared<retrieval::QueryRouter>(
      context->classifier, context->fusion, context->memories, context->knowledge,
      retrieval::RouterOptions{
          .router = config.router, .knowledge = config.knowledge, .temporal = config.temporal});
  context->ingestor = std::make_shared<memory::MemoryIngestor>(context->embedder,
                                                               context->emotion, context->memories);
  return ResultT::success(std::move(context));
}

} // namespace memroute::runtime
