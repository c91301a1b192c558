#include "memroute/memory/ingest.hpp"

#include "memroute/common/fs.hpp"
#include "memroute/ports/cached_embedder.hpp"

namespace memroute::memory {

MemoryIngestor::MemoryIngestor(std::shared_ptr<ports::IEmbedder> embedder,
                               std::shared_ptr<ports::IEmotionClassifier> emotion,
                               std::shared_ptr<IMemoryStore> store)
    : embedder_(std::move(embedder)), emotion_(std::move(emotion)), store_(std::move(store)) {}

common::Result<MemoryRecord>
MemoryIngestor::ingest(const std::string &user_id, const std::string &content,
                       const std::optional<common::UnixSeconds> timestamp) {
  using ResultT = common::Result<MemoryRecord>;
  if (common::trim(user_id).empty() || common::trim(content).empty()) {
    return ResultT::failure("user id and content are required");
  }

  MemoryRecord record;
  record.user_id = user_id;
  record.content = content;
  record.timestamp = timestamp.value_or(common::now_unix());

  auto emotion = emotion_->classify(content);
  if (!emotion.ok()) {
    return ResultT::failure("emotion classification failed: " + emotion.error());
  }
  record.emotion_label = emotion.value().label;
  record.emotion_intensity = emotion.value().confidence;

  std::vector<std::string> texts;
  for (const auto vector : kAllNamedVectors) {
    texts.push_back(embedding_text(vector, content, record.emotion_label));
  }
  auto embedded = embedder_->embed_batch(texts);
  if (!embedded.ok()) {
    return ResultT::failure("embedding failed: " + embedded.error());
  }
  if (embedded.value().size() != kAllNamedVectors.size()) {
    return ResultT::failure("embedder returned wrong number of vectors");
  }
  for (std::size_t i = 0; i < kAllNamedVectors.size(); ++i) {
    record.embeddings.get(kAllNamedVectors[i]) = std::move(embedded.value()[i]);
  }

  const std::string seed = user_id + "\n" + std::to_string(record.timestamp) + "\n" + content;
  record.id = ports::sha256_hex(seed).substr(0, 24);

  if (auto status = store_->put(record); !status.ok()) {
    return ResultT::failure("store write failed: " + status.error());
  }
  return ResultT::success(std::move(record));
}

} // namespace memroute::memory
