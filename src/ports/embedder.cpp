#include "memroute/ports/embedder.hpp"

#include "memroute/ports/cached_embedder.hpp"
#include "memroute/ports/embedder_http.hpp"
#include "memroute/ports/embedder_local.hpp"
#include "memroute/ports/embedder_noop.hpp"

namespace memroute::ports {

common::Result<std::vector<std::vector<float>>>
IEmbedder::embed_batch(const std::vector<std::string> &texts) {
  std::vector<std::vector<float>> out;
  out.reserve(texts.size());
  for (const auto &text : texts) {
    auto embedded = embed(text);
    if (!embedded.ok()) {
      return common::Result<std::vector<std::vector<float>>>::propagate(embedded);
    }
    out.push_back(std::move(embedded.value()));
  }
  return common::Result<std::vector<std::vector<float>>>::success(std::move(out));
}

common::Result<std::unique_ptr<IEmbedder>> create_embedder(const config::Config &config,
                                                          const std::filesystem::path &data_dir) {
  using ResultT = common::Result<std::unique_ptr<IEmbedder>>;
  const auto &settings = config.embedding;

  std::unique_ptr<IEmbedder> embedder;
  if (settings.provider == "noop") {
    return ResultT::success(std::make_unique<NoopEmbedder>(settings.dimensions));
  }
  if (settings.provider == "http") {
    if (!settings.api_key.has_value() || settings.api_key->empty()) {
      return ResultT::failure("embedding.provider = http requires an api key");
    }
    embedder = std::make_unique<HttpEmbedder>(settings);
  } else if (settings.provider == "local") {
    embedder = std::make_unique<LocalEmbedder>(settings.dimensions);
  } else {
    return ResultT::failure("unknown embedding provider: " + settings.provider);
  }

  if (!settings.cache_enabled) {
    return ResultT::success(std::move(embedder));
  }
  auto cached = CachedEmbedder::open(std::move(embedder), data_dir / config.storage.cache_db,
                                     settings.cache_size);
  if (!cached.ok()) {
    return ResultT::propagate(cached);
  }
  return ResultT::success(std::move(cached.value()));
}

} // namespace memroute::ports
