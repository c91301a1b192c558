#pragma once

#include "memroute/ports/embedder.hpp"
#include "memroute/ports/http_client.hpp"

namespace memroute::ports {

/// OpenAI-compatible `/v1/embeddings` client.
class HttpEmbedder final : public IEmbedder {
public:
  HttpEmbedder(config::EmbeddingConfig config, std::shared_ptr<HttpClient> http_client =
                                                   std::make_shared<CurlHttpClient>());

  [[nodiscard]] std::string_view name() const override { return "http"; }
  [[nodiscard]] common::Result<std::vector<float>> embed(std::string_view text) override;
  [[nodiscard]] std::size_t dimensions() const override { return config_.dimensions; }

private:
  config::EmbeddingConfig config_;
  std::shared_ptr<HttpClient> http_client_;
};

} // namespace memroute::ports
