#pragma once

#include "memroute/ports/emotion.hpp"
#include "memroute/ports/http_client.hpp"

namespace memroute::ports {

/// POSTs `{"text": ...}` and reads `{"label": ..., "confidence": ...}`.
class HttpEmotionClassifier final : public IEmotionClassifier {
public:
  HttpEmotionClassifier(config::EmotionConfig config,
                        std::shared_ptr<HttpClient> http_client = std::make_shared<CurlHttpClient>());

  [[nodiscard]] std::string_view name() const override { return "http"; }
  [[nodiscard]] common::Result<EmotionResult> classify(std::string_view text) override;

private:
  config::EmotionConfig config_;
  std::shared_ptr<HttpClient> http_client_;
};

} // namespace memroute::ports
