#include "memroute/ports/emotion_http.hpp"

#include "memroute/common/fs.hpp"
#include "memroute/common/json_util.hpp"

#include <algorithm>
#include <cstdlib>

namespace memroute::ports {

HttpEmotionClassifier::HttpEmotionClassifier(config::EmotionConfig config,
                                             std::shared_ptr<HttpClient> http_client)
    : config_(std::move(config)), http_client_(std::move(http_client)) {}

common::Result<EmotionResult> HttpEmotionClassifier::classify(const std::string_view text) {
  const std::string body = "{\"text\":\"" + common::json_escape(std::string(text)) + "\"}";
  std::unordered_map<std::string, std::string> headers = {{"Content-Type", "application/json"}};
  if (config_.api_key.has_value()) {
    headers["Authorization"] = "Bearer " + *config_.api_key;
  }

  const auto response = http_client_->post_json(config_.endpoint, headers, body, config_.timeout_ms);
  if (response.timeout) {
    return common::Result<EmotionResult>::failure("emotion service timed out");
  }
  if (response.network_error) {
    return common::Result<EmotionResult>::failure(response.network_error_message);
  }
  if (response.status < 200 || response.status >= 300) {
    return common::Result<EmotionResult>::failure("emotion service returned HTTP " +
                                                  std::to_string(response.status));
  }

  EmotionResult result;
  result.label = common::to_lower(common::json_get_string(response.body, "label"));
  const std::string confidence = common::json_get_number(response.body, "confidence");
  if (result.label.empty() || confidence.empty()) {
    return common::Result<EmotionResult>::failure("emotion response missing label or confidence");
  }
  result.confidence = std::clamp(std::strtod(confidence.c_str(), nullptr), 0.0, 1.0);
  return common::Result<EmotionResult>::success(result);
}

} // namespace memroute::ports
