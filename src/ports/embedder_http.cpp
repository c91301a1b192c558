#include "memroute/ports/embedder_http.hpp"

#include "memroute/common/json_util.hpp"

#include <sstream>

namespace memroute::ports {

HttpEmbedder::HttpEmbedder(config::EmbeddingConfig config, std::shared_ptr<HttpClient> http_client)
    : config_(std::move(config)), http_client_(std::move(http_client)) {}

common::Result<std::vector<float>> HttpEmbedder::embed(const std::string_view text) {
  std::ostringstream body;
  body << "{";
  body << "\"model\":\"" << common::json_escape(config_.model) << "\",";
  body << "\"input\":\"" << common::json_escape(std::string(text)) << "\",";
  body << "\"dimensions\":" << config_.dimensions;
  body << "}";

  std::unordered_map<std::string, std::string> headers = {
      {"Content-Type", "application/json"},
  };
  if (config_.api_key.has_value()) {
    headers["Authorization"] = "Bearer " + *config_.api_key;
  }

  const auto response =
      http_client_->post_json(config_.endpoint, headers, body.str(), config_.timeout_ms);
  if (response.timeout) {
    return common::Result<std::vector<float>>::failure("embedding request timed out");
  }
  if (response.network_error) {
    return common::Result<std::vector<float>>::failure(response.network_error_message);
  }
  if (response.status < 200 || response.status >= 300) {
    return common::Result<std::vector<float>>::failure("embedding API returned HTTP " +
                                                       std::to_string(response.status));
  }

  std::vector<float> values;
  const std::string array = common::json_get_array(response.body, "embedding");
  if (array.empty() || !common::json_parse_number_array(array, values)) {
    return common::Result<std::vector<float>>::failure("embedding array missing from response");
  }
  if (values.size() != config_.dimensions) {
    return common::Result<std::vector<float>>::failure(
        "embedding has " + std::to_string(values.size()) + " dimensions, expected " +
        std::to_string(config_.dimensions));
  }
  return common::Result<std::vector<float>>::success(std::move(values));
}

} // namespace memroute::ports
