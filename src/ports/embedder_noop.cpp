#include "memroute/ports/embedder_noop.hpp"

namespace memroute::ports {

NoopEmbedder::NoopEmbedder(const std::size_t dimensions) : dimensions_(dimensions) {}

common::Result<std::vector<float>> NoopEmbedder::embed(std::string_view) {
  return common::Result<std::vector<float>>::success(std::vector<float>(dimensions_, 0.0F));
}

} // namespace memroute::ports
