#include "memroute/ports/embedder_local.hpp"

#include "memroute/common/text.hpp"

#include <cmath>
#include <functional>

namespace memroute::ports {

namespace {

constexpr float kWordWeight = 1.0F;
constexpr float kTrigramWeight = 0.5F;

void add_feature(std::vector<float> &values, const std::string &feature, const float weight) {
  const std::size_t hash = std::hash<std::string>{}(feature);
  const std::size_t index = hash % values.size();
  // The next hash bit picks the sign so collisions partially cancel.
  const float sign = ((hash / values.size()) & 1U) == 0 ? 1.0F : -1.0F;
  values[index] += sign * weight;
}

void normalize(std::vector<float> &values) {
  double norm = 0.0;
  for (const float v : values) {
    norm += static_cast<double>(v) * static_cast<double>(v);
  }
  norm = std::sqrt(norm);
  if (norm < 1e-9) {
    return;
  }
  for (float &v : values) {
    v = static_cast<float>(static_cast<double>(v) / norm);
  }
}

} // namespace

LocalEmbedder::LocalEmbedder(const std::size_t dimensions)
    : dimensions_(dimensions == 0 ? kDefaultDimensions : dimensions) {}

common::Result<std::vector<float>> LocalEmbedder::embed(const std::string_view text) {
  std::vector<float> values(dimensions_, 0.0F);
  for (const auto &token : common::tokenize(std::string(text))) {
    add_feature(values, "w:" + token, kWordWeight);
    const std::string padded = " " + token + " ";
    for (std::size_t i = 0; i + 3 <= padded.size(); ++i) {
      add_feature(values, "t:" + padded.substr(i, 3), kTrigramWeight);
    }
  }
  normalize(values);
  return common::Result<std::vector<float>>::success(std::move(values));
}

} // namespace memroute::ports
