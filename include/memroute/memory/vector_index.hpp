#pragma once

#include "memroute/common/result.hpp"

#include <string>
#include <unordered_map>
#include <vector>

namespace memroute::memory {

struct VectorSearchResult {
  std::string key;
  float similarity = 0.0F;
  float score = 0.0F;
};

/// Exhaustive cosine search over a fixed-dimension set of vectors.
class VectorIndex {
public:
  explicit VectorIndex(std::size_t dimensions);

  [[nodiscard]] common::Status add(const std::string &key, const std::vector<float> &embedding);
  void remove(const std::string &key);
  /// Best `limit` matches by cosine similarity; `score` is the similarity floored at zero.
  [[nodiscard]] common::Result<std::vector<VectorSearchResult>>
  search(const std::vector<float> &query, std::size_t limit) const;

  [[nodiscard]] std::size_t size() const { return vectors_.size(); }
  [[nodiscard]] std::size_t dimensions() const { return dimensions_; }
  [[nodiscard]] bool contains(const std::string &key) const { return vectors_.contains(key); }

private:
  std::size_t dimensions_;
  std::unordered_map<std::string, std::vector<float>> vectors_;
};

[[nodiscard]] float cosine_similarity(const std::vector<float> &a, const std::vector<float> &b);

} // namespace memroute::memory
