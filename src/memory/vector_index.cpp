#include "memroute/memory/vector_index.hpp"

#include <algorithm>
#include <cmath>

namespace memroute::memory {

float cosine_similarity(const std::vector<float> &a, const std::vector<float> &b) {
  if (a.empty() || a.size() != b.size()) {
    return 0.0F;
  }

  double dot = 0.0;
  double norm_a = 0.0;
  double norm_b = 0.0;
  for (std::size_t i = 0; i < a.size(); ++i) {
    dot += static_cast<double>(a[i]) * static_cast<double>(b[i]);
    norm_a += static_cast<double>(a[i]) * static_cast<double>(a[i]);
    norm_b += static_cast<double>(b[i]) * static_cast<double>(b[i]);
  }
  if (norm_a < 1e-9 || norm_b < 1e-9) {
    return 0.0F;
  }
  return static_cast<float>(dot / (std::sqrt(norm_a) * std::sqrt(norm_b)));
}

VectorIndex::VectorIndex(const std::size_t dimensions) : dimensions_(dimensions) {}

common::Status VectorIndex::add(const std::string &key, const std::vector<float> &embedding) {
  if (embedding.size() != dimensions_) {
    return common::Status::error("embedding has " + std::to_string(embedding.size()) +
                                 " dimensions, index expects " + std::to_string(dimensions_));
  }
  vectors_[key] = embedding;
  return common::Status::success();
}

void VectorIndex::remove(const std::string &key) { vectors_.erase(key); }

common::Result<std::vector<VectorSearchResult>>
VectorIndex::search(const std::vector<float> &query, const std::size_t limit) const {
  if (query.size() != dimensions_) {
    return common::Result<std::vector<VectorSearchResult>>::failure("query dimensions mismatch");
  }

  std::vector<VectorSearchResult> results;
  results.reserve(vectors_.size());
  for (const auto &[key, embedding] : vectors_) {
    const float similarity = cosine_similarity(query, embedding);
    results.push_back(VectorSearchResult{
        .key = key,
        .similarity = similarity,
        .score = std::max(similarity, 0.0F),
    });
  }

  const auto by_score = [](const VectorSearchResult &lhs, const VectorSearchResult &rhs) {
    if (lhs.similarity != rhs.similarity) {
      return lhs.similarity > rhs.similarity;
    }
    return lhs.key < rhs.key;
  };
  if (results.size() > limit) {
    std::partial_sort(results.begin(), results.begin() + static_cast<long>(limit), results.end(),
                      by_score);
    results.resize(limit);
  } else {
    std::sort(results.begin(), results.end(), by_score);
  }
  return common::Result<std::vector<VectorSearchResult>>::success(std::move(results));
}

} // namespace memroute::memory
