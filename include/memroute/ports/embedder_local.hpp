#pragma once

#include "memroute/ports/embedder.hpp"

namespace memroute::ports {

/// Deterministic hashed bag of words and character trigrams. Texts sharing
/// vocabulary land close together, which is enough for local use and tests.
class LocalEmbedder final : public IEmbedder {
public:
  explicit LocalEmbedder(std::size_t dimensions = kDefaultDimensions);

  [[nodiscard]] std::string_view name() const override { return "local"; }
  [[nodiscard]] common::Result<std::vector<float>> embed(std::string_view text) override;
  [[nodiscard]] std::size_t dimensions() const override { return dimensions_; }

  static constexpr std::size_t kDefaultDimensions = 384;

private:
  std::size_t dimensions_;
};

} // namespace memroute::ports
