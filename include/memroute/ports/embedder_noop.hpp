#pragma once

#include "memroute/ports/embedder.hpp"

namespace memroute::ports {

class NoopEmbedder final : public IEmbedder {
public:
  explicit NoopEmbedder(std::size_t dimensions);

  [[nodiscard]] std::string_view name() const override { return "noop"; }
  [[nodiscard]] common::Result<std::vector<float>> embed(std::string_view text) override;
  [[nodiscard]] std::size_t dimensions() const override { return dimensions_; }

private:
  std::size_t dimensions_;
};

} // namespace memroute::ports
