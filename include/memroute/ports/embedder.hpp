#pragma once

#include "memroute/common/result.hpp"
#include "memroute/config/schema.hpp"

#include <filesystem>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace memroute::ports {

/// Black-box `text -> vector` function. Implementations must be safe to call concurrently.
class IEmbedder {
public:
  virtual ~IEmbedder() = default;

  [[nodiscard]] virtual std::string_view name() const = 0;
  [[nodiscard]] virtual common::Result<std::vector<float>> embed(std::string_view text) = 0;
  [[nodiscard]] virtual common::Result<std::vector<std::vector<float>>>
  embed_batch(const std::vector<std::string> &texts);
  [[nodiscard]] virtual std::size_t dimensions() const = 0;
};

/// Builds the configured embedder, wrapped in the SQLite cache under `data_dir` when enabled.
[[nodiscard]] common::Result<std::unique_ptr<IEmbedder>>
create_embedder(const config::Config &config, const std::filesystem::path &data_dir);

} // namespace memroute::ports
