#pragma once

#include "memroute/common/result.hpp"
#include "memroute/config/schema.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace memroute::config {

[[nodiscard]] common::Result<std::filesystem::path> config_dir();
[[nodiscard]] common::Result<std::filesystem::path> config_path();
[[nodiscard]] bool config_exists();
void set_config_path_override(std::optional<std::filesystem::path> path);
[[nodiscard]] std::optional<std::filesystem::path> config_path_override();

/// Resolved `storage.data_dir`, created on demand.
[[nodiscard]] common::Result<std::filesystem::path> data_dir(const Config &config);

[[nodiscard]] common::Result<Config> parse_config(const std::string &toml_text);
[[nodiscard]] std::string serialize_config(const Config &config);

[[nodiscard]] common::Result<Config> load_config();
[[nodiscard]] common::Status save_config(const Config &config);

/// Warnings for questionable settings, or a failure for settings that break invariants.
[[nodiscard]] common::Result<std::vector<std::string>> validate_config(const Config &config);

void apply_env_overrides(Config &config);

} // namespace memroute::config
