#pragma once

#include "devchain/common/result.hpp"
#include "devchain/config/schema.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace devchain::config {

[[nodiscard]] common::Result<std::filesystem::path> config_dir();
[[nodiscard]] common::Result<std::filesystem::path> config_path();
void set_config_path_override(std::optional<std::filesystem::path> path);
void clear_config_path_override();

[[nodiscard]] std::string expand_config_path(const std::string &path);

/// Parses TOML text on top of the defaults. Unknown keys are ignored.
[[nodiscard]] common::Result<Config> parse_config(const std::string &content);
[[nodiscard]] common::Result<Config> load_config();
[[nodiscard]] common::Status save_config(const Config &config);

/// Returns warnings for suspicious but usable values; fails on unusable ones.
[[nodiscard]] common::Result<std::vector<std::string>> validate_config(const Config &config);

void apply_env_overrides(Config &config);

} // namespace devchain::config
