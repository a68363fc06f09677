#pragma once

#include "parley/common/result.hpp"
#include "parley/common/toml.hpp"
#include "parley/config/schema.hpp"

#include <filesystem>
#include <optional>
#include <vector>

namespace parley::config {

[[nodiscard]] common::Result<std::filesystem::path> config_dir();
[[nodiscard]] common::Result<std::filesystem::path> config_path();
void set_config_path_override(std::optional<std::filesystem::path> path);
[[nodiscard]] std::optional<std::filesystem::path> config_path_override();

/// Applies every recognised key of `doc` on top of the defaults in `config`.
void apply_toml(Config &config, const common::TomlDocument &doc);

[[nodiscard]] common::Result<Config> load_config();
[[nodiscard]] common::Result<Config> load_config_from(const std::filesystem::path &path);
[[nodiscard]] common::Status save_config(const Config &config);
[[nodiscard]] common::Status save_config_to(const Config &config,
                                            const std::filesystem::path &path);

/// Errors for values that would break the server, warnings for everything else.
[[nodiscard]] common::Result<std::vector<std::string>> validate_config(const Config &config);

void apply_env_overrides(Config &config);

} // namespace parley::config
