#pragma once

#include "gardener/common/result.hpp"
#include "gardener/config/schema.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace gardener::config {

[[nodiscard]] common::Result<std::filesystem::path> config_dir();
[[nodiscard]] common::Result<std::filesystem::path> config_path();
[[nodiscard]] bool config_exists();
[[nodiscard]] std::optional<std::filesystem::path> config_path_override();
void set_config_path_override(std::optional<std::filesystem::path> path);
void clear_config_path_override();

[[nodiscard]] common::Result<Config> parse_config(const std::string &toml_text);
[[nodiscard]] common::Result<Config> load_config();
[[nodiscard]] common::Status save_config(const Config &config);
[[nodiscard]] std::string render_config(const Config &config);

/// Hard errors fail the result; soft problems come back as warnings.
[[nodiscard]] common::Result<std::vector<std::string>> validate_config(const Config &config);

void apply_env_overrides(Config &config);

/// Substitute `{data_dir}` and `{project_id}` in a path template and expand `~`/`$VAR`.
[[nodiscard]] std::filesystem::path resolve_artifact_path(const std::string &path_template,
                                                          const ArtifactsConfig &artifacts,
                                                          const std::string &project_id = "");

} // namespace gardener::config
