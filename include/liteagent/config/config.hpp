#pragma once

#include "liteagent/common/result.hpp"
#include "liteagent/config/schema.hpp"
#include "liteagent/sandbox/session_config.hpp"

#include <filesystem>
#include <optional>
#include <vector>

namespace liteagent::config {

[[nodiscard]] common::Result<std::filesystem::path> config_dir();
[[nodiscard]] common::Result<std::filesystem::path> config_path();
[[nodiscard]] bool config_exists();
void set_config_path_override(std::optional<std::filesystem::path> path);
void clear_config_path_override();
[[nodiscard]] std::optional<std::filesystem::path> config_path_override();

[[nodiscard]] common::Result<Config> load_config();
[[nodiscard]] common::Result<Config> parse_config(const std::string &toml_text);
[[nodiscard]] common::Status save_config(const Config &config);

/// Hard errors fail the Result; soft problems come back as warnings.
[[nodiscard]] common::Result<std::vector<std::string>> validate_config(const Config &config);

void apply_env_overrides(Config &config);

[[nodiscard]] sandbox::RuntimeSettings runtime_settings(const Config &config);
[[nodiscard]] common::Result<sandbox::SessionOverrides> session_overrides(const Config &config);

} // namespace liteagent::config
