#pragma once

#include "hwcc/common/result.hpp"
#include "hwcc/config/schema.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace hwcc::config {

[[nodiscard]] common::Result<std::filesystem::path> config_path();
void set_config_path_override(std::optional<std::filesystem::path> path);
void clear_config_path_override();

[[nodiscard]] common::Result<Config> load_config();
[[nodiscard]] common::Result<Config> load_config_from(const std::filesystem::path &path);
[[nodiscard]] common::Result<Config> parse_config(const std::string &content);

// Hard errors fail the result; soft problems come back as warnings.
[[nodiscard]] common::Result<std::vector<std::string>> validate_config(const Config &config);

void apply_env_overrides(Config &config);

} // namespace hwcc::config
