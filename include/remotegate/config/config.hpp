#pragma once

#include "remotegate/common/result.hpp"
#include "remotegate/config/schema.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace remotegate::config {

[[nodiscard]] common::Result<std::filesystem::path> config_dir();
[[nodiscard]] common::Result<std::filesystem::path> config_path();
[[nodiscard]] bool config_exists();
void set_config_path_override(std::optional<std::filesystem::path> path);
void clear_config_path_override();

/// Parses TOML text into a Config, starting from defaults.
[[nodiscard]] common::Result<Config> parse_config(const std::string &toml_text);

/// Reads the config file (if any) and applies environment overrides.
[[nodiscard]] common::Result<Config> load_config();

void apply_env_overrides(Config &config);

/// Fails on settings the server cannot run with; returns warnings otherwise.
[[nodiscard]] common::Result<std::vector<std::string>> validate_config(const Config &config);

/// URL the gate client uses to reach the control-plane.
[[nodiscard]] std::string local_server_url(const Config &config);

/// URL placed in notification links; the remote URL when one is configured.
[[nodiscard]] std::string public_base_url(const Config &config);

[[nodiscard]] bool is_loopback_host(const std::string &host);

} // namespace remotegate::config
