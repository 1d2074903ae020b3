#pragma once

#include "types/ServerConfig.hpp"

#include <filesystem>
#include <optional>
#include <toml++/toml.hpp>

namespace ferry::config {

constexpr static auto DEFAULT_CONFIG_NAME = "config.toml";

// nullopt when the file does not exist; throws ConfigError(ConfigFileUnreadable)
// when it exists but cannot be read or parsed.
std::optional<toml::table> loadConfigFile(const std::filesystem::path& path);

// Writes a commented TOML document describing `config`. The shared directory is
// a command-line concern and is not written.
void writeConfigFile(const std::filesystem::path& path, const types::ServerConfig& config);

}
