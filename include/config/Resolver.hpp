#pragma once

#include "types/ServerConfig.hpp"

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <toml++/toml.hpp>

namespace ferry::config {

constexpr static auto DEFAULT_SHARED_DIR = "shared";
constexpr static auto DEFAULT_USERNAME = "user";
constexpr static auto DEFAULT_PASSWORD = "123456";

struct Overrides {
    std::optional<long long> port{std::nullopt};
    std::optional<std::filesystem::path> shared_dir{std::nullopt};
    std::optional<std::string> language{std::nullopt};
};

struct Resolution {
    std::shared_ptr<const types::ServerConfig> config;
    bool needs_persist{false}; // caller should write a default config file
};

// Validates the raw file table (if any), applies overrides over file values over
// built-in defaults, and produces an immutable snapshot. All-or-nothing: throws
// ConfigError on the first violation. Pure apart from reading the working
// directory and $HOME to absolutize paths.
Resolution resolve(const std::optional<toml::table>& fileConfig, const Overrides& overrides = {});

types::UserRecord defaultUser();

}
