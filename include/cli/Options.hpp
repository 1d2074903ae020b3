#pragma once

#include "config/Resolver.hpp"

#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace ferry::cli {

struct Options {
    std::filesystem::path config_path;
    std::optional<std::filesystem::path> shared_dir{std::nullopt};
    std::optional<std::string> port{std::nullopt}; // raw, validated by toOverrides()
    std::optional<std::string> language{std::nullopt};
    bool dump_config{false};
    bool help{false};

    // Throws ConfigError(PortOutOfRange) when --port is not an integer.
    [[nodiscard]] config::Overrides toOverrides() const;
};

class UsageError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Split --key=value into two tokens; -Xvalue is split when the tail looks like a value.
std::vector<std::string> normalize_args(int argc, char** argv);

// Throws UsageError on unknown flags or missing values.
Options parse(int argc, char** argv);

std::string usage(const std::string& program);

}
