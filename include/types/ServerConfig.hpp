#pragma once

#include "types/User.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json_fwd.hpp>

namespace ferry::types {

constexpr static uint16_t DEFAULT_PORT = 2121;
constexpr static auto DEFAULT_LISTEN_ADDRESS = "0.0.0.0";
constexpr static unsigned int DEFAULT_MAX_CONNECTIONS = 256;
constexpr static unsigned int DEFAULT_MAX_CONNECTIONS_PER_IP = 10;
constexpr static auto DEFAULT_LANGUAGE = "zh_CN";
constexpr static auto DEFAULT_LOG_LEVEL = "info";

struct PassivePortRange {
    uint16_t start{}, end{};

    bool operator==(const PassivePortRange& other) const = default;
};

struct LoggingConfig {
    std::string level = DEFAULT_LOG_LEVEL;
    std::optional<std::filesystem::path> dir{std::nullopt};
};

struct ServerConfig {
    uint16_t port = DEFAULT_PORT;
    std::string listen_address = DEFAULT_LISTEN_ADDRESS;
    unsigned int max_connections = DEFAULT_MAX_CONNECTIONS;
    unsigned int max_connections_per_ip = DEFAULT_MAX_CONNECTIONS_PER_IP;
    std::optional<PassivePortRange> passive_ports{std::nullopt};
    std::optional<std::string> banner{std::nullopt};
    std::string language = DEFAULT_LANGUAGE;
    std::filesystem::path shared_directory{};
    std::vector<UserRecord> users{};

    LoggingConfig logging; // ambient, not part of the served surface

    // A server with zero users binds fine but can authenticate nobody.
    [[nodiscard]] bool isRunnable() const { return !users.empty(); }
};

void to_json(nlohmann::json& j, const PassivePortRange& r);
void to_json(nlohmann::json& j, const LoggingConfig& c);
void to_json(nlohmann::json& j, const ServerConfig& c);

}
