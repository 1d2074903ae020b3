#include "types/ServerConfig.hpp"

#include <nlohmann/json.hpp>

namespace ferry::types {

void to_json(nlohmann::json& j, const PassivePortRange& r) {
    j = nlohmann::json::array({r.start, r.end});
}

void to_json(nlohmann::json& j, const LoggingConfig& c) {
    j = {
        {"log_level", c.level},
        {"log_dir", c.dir ? nlohmann::json(c.dir->string()) : nlohmann::json(nullptr)}
    };
}

void to_json(nlohmann::json& j, const ServerConfig& c) {
    j = {
        {"port", c.port},
        {"listen", c.listen_address},
        {"max_cons", c.max_connections},
        {"max_cons_per_ip", c.max_connections_per_ip},
        {"passive_ports", c.passive_ports ? nlohmann::json(*c.passive_ports) : nlohmann::json(nullptr)},
        {"banner", c.banner ? nlohmann::json(*c.banner) : nlohmann::json(nullptr)},
        {"language", c.language},
        {"shared_dir", c.shared_directory.string()},
        {"users", c.users},
        {"logging", c.logging}
    };
}

}
