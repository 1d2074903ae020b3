#include "config/Resolver.hpp"
#include "config/ConfigError.hpp"
#include "config/Language.hpp"
#include "auth/UserRegistry.hpp"
#include "util/fsPath.hpp"

#include <boost/algorithm/string/trim.hpp>
#include <fmt/format.h>
#include <array>
#include <sstream>
#include <limits>
#include <string_view>

using namespace ferry::types;

namespace ferry::config {

namespace {

using View = toml::node_view<const toml::node>;

constexpr long long MIN_PORT = 1;
constexpr long long MAX_PORT = 65535;

constexpr std::array<std::string_view, 7> LOG_LEVELS = {"trace", "debug", "info", "warn", "error", "critical", "off"};

std::string describe(const View node) {
    if (const auto* str = node.as_string()) return str->get();
    std::ostringstream out;
    out << node;
    return out.str();
}

// Only TOML integers qualify; strings, floats and booleans never coerce.
std::optional<long long> asInteger(const View node) {
    if (const auto* value = node.as_integer()) return static_cast<long long>(value->get());
    return std::nullopt;
}

std::string asString(const View node, const std::string& field) {
    const auto* value = node.as_string();
    if (!value) throw ConfigError::invalidFieldType(field, "a string");
    return value->get();
}

uint16_t validatePort(const long long port) {
    if (port < MIN_PORT || port > MAX_PORT) throw ConfigError::portOutOfRange(std::to_string(port));
    return static_cast<uint16_t>(port);
}

uint16_t parsePort(const View node) {
    const auto port = asInteger(node);
    if (!port) throw ConfigError::portOutOfRange(describe(node));
    return validatePort(*port);
}

unsigned int parseConnectionLimit(const View node, const std::string& field) {
    const auto limit = asInteger(node);
    if (!limit || *limit <= 0 || *limit > std::numeric_limits<unsigned int>::max())
        throw ConfigError::invalidConnectionLimit(field, describe(node));
    return static_cast<unsigned int>(*limit);
}

PassivePortRange parsePassivePorts(const View node) {
    const auto* range = node.as_array();
    if (!range || range->size() != 2) throw ConfigError::invalidPassivePortRange(describe(node));

    const auto start = asInteger(View{range->get(0)});
    const auto end = asInteger(View{range->get(1)});
    if (!start || !end) throw ConfigError::invalidPassivePortRange(describe(node));

    if (*start < MIN_PORT || *end > MAX_PORT || *start > *end)
        throw ConfigError::invalidPassivePortRange(fmt::format("[{}, {}]", *start, *end));

    return {static_cast<uint16_t>(*start), static_cast<uint16_t>(*end)};
}

std::string parseLogLevel(const View node) {
    const auto level = boost::algorithm::trim_copy(asString(node, "log_level"));
    for (const auto known : LOG_LEVELS)
        if (level == known) return level;
    throw ConfigError::invalidLogLevel(level);
}

std::optional<std::string> optionalString(const toml::table& entry, const std::string& key, const std::string& field) {
    const auto node = entry[key];
    if (!node) return std::nullopt;
    return asString(node, field + "." + key);
}

std::vector<UserEntry> parseUserEntries(const View node) {
    const auto* users = node.as_array();
    if (!users) throw ConfigError::invalidFieldType("users", "an array of [[users]] tables");

    std::vector<UserEntry> entries;
    entries.reserve(users->size());

    for (std::size_t i = 0; i < users->size(); ++i) {
        const auto field = fmt::format("users[{}]", i);
        const auto* item = users->get(i)->as_table();
        if (!item) throw ConfigError::invalidFieldType(field, "a table");

        entries.push_back({
            .username = optionalString(*item, "username", field),
            .password = optionalString(*item, "password", field),
            .perm = optionalString(*item, "perm", field),
            .home = optionalString(*item, "home", field),
        });
    }

    return entries;
}

}

UserRecord defaultUser() {
    return {.username = DEFAULT_USERNAME, .password = DEFAULT_PASSWORD, .permissions = PermissionSet::full()};
}

Resolution resolve(const std::optional<toml::table>& fileConfig, const Overrides& overrides) {
    ServerConfig cfg;
    bool usersFromFile = false;

    if (fileConfig) {
        const auto& root = *fileConfig;

        if (const auto node = root["port"]) cfg.port = parsePort(node);

        if (const auto node = root["listen"]) {
            const auto* listen = node.as_string();
            if (!listen) throw ConfigError::invalidListenAddress(describe(node));
            cfg.listen_address = boost::algorithm::trim_copy(listen->get());
            if (cfg.listen_address.empty()) throw ConfigError::invalidListenAddress(listen->get());
        }

        if (const auto node = root["max_cons"])
            cfg.max_connections = parseConnectionLimit(node, "max_cons");

        if (const auto node = root["max_cons_per_ip"])
            cfg.max_connections_per_ip = parseConnectionLimit(node, "max_cons_per_ip");

        if (const auto node = root["passive_ports"]) cfg.passive_ports = parsePassivePorts(node);

        if (const auto node = root["banner"]) {
            if (auto banner = boost::algorithm::trim_copy(asString(node, "banner")); !banner.empty())
                cfg.banner = std::move(banner);
        }

        if (const auto node = root["language"])
            cfg.language = normalizeLanguage(asString(node, "language"));

        if (const auto node = root["log_level"]) cfg.logging.level = parseLogLevel(node);

        if (const auto node = root["log_dir"])
            cfg.logging.dir = util::resolveUserPath(asString(node, "log_dir"));

        if (const auto node = root["users"]) {
            cfg.users = auth::UserRegistry::build(parseUserEntries(node)).users();
            usersFromFile = true;
        }
    }

    if (overrides.port) cfg.port = validatePort(*overrides.port);
    if (overrides.language) cfg.language = normalizeLanguage(*overrides.language);

    cfg.shared_directory = overrides.shared_dir
        ? util::resolveUserPath(overrides.shared_dir->string())
        : util::resolveUserPath(DEFAULT_SHARED_DIR);

    if (!usersFromFile) cfg.users.push_back(defaultUser());

    return {std::make_shared<const ServerConfig>(std::move(cfg)), !usersFromFile};
}

}
