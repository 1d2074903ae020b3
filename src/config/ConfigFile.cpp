#include "config/ConfigFile.hpp"
#include "config/ConfigError.hpp"
#include "config/config_toml.hpp"

#include <fmt/format.h>
#include <fstream>
#include <stdexcept>
#include <system_error>

namespace ferry::config {

namespace fs = std::filesystem;

std::optional<toml::table> loadConfigFile(const fs::path& path) {
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        if (ec) throw ConfigError::unreadable(path.string(), ec.message());
        return std::nullopt;
    }

    if (fs::is_directory(path, ec)) throw ConfigError::unreadable(path.string(), "path is a directory");

    try {
        return toml::parse_file(path.string());
    } catch (const toml::parse_error& e) {
        const auto& where = e.source().begin;
        throw ConfigError::unreadable(path.string(),
                                      fmt::format("{} (line {}, column {})", e.description(), where.line, where.column));
    }
}

void writeConfigFile(const fs::path& path, const types::ServerConfig& config) {
    toml::table root{
        {"port", static_cast<int64_t>(config.port)},
        {"listen", config.listen_address},
        {"max_cons", static_cast<int64_t>(config.max_connections)},
        {"max_cons_per_ip", static_cast<int64_t>(config.max_connections_per_ip)},
        {"language", config.language},
        {"log_level", config.logging.level},
    };

    if (config.passive_ports) root.insert("passive_ports", to_toml(*config.passive_ports));
    if (config.banner) root.insert("banner", *config.banner);
    if (config.logging.dir) root.insert("log_dir", config.logging.dir->string());

    toml::array users;
    for (const auto& user : config.users) users.push_back(to_toml(user));
    root.insert("users", std::move(users));

    if (path.has_parent_path()) fs::create_directories(path.parent_path());

    std::ofstream file(path);
    if (!file.is_open()) throw std::runtime_error("Failed to write config file: " + path.string());

    file << "# ferry FTP server configuration\n"
         << "#\n"
         << "# Passive mode port range (optional): passive_ports = [50000, 50100]\n"
         << "# Welcome banner (optional): banner = \"Welcome\"\n"
         << "#\n"
         << "# [[users]] perm letters: e enter dir, l list, r read, a append, d delete,\n"
         << "# f rename, m make dir, w write. home is optional (defaults to the shared directory).\n"
         << "\n"
         << root << '\n';

    if (!file) throw std::runtime_error("Failed to write config file: " + path.string());
}

}
