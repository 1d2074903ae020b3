#pragma once

#include "types/User.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace ferry::types { struct ServerConfig; }

namespace ferry::auth {

// Validated, immutable set of users for one configuration generation.
class UserRegistry {
public:
    UserRegistry() = default;

    // Validates every entry (throws config::ConfigError on the first bad one).
    static UserRegistry build(const std::vector<types::UserEntry>& entries);

    // Indexes users that were already validated into a ServerConfig.
    static UserRegistry fromConfig(const types::ServerConfig& config);

    [[nodiscard]] std::optional<types::UserRecord> authenticate(const std::string& username,
                                                                const std::string& password) const;

    [[nodiscard]] std::optional<types::UserRecord> find(const std::string& username) const;

    [[nodiscard]] const std::vector<types::UserRecord>& users() const { return users_; }
    [[nodiscard]] std::size_t size() const { return users_.size(); }
    [[nodiscard]] bool empty() const { return users_.empty(); }

private:
    explicit UserRegistry(std::vector<types::UserRecord> users);

    std::vector<types::UserRecord> users_;
    std::unordered_map<std::string, std::size_t> index_;
};

std::filesystem::path resolveHome(const types::UserRecord& user, const std::filesystem::path& sharedDirectory);

}
